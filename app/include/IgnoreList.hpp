#ifndef IGNORE_LIST_HPP
#define IGNORE_LIST_HPP

#include <set>
#include <string>
#include <vector>

/**
 * @brief Identities whose duplicates and conflicts the user accepted, persisted to ignore.json.
 */
class IgnoreList {
public:
    explicit IgnoreList(std::string config_dir);

    bool load();
    bool save() const;

    // Return true when the set changed.
    bool add(const std::string& identity);
    bool remove(const std::string& identity);

    bool contains(const std::string& identity) const { return identities_.contains(identity); }
    const std::set<std::string>& identities() const { return identities_; }
    bool empty() const { return identities_.empty(); }

    const std::string& file_path() const { return file_path_; }

private:
    std::string file_path_;
    std::set<std::string> identities_;
};

#endif

#ifndef EDIT_SESSION_STORE_HPP
#define EDIT_SESSION_STORE_HPP

#include "Types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

struct EditRecord {
    std::optional<int> year;
    std::string folder;
    MediaCategory category{MediaCategory::Normal};

    bool operator==(const EditRecord& other) const = default;
};

/**
 * @brief Unapplied user decisions keyed by identity, persisted to edits.json.
 *
 * The whole document is rewritten on every save().
 */
class EditSessionStore {
public:
    explicit EditSessionStore(std::string config_dir);

    bool load();
    bool save() const;

    std::optional<EditRecord> get(const std::string& identity) const;
    void set(const std::string& identity, EditRecord record);
    bool remove(const std::string& identity);
    bool contains(const std::string& identity) const;
    std::vector<std::string> list_identities() const;
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const std::string& file_path() const { return file_path_; }

private:
    std::string file_path_;
    std::map<std::string, EditRecord> entries_;
};

#endif

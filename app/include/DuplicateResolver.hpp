#ifndef DUPLICATE_RESOLVER_HPP
#define DUPLICATE_RESOLVER_HPP

#include "Types.hpp"

#include <set>
#include <string>
#include <vector>

struct FolderRef {
    int year{0};
    std::string name;
    std::string path;

    std::string label() const { return std::to_string(year) + "/" + name; }
};

/**
 * @brief One identity stored in two or more organized folders.
 */
struct ConflictRecord {
    std::string identity;
    std::vector<FolderRef> folders;
    bool ignored{false};
};

/**
 * @brief A copy in an auto-category folder that also exists in an organized folder.
 */
struct RedundantCopy {
    std::string identity;
    std::string path;
    FolderRef auto_folder;
    FolderRef kept_in;
};

struct DuplicateReport {
    std::vector<std::string> duplicates;    ///< Pending identities routed to !duplicate.
    std::vector<std::string> auto_delete;   ///< Pending screenshot duplicates sent to the trash.
    std::vector<std::string> ignored;       ///< Pending duplicates suppressed by the ignore list.
    std::vector<ConflictRecord> conflicts;  ///< Every conflict, ignored ones flagged.
    std::vector<RedundantCopy> redundant_copies;

    std::vector<ConflictRecord> reported_conflicts(bool include_ignored = false) const;
};

/**
 * @brief Detects duplicates (pending vs. organized) and conflicts (organized vs. organized).
 *
 * Works by file name only; two different photos sharing a name are treated as duplicates.
 * Output order follows identity and folder order, so equal inputs yield equal reports.
 */
class DuplicateResolver {
public:
    DuplicateReport resolve(std::vector<FileEntry>& pending,
                            const std::vector<OrganizedFolder>& folders,
                            const std::set<std::string>& ignored) const;
};

#endif

#include "DuplicateResolver.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <map>

namespace {

FolderRef make_ref(const OrganizedFolder& folder)
{
    return FolderRef{folder.year, folder.name, folder.path};
}

bool folder_less(const OrganizedFolder* lhs, const OrganizedFolder* rhs)
{
    if (lhs->year != rhs->year) {
        return lhs->year < rhs->year;
    }
    return lhs->name < rhs->name;
}

struct IdentityLocations {
    std::vector<const OrganizedFolder*> organized;
    std::vector<const OrganizedFolder*> auto_category;
};

std::map<std::string, IdentityLocations> build_index(const std::vector<OrganizedFolder>& folders)
{
    std::map<std::string, IdentityLocations> index;
    for (const auto& folder : folders) {
        for (const auto& identity : folder.members) {
            auto& locations = index[identity];
            if (folder.auto_category) {
                locations.auto_category.push_back(&folder);
            } else {
                locations.organized.push_back(&folder);
            }
        }
    }
    for (auto& item : index) {
        auto& locations = item.second;
        std::sort(locations.organized.begin(), locations.organized.end(), folder_less);
        std::sort(locations.auto_category.begin(), locations.auto_category.end(), folder_less);
    }
    return index;
}

} // namespace


std::vector<ConflictRecord> DuplicateReport::reported_conflicts(bool include_ignored) const
{
    std::vector<ConflictRecord> result;
    for (const auto& conflict : conflicts) {
        if (include_ignored || !conflict.ignored) {
            result.push_back(conflict);
        }
    }
    return result;
}


DuplicateReport DuplicateResolver::resolve(std::vector<FileEntry>& pending,
                                           const std::vector<OrganizedFolder>& folders,
                                           const std::set<std::string>& ignored) const
{
    auto logger = Logger::get_logger("core_logger");
    DuplicateReport report;
    const auto index = build_index(folders);

    for (auto& entry : pending) {
        entry.duplicate_of.clear();
        entry.trash_eligible = false;
        entry.state = derive_state(entry);

        const auto it = index.find(entry.identity);
        if (it == index.end()) {
            continue;
        }
        const auto& locations = it->second;
        const OrganizedFolder* first = !locations.organized.empty()
            ? locations.organized.front()
            : locations.auto_category.front();
        entry.duplicate_of = first->label();

        if (ignored.contains(entry.identity)) {
            entry.state = EntryState::Ignored;
            report.ignored.push_back(entry.identity);
            continue;
        }

        entry.state = EntryState::Duplicate;
        if (entry.category == MediaCategory::Screenshot) {
            entry.trash_eligible = true;
            report.auto_delete.push_back(entry.identity);
        } else {
            report.duplicates.push_back(entry.identity);
        }
        if (logger) {
            logger->debug("Duplicate '{}' already stored in {}", entry.identity, entry.duplicate_of);
        }
    }

    for (const auto& [identity, locations] : index) {
        const bool is_ignored = ignored.contains(identity);

        if (locations.organized.size() >= 2) {
            ConflictRecord conflict;
            conflict.identity = identity;
            conflict.ignored = is_ignored;
            for (const auto* folder : locations.organized) {
                conflict.folders.push_back(make_ref(*folder));
            }
            report.conflicts.push_back(std::move(conflict));
        }

        if (!is_ignored && !locations.organized.empty()) {
            for (const auto* auto_folder : locations.auto_category) {
                report.redundant_copies.push_back(RedundantCopy{
                    identity,
                    Utils::path_to_utf8(Utils::utf8_to_path(auto_folder->path) / Utils::utf8_to_path(identity)),
                    make_ref(*auto_folder),
                    make_ref(*locations.organized.front())
                });
            }
        }
    }

    std::sort(report.duplicates.begin(), report.duplicates.end());
    std::sort(report.auto_delete.begin(), report.auto_delete.end());
    std::sort(report.ignored.begin(), report.ignored.end());

    if (logger) {
        logger->info("Duplicate check: {} duplicate(s), {} screenshot duplicate(s), {} conflict(s), {} redundant copy(ies)",
                     report.duplicates.size(), report.auto_delete.size(),
                     report.reported_conflicts().size(), report.redundant_copies.size());
    }
    return report;
}

#include "PlacementPlanner.hpp"
#include "PathClassifier.hpp"
#include "Utils.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;


PlacementPlanner::PlacementPlanner(std::string root, PathProbe probe, int max_attempts)
    : root(std::move(root)),
      probe(std::move(probe)),
      max_attempts(max_attempts > 0 ? max_attempts : kDefaultMaxAttempts)
{
    if (!this->probe) {
        this->probe = [](const fs::path& path) {
            std::error_code ec;
            return fs::exists(path, ec);
        };
    }
}


PlanResult PlacementPlanner::plan(const FileEntry& entry)
{
    return plan(entry, entry.assigned_folder, entry.year);
}


PlanResult PlacementPlanner::plan(const FileEntry& entry,
                                  const std::string& assigned_folder,
                                  std::optional<int> year)
{
    PlannedMove move;
    move.identity = entry.identity;
    move.source_path = entry.source_path;
    move.kind = entry.kind;

    if (entry.state == EntryState::Duplicate && entry.trash_eligible) {
        move.action = PlanAction::Trash;
        return PlanResult{PlanStatus::Ready, std::move(move)};
    }

    fs::path desired;
    if (entry.state == EntryState::Duplicate) {
        move.action = PlanAction::RouteDuplicate;
        desired = Utils::utf8_to_path(root) / PathRules::kDuplicateFolder / Utils::utf8_to_path(entry.identity);
    } else {
        if (!year) {
            return PlanResult{PlanStatus::NeedsYear, std::nullopt};
        }
        const auto folder = target_folder(entry, assigned_folder, year);
        if (!folder) {
            return PlanResult{PlanStatus::NeedsFolder, std::nullopt};
        }
        move.action = PlanAction::Move;
        desired = Utils::utf8_to_path(root) / Utils::utf8_to_path(*folder) / Utils::utf8_to_path(entry.identity);
    }

    const auto resolved = resolve_collision(desired);
    if (!resolved) {
        return PlanResult{PlanStatus::CollisionExhausted, std::nullopt};
    }

    move.renamed = *resolved != desired;
    move.target_path = Utils::path_to_utf8(*resolved);
    move.relative_target = Utils::relative_display_path(move.target_path, root);
    claimed.insert(move.target_path);
    return PlanResult{PlanStatus::Ready, std::move(move)};
}


std::optional<std::string> PlacementPlanner::target_folder(const FileEntry& entry,
                                                           const std::string& assigned_folder,
                                                           std::optional<int> year)
{
    if (!year) {
        return std::nullopt;
    }
    const std::string year_segment = std::to_string(*year);
    if (!assigned_folder.empty()) {
        return year_segment + "/" + assigned_folder;
    }
    const std::string auto_folder = PathRules::auto_category_folder(entry.category, *year);
    if (!auto_folder.empty()) {
        return year_segment + "/" + auto_folder;
    }
    return std::nullopt;
}


std::optional<fs::path> PlacementPlanner::resolve_collision(const fs::path& desired) const
{
    if (!is_occupied(desired)) {
        return desired;
    }

    const fs::path parent = desired.parent_path();
    const std::string stem = Utils::path_to_utf8(desired.stem());
    const std::string extension = Utils::path_to_utf8(desired.extension());
    for (int counter = 1; counter <= max_attempts; ++counter) {
        const fs::path candidate = parent / Utils::utf8_to_path(stem + "_" + std::to_string(counter) + extension);
        if (!is_occupied(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}


void PlacementPlanner::release_claims()
{
    claimed.clear();
}


bool PlacementPlanner::is_occupied(const fs::path& candidate) const
{
    return claimed.contains(Utils::path_to_utf8(candidate)) || probe(candidate);
}

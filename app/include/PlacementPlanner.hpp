#ifndef PLACEMENT_PLANNER_HPP
#define PLACEMENT_PLANNER_HPP

#include "Types.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class PlanAction {
    Move,            ///< YEAR/FOLDER/name
    RouteDuplicate,  ///< !duplicate/name
    Trash            ///< Screenshot duplicate, recoverable delete
};

enum class PlanStatus {Ready, NeedsYear, NeedsFolder, CollisionExhausted};

struct PlannedMove {
    std::string identity;
    std::string source_path;
    std::string target_path;      ///< Empty for PlanAction::Trash.
    std::string relative_target;  ///< "2024/Trip/IMG_1.jpg" for previews.
    PlanAction action{PlanAction::Move};
    bool renamed{false};
    MediaKind kind{MediaKind::Other};
};

struct PlanResult {
    PlanStatus status{PlanStatus::Ready};
    std::optional<PlannedMove> move;
};

inline std::string to_string(PlanStatus status) {
    switch (status) {
        case PlanStatus::Ready: return "ready";
        case PlanStatus::NeedsYear: return "needs-year";
        case PlanStatus::NeedsFolder: return "needs-folder";
        case PlanStatus::CollisionExhausted: return "collision-exhausted";
    }
    return "ready";
}

/**
 * @brief Computes target paths for pending entries without modifying the disk.
 *
 * Targets already handed out during the lifetime of the planner are treated as
 * occupied, so a batch never maps two entries to the same destination.
 */
class PlacementPlanner {
public:
    using PathProbe = std::function<bool(const std::filesystem::path&)>;

    static constexpr int kDefaultMaxAttempts = 9999;

    // An empty probe checks the real file system with std::filesystem::exists.
    explicit PlacementPlanner(std::string root,
                              PathProbe probe = {},
                              int max_attempts = kDefaultMaxAttempts);

    PlanResult plan(const FileEntry& entry);
    PlanResult plan(const FileEntry& entry,
                    const std::string& assigned_folder,
                    std::optional<int> year);

    // Folder below the root the entry would land in ("2024/Trip"), or nullopt.
    static std::optional<std::string> target_folder(const FileEntry& entry,
                                                    const std::string& assigned_folder,
                                                    std::optional<int> year);

    // First free "<stem>_<n><ext>" sibling of `desired` (desired itself when free).
    std::optional<std::filesystem::path> resolve_collision(const std::filesystem::path& desired) const;

    void release_claims();

private:
    bool is_occupied(const std::filesystem::path& candidate) const;

    std::string root;
    PathProbe probe;
    int max_attempts;
    std::set<std::string> claimed;
};

#endif

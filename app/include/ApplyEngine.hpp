#ifndef APPLY_ENGINE_HPP
#define APPLY_ENGINE_HPP

#include "ErrorCode.hpp"
#include "PlacementPlanner.hpp"

#include <memory>
#include <string>
#include <vector>

namespace spdlog { class logger; }

class EditSessionStore;
class ITrash;
class VideoFrameCache;

enum class ApplyOutcome {Succeeded, Skipped, Failed};

inline std::string to_string(ApplyOutcome outcome) {
    switch (outcome) {
        case ApplyOutcome::Succeeded: return "succeeded";
        case ApplyOutcome::Skipped: return "skipped";
        case ApplyOutcome::Failed: return "failed";
    }
    return "failed";
}

struct ApplyResult {
    std::string identity;
    ApplyOutcome outcome{ApplyOutcome::Failed};
    PlanAction action{PlanAction::Move};
    std::string final_path;   ///< Where the file ended up; empty unless it was moved.
    std::string reason;
    ErrorCodes::Code code{ErrorCodes::Code::SUCCESS};
    bool renamed{false};      ///< A numeric suffix was added to avoid an existing file.
};

struct ApplySummary {
    std::vector<ApplyResult> results;

    std::size_t succeeded() const;
    std::size_t skipped() const;
    std::size_t failed() const;
    bool all_succeeded() const { return failed() == 0; }

    // "4 succeeded, 0 skipped, 1 failed"
    std::string to_string() const;
    void append(const ApplySummary& other);
};

/**
 * @brief Executes planned moves and trash requests one at a time.
 *
 * A failing entry never stops the batch. Each plan is re-checked against the disk
 * right before it runs: a vanished source is skipped, an occupied destination gets
 * a fresh suffixed name. Edits of successfully applied entries are dropped from the
 * store, which is saved once when the batch ends.
 */
class ApplyEngine {
public:
    ApplyEngine(std::string root,
                ITrash& trash,
                EditSessionStore* edits,
                const VideoFrameCache* frames,
                std::shared_ptr<spdlog::logger> logger,
                int max_attempts = PlacementPlanner::kDefaultMaxAttempts);

    ApplySummary apply(const std::vector<PlannedMove>& moves);

private:
    ApplyResult apply_one(const PlannedMove& move);
    ApplyResult move_to_trash(const PlannedMove& move);
    ApplyResult relocate(const PlannedMove& move);
    void on_success(const PlannedMove& move, bool& edits_changed);

    std::string root;
    ITrash& trash;
    EditSessionStore* edits;
    const VideoFrameCache* frames;
    std::shared_ptr<spdlog::logger> logger;
    int max_attempts;
};

#endif

#include "ApplyEngine.hpp"
#include "AppException.hpp"
#include "EditSessionStore.hpp"
#include "MovableMediaFile.hpp"
#include "Trash.hpp"
#include "Utils.hpp"
#include "VideoFrameCache.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

std::size_t count_outcome(const std::vector<ApplyResult>& results, ApplyOutcome outcome)
{
    return static_cast<std::size_t>(std::count_if(results.begin(), results.end(),
        [outcome](const ApplyResult& result) { return result.outcome == outcome; }));
}

ApplyResult make_result(const PlannedMove& move, ApplyOutcome outcome)
{
    ApplyResult result;
    result.identity = move.identity;
    result.action = move.action;
    result.outcome = outcome;
    return result;
}

ApplyResult failed(const PlannedMove& move, ErrorCodes::Code code, std::string reason)
{
    ApplyResult result = make_result(move, ApplyOutcome::Failed);
    result.code = code;
    result.reason = std::move(reason);
    return result;
}

} // namespace


std::size_t ApplySummary::succeeded() const
{
    return count_outcome(results, ApplyOutcome::Succeeded);
}

std::size_t ApplySummary::skipped() const
{
    return count_outcome(results, ApplyOutcome::Skipped);
}

std::size_t ApplySummary::failed() const
{
    return count_outcome(results, ApplyOutcome::Failed);
}

std::string ApplySummary::to_string() const
{
    return fmt::format("{} succeeded, {} skipped, {} failed", succeeded(), skipped(), failed());
}

void ApplySummary::append(const ApplySummary& other)
{
    results.insert(results.end(), other.results.begin(), other.results.end());
}


ApplyEngine::ApplyEngine(std::string root,
                         ITrash& trash,
                         EditSessionStore* edits,
                         const VideoFrameCache* frames,
                         std::shared_ptr<spdlog::logger> logger,
                         int max_attempts)
    : root(std::move(root)),
      trash(trash),
      edits(edits),
      frames(frames),
      logger(std::move(logger)),
      max_attempts(max_attempts > 0 ? max_attempts : PlacementPlanner::kDefaultMaxAttempts)
{
}


ApplySummary ApplyEngine::apply(const std::vector<PlannedMove>& moves)
{
    ApplySummary summary;
    summary.results.reserve(moves.size());
    bool edits_changed = false;

    for (const auto& move : moves) {
        ApplyResult result = apply_one(move);
        if (result.outcome == ApplyOutcome::Succeeded) {
            on_success(move, edits_changed);
        }
        summary.results.push_back(std::move(result));
    }

    if (edits && edits_changed && !edits->save()) {
        if (logger) {
            logger->error("Applied entries could not be removed from '{}'", edits->file_path());
        }
    }

    if (logger) {
        logger->info("Apply finished: {}", summary.to_string());
    }
    return summary;
}


ApplyResult ApplyEngine::apply_one(const PlannedMove& move)
{
    std::error_code ec;
    if (!fs::exists(Utils::utf8_to_path(move.source_path), ec)) {
        ApplyResult result = make_result(move, ApplyOutcome::Skipped);
        result.code = ErrorCodes::Code::FILE_NOT_FOUND;
        result.reason = "source file no longer exists";
        if (logger) {
            logger->warn("Skipping '{}': source '{}' no longer exists", move.identity, move.source_path);
        }
        return result;
    }

    if (move.action == PlanAction::Trash) {
        return move_to_trash(move);
    }
    return relocate(move);
}


ApplyResult ApplyEngine::move_to_trash(const PlannedMove& move)
{
    std::string error;
    if (!trash.move_to_trash(move.source_path, &error)) {
        if (logger) {
            logger->error("Could not move '{}' to the trash: {}", move.source_path, error);
        }
        return failed(move, ErrorCodes::Code::ORGANIZE_TRASH_FAILED,
                      error.empty() ? std::string("trash unavailable") : error);
    }
    return make_result(move, ApplyOutcome::Succeeded);
}


ApplyResult ApplyEngine::relocate(const PlannedMove& move)
{
    if (move.target_path.empty()) {
        return failed(move, ErrorCodes::Code::PATH_INVALID, "no target path planned");
    }

    fs::path target = Utils::utf8_to_path(move.target_path);
    bool renamed = move.renamed;

    // The plan may be stale: something could have appeared at the target since planning
    std::error_code ec;
    if (fs::exists(target, ec)) {
        PlacementPlanner planner(root, {}, max_attempts);
        const auto resolved = planner.resolve_collision(target);
        if (!resolved) {
            if (logger) {
                logger->error("No free name left for '{}' in '{}'",
                              move.identity, Utils::path_to_utf8(target.parent_path()));
            }
            return failed(move, ErrorCodes::Code::ORGANIZE_COLLISION_EXHAUSTED,
                          "no free name after " + std::to_string(max_attempts) + " attempts");
        }
        if (logger) {
            logger->info("Target '{}' is taken, using '{}'",
                         move.target_path, Utils::path_to_utf8(*resolved));
        }
        target = *resolved;
        renamed = true;
    }

    try {
        MovableMediaFile file(move.source_path, Utils::path_to_utf8(target));
        file.create_destination_dirs();

        if (!file.move_file(ec)) {
            const auto code = ErrorCodes::ErrorCatalog::from_error_code(
                ec, ErrorCodes::Code::FILE_MOVE_FAILED);
            return failed(move, code, ec ? ec.message() : std::string("move failed"));
        }

        ApplyResult result = make_result(move, ApplyOutcome::Succeeded);
        result.final_path = file.get_destination_path();
        result.renamed = renamed;
        return result;
    } catch (const ErrorCodes::AppException& ex) {
        return failed(move, ex.get_error_code(), ex.what());
    } catch (const fs::filesystem_error& ex) {
        const auto code = ErrorCodes::ErrorCatalog::from_error_code(
            ex.code(), ErrorCodes::Code::FILE_MOVE_FAILED);
        return failed(move, code, ex.what());
    }
}


void ApplyEngine::on_success(const PlannedMove& move, bool& edits_changed)
{
    if (edits && edits->remove(move.identity)) {
        edits_changed = true;
    }
    if (frames && move.kind == MediaKind::Video) {
        frames->purge(move.source_path);
    }
}

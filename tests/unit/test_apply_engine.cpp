#include <catch2/catch_test_macros.hpp>

#include "ApplyEngine.hpp"
#include "EditSessionStore.hpp"
#include "TestHelpers.hpp"
#include "TestHooks.hpp"
#include "VideoFrameCache.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

struct MoveHookGuard {
    ~MoveHookGuard() { TestHooks::reset_move_hook(); }
};

PlannedMove planned(const TempDir& root,
                    const std::string& identity,
                    const std::string& relative_target,
                    PlanAction action = PlanAction::Move)
{
    PlannedMove move;
    move.identity = identity;
    move.source_path = (root.path() / identity).string();
    if (!relative_target.empty()) {
        move.target_path = (root.path() / relative_target).string();
        move.relative_target = relative_target;
    }
    move.action = action;
    move.kind = identity.ends_with(".mp4") ? MediaKind::Video : MediaKind::Image;
    return move;
}

} // namespace

TEST_CASE("one failing move does not stop the rest of the batch") {
    TempDir root;
    TempDir config;
    RecordingTrash trash(config.path() / "bin");
    EditSessionStore edits(config.str());
    MoveHookGuard hook_guard;

    std::vector<PlannedMove> moves;
    for (int i = 1; i <= 5; ++i) {
        const std::string name = "IMG_" + std::to_string(i) + ".jpg";
        write_file(root.path() / name);
        edits.set(name, EditRecord{2024, "Trip", MediaCategory::Normal});
        moves.push_back(planned(root, name, "2024/Trip/" + name));
    }
    REQUIRE(edits.save());

    TestHooks::set_move_hook([](const TestHooks::MoveHookInfo& info) -> std::optional<std::error_code> {
        if (fs::path(info.source).filename() == "IMG_3.jpg") {
            return std::make_error_code(std::errc::permission_denied);
        }
        return std::nullopt;
    });

    ApplyEngine engine(root.str(), trash, &edits, nullptr, nullptr);
    const ApplySummary summary = engine.apply(moves);

    CHECK(summary.succeeded() == 4);
    CHECK(summary.failed() == 1);
    CHECK(summary.skipped() == 0);
    CHECK(summary.to_string() == "4 succeeded, 0 skipped, 1 failed");

    REQUIRE(summary.results.size() == 5);
    CHECK(summary.results[2].outcome == ApplyOutcome::Failed);
    CHECK(summary.results[2].code == ErrorCodes::Code::FILE_PERMISSION_DENIED);
    CHECK_FALSE(summary.results[2].reason.empty());

    CHECK(fs::exists(root.path() / "IMG_3.jpg"));
    for (int i : {1, 2, 4, 5}) {
        CHECK(fs::exists(root.path() / "2024" / "Trip" / ("IMG_" + std::to_string(i) + ".jpg")));
    }

    // Only the failed entry keeps its edit, on disk as well
    EditSessionStore reloaded(config.str());
    REQUIRE(reloaded.load());
    CHECK(reloaded.list_identities() == std::vector<std::string>{"IMG_3.jpg"});
}

TEST_CASE("an occupied destination is never overwritten") {
    TempDir root;
    TempDir config;
    RecordingTrash trash(config.path() / "bin");

    write_file(root.path() / "IMG_1.jpg", "new");
    write_file(root.path() / "2024" / "Trip" / "IMG_1.jpg", "old");

    ApplyEngine engine(root.str(), trash, nullptr, nullptr, nullptr);
    const ApplySummary summary = engine.apply({planned(root, "IMG_1.jpg", "2024/Trip/IMG_1.jpg")});

    REQUIRE(summary.succeeded() == 1);
    CHECK(summary.results[0].renamed);
    CHECK(read_file(root.path() / "2024" / "Trip" / "IMG_1.jpg") == "old");
    CHECK(read_file(root.path() / "2024" / "Trip" / "IMG_1_1.jpg") == "new");
    CHECK(fs::path(summary.results[0].final_path).filename() == "IMG_1_1.jpg");
}

TEST_CASE("a stale plan whose source vanished is skipped and keeps its edit") {
    TempDir root;
    TempDir config;
    RecordingTrash trash(config.path() / "bin");
    EditSessionStore edits(config.str());
    edits.set("IMG_1.jpg", EditRecord{2024, "Trip", MediaCategory::Normal});

    ApplyEngine engine(root.str(), trash, &edits, nullptr, nullptr);
    const ApplySummary summary = engine.apply({planned(root, "IMG_1.jpg", "2024/Trip/IMG_1.jpg")});

    CHECK(summary.skipped() == 1);
    CHECK(summary.results[0].code == ErrorCodes::Code::FILE_NOT_FOUND);
    CHECK(edits.contains("IMG_1.jpg"));
    CHECK_FALSE(fs::exists(root.path() / "2024"));
}

TEST_CASE("collision exhaustion fails only that entry") {
    TempDir root;
    TempDir config;
    RecordingTrash trash(config.path() / "bin");

    write_file(root.path() / "IMG_1.jpg", "new");
    write_file(root.path() / "IMG_2.jpg");
    write_file(root.path() / "2024" / "Trip" / "IMG_1.jpg");
    write_file(root.path() / "2024" / "Trip" / "IMG_1_1.jpg");
    write_file(root.path() / "2024" / "Trip" / "IMG_1_2.jpg");

    ApplyEngine engine(root.str(), trash, nullptr, nullptr, nullptr, 2);
    const ApplySummary summary = engine.apply({
        planned(root, "IMG_1.jpg", "2024/Trip/IMG_1.jpg"),
        planned(root, "IMG_2.jpg", "2024/Trip/IMG_2.jpg"),
    });

    CHECK(summary.results[0].outcome == ApplyOutcome::Failed);
    CHECK(summary.results[0].code == ErrorCodes::Code::ORGANIZE_COLLISION_EXHAUSTED);
    CHECK(summary.results[1].outcome == ApplyOutcome::Succeeded);
    CHECK(read_file(root.path() / "IMG_1.jpg") == "new");
}

TEST_CASE("duplicates are routed and screenshot duplicates go to the trash") {
    TempDir root;
    TempDir config;
    RecordingTrash trash(config.path() / "bin");

    write_file(root.path() / "IMG_1.jpg");
    write_file(root.path() / "Screenshot_1.png");

    ApplyEngine engine(root.str(), trash, nullptr, nullptr, nullptr);
    const ApplySummary summary = engine.apply({
        planned(root, "IMG_1.jpg", "!duplicate/IMG_1.jpg", PlanAction::RouteDuplicate),
        planned(root, "Screenshot_1.png", "", PlanAction::Trash),
    });

    CHECK(summary.succeeded() == 2);
    CHECK(fs::exists(root.path() / "!duplicate" / "IMG_1.jpg"));
    CHECK_FALSE(fs::exists(root.path() / "Screenshot_1.png"));
    REQUIRE(trash.trashed().size() == 1);
    CHECK(fs::path(trash.trashed().front()).filename() == "Screenshot_1.png");
}

TEST_CASE("a trash failure is reported and the file stays") {
    TempDir root;
    TempDir config;
    RecordingTrash trash(config.path() / "bin");
    trash.fail_for("Screenshot_1.png");
    write_file(root.path() / "Screenshot_1.png");

    ApplyEngine engine(root.str(), trash, nullptr, nullptr, nullptr);
    const ApplySummary summary = engine.apply({planned(root, "Screenshot_1.png", "", PlanAction::Trash)});

    CHECK(summary.failed() == 1);
    CHECK(summary.results[0].code == ErrorCodes::Code::ORGANIZE_TRASH_FAILED);
    CHECK(fs::exists(root.path() / "Screenshot_1.png"));
}

TEST_CASE("moving a video clears its cached frames") {
    TempDir root;
    TempDir config;
    RecordingTrash trash(config.path() / "bin");
    VideoFrameCache frames(root.str());

    write_file(root.path() / "VID_1.mp4");
    const PlannedMove move = planned(root, "VID_1.mp4", "2024/Trip/VID_1.mp4");
    for (const auto& frame : frames.frame_paths(move.source_path)) {
        write_file(frame);
    }

    ApplyEngine engine(root.str(), trash, nullptr, &frames, nullptr);
    REQUIRE(engine.apply({move}).succeeded() == 1);
    for (const auto& frame : frames.frame_paths(move.source_path)) {
        CHECK_FALSE(fs::exists(frame));
    }
}

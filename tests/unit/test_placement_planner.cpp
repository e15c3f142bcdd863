#include <catch2/catch_test_macros.hpp>

#include "PlacementPlanner.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace {

FileEntry entry_for(const std::string& identity,
                    std::optional<int> year,
                    const std::string& folder = "",
                    MediaCategory category = MediaCategory::Normal)
{
    FileEntry entry;
    entry.identity = identity;
    entry.source_path = "/camera/" + identity;
    entry.kind = MediaKind::Image;
    entry.year = year;
    entry.assigned_folder = folder;
    entry.category = category;
    entry.state = derive_state(entry);
    return entry;
}

PlacementPlanner::PathProbe probe_for(std::set<std::string> existing)
{
    return [existing = std::move(existing)](const fs::path& path) {
        return existing.contains(path.generic_string());
    };
}

} // namespace

TEST_CASE("target is YEAR/FOLDER/name for assigned files") {
    PlacementPlanner planner("/camera", probe_for({}));
    const auto result = planner.plan(entry_for("IMG_1.jpg", 2024, "Trip"));
    REQUIRE(result.status == PlanStatus::Ready);
    REQUIRE(result.move.has_value());
    CHECK(result.move->action == PlanAction::Move);
    CHECK(fs::path(result.move->target_path).generic_string() == "/camera/2024/Trip/IMG_1.jpg");
    CHECK_FALSE(result.move->renamed);
}

TEST_CASE("explicit folder and year override the entry") {
    PlacementPlanner planner("/camera", probe_for({}));
    const auto result = planner.plan(entry_for("IMG_1.jpg", std::nullopt), "Work", 2021);
    REQUIRE(result.status == PlanStatus::Ready);
    CHECK(fs::path(result.move->target_path).generic_string() == "/camera/2021/Work/IMG_1.jpg");
}

TEST_CASE("auto categories bypass the folder choice") {
    PlacementPlanner planner("/camera", probe_for({}));
    const auto shot = planner.plan(entry_for("Screenshot_1.png", 2024, "", MediaCategory::Screenshot));
    REQUIRE(shot.status == PlanStatus::Ready);
    CHECK(fs::path(shot.move->target_path).generic_string() == "/camera/2024/!Screenshots_2024/Screenshot_1.png");

    const auto rec = planner.plan(entry_for("Screenrecorder-1.mp4", 2023, "", MediaCategory::ScreenRecording));
    REQUIRE(rec.status == PlanStatus::Ready);
    CHECK(fs::path(rec.move->target_path).generic_string() == "/camera/2023/!ScreenRecorder_2023/Screenrecorder-1.mp4");
}

TEST_CASE("missing year or folder blocks planning") {
    PlacementPlanner planner("/camera", probe_for({}));
    CHECK(planner.plan(entry_for("IMG_1.jpg", std::nullopt, "Trip")).status == PlanStatus::NeedsYear);
    CHECK(planner.plan(entry_for("IMG_1.jpg", 2024)).status == PlanStatus::NeedsFolder);
}

TEST_CASE("duplicates route to !duplicate, screenshot duplicates to the trash") {
    PlacementPlanner planner("/camera", probe_for({}));

    FileEntry duplicate = entry_for("IMG_1.jpg", std::nullopt);
    duplicate.state = EntryState::Duplicate;
    const auto routed = planner.plan(duplicate);
    REQUIRE(routed.status == PlanStatus::Ready);
    CHECK(routed.move->action == PlanAction::RouteDuplicate);
    CHECK(fs::path(routed.move->target_path).generic_string() == "/camera/!duplicate/IMG_1.jpg");

    FileEntry screenshot = entry_for("Screenshot_1.png", 2024, "", MediaCategory::Screenshot);
    screenshot.state = EntryState::Duplicate;
    screenshot.trash_eligible = true;
    const auto trashed = planner.plan(screenshot);
    REQUIRE(trashed.status == PlanStatus::Ready);
    CHECK(trashed.move->action == PlanAction::Trash);
    CHECK(trashed.move->target_path.empty());
}

TEST_CASE("existing destinations get a numeric suffix before the extension") {
    PlacementPlanner planner("/camera", probe_for({
        "/camera/2024/Trip/IMG_1.jpg",
        "/camera/2024/Trip/IMG_1_1.jpg",
    }));
    const auto result = planner.plan(entry_for("IMG_1.jpg", 2024, "Trip"));
    REQUIRE(result.status == PlanStatus::Ready);
    CHECK(fs::path(result.move->target_path).generic_string() == "/camera/2024/Trip/IMG_1_2.jpg");
    CHECK(result.move->renamed);
    CHECK(result.move->relative_target == "2024/Trip/IMG_1_2.jpg");
}

TEST_CASE("targets handed out in one batch are never reused") {
    PlacementPlanner planner("/camera", probe_for({}));
    FileEntry first = entry_for("IMG_1.jpg", 2024, "Trip");
    FileEntry second = first;
    second.source_path = "/camera/other/IMG_1.jpg";

    const auto a = planner.plan(first);
    const auto b = planner.plan(second);
    REQUIRE(a.move.has_value());
    REQUIRE(b.move.has_value());
    CHECK(a.move->target_path != b.move->target_path);
    CHECK(b.move->renamed);

    planner.release_claims();
    const auto c = planner.plan(first);
    CHECK(c.move->target_path == a.move->target_path);
}

TEST_CASE("collision resolution gives up after the attempt limit") {
    std::set<std::string> existing{"/camera/2024/Trip/IMG_1.jpg"};
    for (int i = 1; i <= 3; ++i) {
        existing.insert("/camera/2024/Trip/IMG_1_" + std::to_string(i) + ".jpg");
    }
    PlacementPlanner planner("/camera", probe_for(existing), 3);
    const auto result = planner.plan(entry_for("IMG_1.jpg", 2024, "Trip"));
    CHECK(result.status == PlanStatus::CollisionExhausted);
    CHECK_FALSE(result.move.has_value());
}

TEST_CASE("planning does not touch the disk") {
    TempDir root;
    write_file(root.path() / "IMG_1.jpg");
    PlacementPlanner planner(root.str());
    const auto result = planner.plan(entry_for("IMG_1.jpg", 2024, "Trip"));
    REQUIRE(result.status == PlanStatus::Ready);
    CHECK_FALSE(fs::exists(root.path() / "2024"));
    CHECK(fs::exists(root.path() / "IMG_1.jpg"));
}

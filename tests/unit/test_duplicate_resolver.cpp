#include <catch2/catch_test_macros.hpp>

#include "DuplicateResolver.hpp"

#include <set>
#include <string>
#include <vector>

namespace {

FileEntry pending(const std::string& identity,
                  std::optional<int> year = 2024,
                  MediaCategory category = MediaCategory::Normal)
{
    FileEntry entry;
    entry.identity = identity;
    entry.source_path = "/camera/" + identity;
    entry.kind = MediaKind::Image;
    entry.year = year;
    entry.category = category;
    entry.state = derive_state(entry);
    return entry;
}

OrganizedFolder folder(int year, const std::string& name, std::set<std::string> members)
{
    OrganizedFolder result;
    result.year = year;
    result.name = name;
    result.path = "/camera/" + std::to_string(year) + "/" + name;
    result.auto_category = name.starts_with("!Screen");
    result.members = std::move(members);
    return result;
}

} // namespace

TEST_CASE("a pending file already stored in a folder is a duplicate") {
    std::vector<FileEntry> entries{pending("IMG_001.jpg"), pending("IMG_002.jpg")};
    const std::vector<OrganizedFolder> folders{folder(2024, "Trip", {"IMG_001.jpg"})};

    const DuplicateReport report = DuplicateResolver().resolve(entries, folders, {});

    CHECK(entries[0].state == EntryState::Duplicate);
    CHECK(entries[0].duplicate_of == "2024/Trip");
    CHECK_FALSE(entries[0].trash_eligible);
    CHECK(entries[1].state == EntryState::PendingAssignment);
    CHECK(report.duplicates == std::vector<std::string>{"IMG_001.jpg"});
    CHECK(report.auto_delete.empty());
}

TEST_CASE("screenshot duplicates are eligible for the trash") {
    std::vector<FileEntry> entries{pending("Screenshot_1.png", 2024, MediaCategory::Screenshot)};
    const std::vector<OrganizedFolder> folders{folder(2024, "Trip", {"Screenshot_1.png"})};

    const DuplicateReport report = DuplicateResolver().resolve(entries, folders, {});
    CHECK(entries[0].state == EntryState::Duplicate);
    CHECK(entries[0].trash_eligible);
    CHECK(report.auto_delete == std::vector<std::string>{"Screenshot_1.png"});
    CHECK(report.duplicates.empty());
}

TEST_CASE("screen recordings are routed, not trashed") {
    std::vector<FileEntry> entries{pending("Screenrecorder-1.mp4", 2024, MediaCategory::ScreenRecording)};
    const std::vector<OrganizedFolder> folders{folder(2024, "!ScreenRecorder_2024", {"Screenrecorder-1.mp4"})};

    const DuplicateReport report = DuplicateResolver().resolve(entries, folders, {});
    CHECK(entries[0].state == EntryState::Duplicate);
    CHECK_FALSE(entries[0].trash_eligible);
    CHECK(entries[0].duplicate_of == "2024/!ScreenRecorder_2024");
}

TEST_CASE("a name in two organized folders is a conflict unless ignored") {
    std::vector<FileEntry> entries;
    const std::vector<OrganizedFolder> folders{
        folder(2024, "Trip", {"photo.jpg"}),
        folder(2024, "Work", {"photo.jpg", "memo.jpg"}),
    };

    const DuplicateReport report = DuplicateResolver().resolve(entries, folders, {});
    const auto conflicts = report.reported_conflicts();
    REQUIRE(conflicts.size() == 1);
    CHECK(conflicts[0].identity == "photo.jpg");
    REQUIRE(conflicts[0].folders.size() == 2);
    CHECK(conflicts[0].folders[0].label() == "2024/Trip");
    CHECK(conflicts[0].folders[1].label() == "2024/Work");

    const DuplicateReport ignored = DuplicateResolver().resolve(entries, folders, {"photo.jpg"});
    CHECK(ignored.reported_conflicts().empty());
    // Still visible on request
    const auto all = ignored.reported_conflicts(true);
    REQUIRE(all.size() == 1);
    CHECK(all[0].ignored);
}

TEST_CASE("auto-category folders never produce conflicts") {
    std::vector<FileEntry> entries;
    const std::vector<OrganizedFolder> folders{
        folder(2024, "!Screenshots_2024", {"Screenshot_1.png"}),
        folder(2024, "Trip", {"Screenshot_1.png"}),
    };

    const DuplicateReport report = DuplicateResolver().resolve(entries, folders, {});
    CHECK(report.conflicts.empty());
    REQUIRE(report.redundant_copies.size() == 1);
    CHECK(report.redundant_copies[0].auto_folder.name == "!Screenshots_2024");
    CHECK(report.redundant_copies[0].kept_in.name == "Trip");
    CHECK(report.redundant_copies[0].path == "/camera/2024/!Screenshots_2024/Screenshot_1.png");

    const DuplicateReport ignored = DuplicateResolver().resolve(entries, folders, {"Screenshot_1.png"});
    CHECK(ignored.redundant_copies.empty());
}

TEST_CASE("ignored duplicates keep a normal placement") {
    std::vector<FileEntry> entries{pending("IMG_001.jpg")};
    const std::vector<OrganizedFolder> folders{folder(2024, "Trip", {"IMG_001.jpg"})};

    const DuplicateReport report = DuplicateResolver().resolve(entries, folders, {"IMG_001.jpg"});
    CHECK(entries[0].state == EntryState::Ignored);
    CHECK(report.ignored == std::vector<std::string>{"IMG_001.jpg"});
    CHECK(report.duplicates.empty());
}

TEST_CASE("resolving again resets stale annotations") {
    std::vector<FileEntry> entries{pending("IMG_001.jpg")};
    std::vector<OrganizedFolder> folders{folder(2024, "Trip", {"IMG_001.jpg"})};
    DuplicateResolver resolver;
    resolver.resolve(entries, folders, {});
    REQUIRE(entries[0].state == EntryState::Duplicate);

    folders[0].members.clear();
    resolver.resolve(entries, folders, {});
    CHECK(entries[0].state == EntryState::PendingAssignment);
    CHECK(entries[0].duplicate_of.empty());
}

TEST_CASE("resolution is deterministic regardless of folder order") {
    std::vector<FileEntry> a{pending("x.jpg"), pending("y.jpg")};
    std::vector<FileEntry> b = a;
    const std::vector<OrganizedFolder> forward{
        folder(2023, "Home", {"x.jpg", "z.jpg"}),
        folder(2024, "Trip", {"x.jpg", "y.jpg", "z.jpg"}),
    };
    const std::vector<OrganizedFolder> backward{forward[1], forward[0]};

    const DuplicateReport first = DuplicateResolver().resolve(a, forward, {});
    const DuplicateReport second = DuplicateResolver().resolve(b, backward, {});

    CHECK(first.duplicates == second.duplicates);
    CHECK(a[0].duplicate_of == b[0].duplicate_of);
    CHECK(a[0].duplicate_of == "2023/Home");
    REQUIRE(first.conflicts.size() == second.conflicts.size());
    for (std::size_t i = 0; i < first.conflicts.size(); ++i) {
        CHECK(first.conflicts[i].identity == second.conflicts[i].identity);
        CHECK(first.conflicts[i].folders.front().label() == second.conflicts[i].folders.front().label());
    }
}

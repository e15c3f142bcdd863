#include <catch2/catch_test_macros.hpp>

#include "EditSessionStore.hpp"
#include "TestHelpers.hpp"

#include <filesystem>

TEST_CASE("assigned folder and year survive a reload") {
    TempDir config_dir;

    EditSessionStore store(config_dir.str());
    REQUIRE(store.load());
    store.set("IMG_001.jpg", EditRecord{2024, "Trip", MediaCategory::Normal});
    REQUIRE(store.save());

    EditSessionStore reloaded(config_dir.str());
    REQUIRE(reloaded.load());
    const auto record = reloaded.get("IMG_001.jpg");
    REQUIRE(record.has_value());
    CHECK(record->year == 2024);
    CHECK(record->folder == "Trip");
    CHECK(record->category == MediaCategory::Normal);
    CHECK((*record == EditRecord{2024, "Trip", MediaCategory::Normal}));
}

TEST_CASE("missing year and non-normal category round-trip") {
    TempDir config_dir;

    EditSessionStore store(config_dir.str());
    store.set("Screenshot_x.png", EditRecord{std::nullopt, "", MediaCategory::Screenshot});
    REQUIRE(store.save());

    EditSessionStore reloaded(config_dir.str());
    REQUIRE(reloaded.load());
    const auto record = reloaded.get("Screenshot_x.png");
    REQUIRE(record.has_value());
    CHECK_FALSE(record->year.has_value());
    CHECK(record->category == MediaCategory::Screenshot);
}

TEST_CASE("a missing document loads as an empty session") {
    TempDir config_dir;
    EditSessionStore store(config_dir.str());
    REQUIRE(store.load());
    CHECK(store.empty());
    CHECK_FALSE(std::filesystem::exists(store.file_path()));
}

TEST_CASE("legacy documents mapping identity to a folder name are accepted") {
    TempDir config_dir;
    write_file(config_dir.path() / "edits.json",
               R"({"IMG_001.jpg": "Trip", "IMG_002.jpg": {"year": "2023", "folder": "Work"}})");

    EditSessionStore store(config_dir.str());
    REQUIRE(store.load());
    REQUIRE(store.size() == 2);
    CHECK(store.get("IMG_001.jpg")->folder == "Trip");
    CHECK_FALSE(store.get("IMG_001.jpg")->year.has_value());
    CHECK(store.get("IMG_002.jpg")->year == 2023);
    CHECK(store.get("IMG_002.jpg")->folder == "Work");
}

TEST_CASE("a corrupt document is preserved and the session starts empty") {
    TempDir config_dir;
    const auto path = config_dir.path() / "edits.json";
    write_file(path, "{ not json");

    EditSessionStore store(config_dir.str());
    REQUIRE_FALSE(store.load());
    CHECK(store.empty());
    CHECK(std::filesystem::exists(config_dir.path() / "edits.json.corrupt"));
    CHECK(read_file(config_dir.path() / "edits.json.corrupt") == "{ not json");
}

TEST_CASE("removing an edit persists on the next save") {
    TempDir config_dir;
    EditSessionStore store(config_dir.str());
    store.set("a.jpg", EditRecord{2024, "Trip", MediaCategory::Normal});
    store.set("b.jpg", EditRecord{2024, "Work", MediaCategory::Normal});
    REQUIRE(store.save());

    CHECK(store.remove("a.jpg"));
    CHECK_FALSE(store.remove("a.jpg"));
    REQUIRE(store.save());

    EditSessionStore reloaded(config_dir.str());
    REQUIRE(reloaded.load());
    CHECK(reloaded.list_identities() == std::vector<std::string>{"b.jpg"});
    CHECK_FALSE(std::filesystem::exists(config_dir.path() / "edits.json.tmp"));
}

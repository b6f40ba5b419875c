#include <doctest/doctest.h>

#include <filesystem>

#include <nlohmann/json.hpp>

#include "storage.hpp"
#include "test_support.hpp"

using testing_support::ReadFile;
using testing_support::TempDir;
using testing_support::UtcEpoch;
using testing_support::WriteFile;

namespace {

struct StorageFixture {
    TempDir tmp;
    std::filesystem::path dataDir = tmp.Path() / "upstand";
    std::filesystem::path legacyDir = Storage::LegacyDirFor(dataDir);
    Storage storage{dataDir, legacyDir};
};

} // namespace

TEST_CASE("Legacy directory is a sibling of the data directory") {
    CHECK(Storage::LegacyDirFor("/home/u/.local/share/upstand") ==
          std::filesystem::path("/home/u/.local/share/standby"));
}

TEST_CASE_FIXTURE(StorageFixture, "Missing config yields defaults and is written back") {
    const Config cfg = storage.LoadConfig();
    CHECK(cfg.interval_minutes == 50);
    CHECK(cfg.ui_language == LANG_EN);
    CHECK(cfg.reminder_language == LANG_EN);
    CHECK(cfg.theme == THEME_NIGHT);

    const nlohmann::json doc = nlohmann::json::parse(ReadFile(dataDir / "config.json"));
    CHECK(doc["interval_minutes"] == 50);
    CHECK(doc["language"] == "en");
    CHECK(doc["reminder_language"] == "en");
    CHECK(doc["theme"] == "night");
}

TEST_CASE_FIXTURE(StorageFixture, "Config saved by one instance is read by the next") {
    storage.SaveConfig(10, LANG_ZH_CN, LANG_EN, THEME_DAY);

    Storage reopened(dataDir, legacyDir);
    const Config cfg = reopened.LoadConfig();
    CHECK(cfg.interval_minutes == 10);
    CHECK(cfg.ui_language == LANG_ZH_CN);
    CHECK(cfg.reminder_language == LANG_EN);
    CHECK(cfg.theme == THEME_DAY);
}

TEST_CASE_FIXTURE(StorageFixture, "Corrupt config heals from the legacy directory") {
    WriteFile(dataDir / "config.json", "{ this is not json");
    WriteFile(legacyDir / "config.json",
              R"({"interval_minutes": 20, "language": "zh-CN", "reminder_language": "zh-CN", "theme": "day"})");

    const Config cfg = storage.LoadConfig();
    CHECK(cfg.interval_minutes == 20);
    CHECK(cfg.ui_language == LANG_ZH_CN);
    CHECK(cfg.reminder_language == LANG_ZH_CN);
    CHECK(cfg.theme == THEME_DAY);

    const nlohmann::json healed = nlohmann::json::parse(ReadFile(dataDir / "config.json"));
    CHECK(healed["interval_minutes"] == 20);
    CHECK(healed["theme"] == "day");
}

TEST_CASE_FIXTURE(StorageFixture, "Config values outside the allowed sets are normalized") {
    WriteFile(dataDir / "config.json",
              R"({"interval_minutes": 7, "language": "fr", "reminder_language": 3, "theme": "dusk"})");

    const Config cfg = storage.LoadConfig();
    CHECK(cfg.interval_minutes == 50);
    CHECK(cfg.ui_language == LANG_EN);
    CHECK(cfg.reminder_language == LANG_EN);
    CHECK(cfg.theme == THEME_NIGHT);

    const nlohmann::json doc = nlohmann::json::parse(ReadFile(dataDir / "config.json"));
    CHECK(doc["interval_minutes"] == 50);
}

TEST_CASE_FIXTURE(StorageFixture, "Config with missing keys keeps the present ones") {
    WriteFile(dataDir / "config.json", R"({"interval_minutes": 5})");
    const Config cfg = storage.LoadConfig();
    CHECK(cfg.interval_minutes == 5);
    CHECK(cfg.theme == THEME_NIGHT);
}

TEST_CASE_FIXTURE(StorageFixture, "Analytics survive a save and reload") {
    const std::int64_t now = UtcEpoch(2024, 5, 15, 12);
    EventLog log;
    log.sedentary.push_back({now - 3600, 3000});
    log.standups.push_back({now - 60});
    storage.SaveAnalytics(log, now);

    const nlohmann::json doc = nlohmann::json::parse(ReadFile(dataDir / "analytics.json"));
    REQUIRE(doc["reminder_events"].size() == 1);
    CHECK(doc["reminder_events"][0]["ts"] == now - 3600);
    CHECK(doc["reminder_events"][0]["duration_secs"] == 3000);
    CHECK(doc["standup_events"][0] == now - 60);

    Storage reopened(dataDir, legacyDir);
    const EventLog loaded = reopened.LoadAnalytics(now);
    REQUIRE(loaded.sedentary.size() == 1);
    CHECK(loaded.sedentary[0].ts == now - 3600);
    CHECK(loaded.sedentary[0].duration_secs == 3000);
    REQUIRE(loaded.standups.size() == 1);
    CHECK(loaded.standups[0].ts == now - 60);
}

TEST_CASE_FIXTURE(StorageFixture, "A failed save leaves the previous file intact") {
    const std::int64_t now = UtcEpoch(2024, 5, 15, 12);
    EventLog first;
    first.standups.push_back({now - 60});
    storage.SaveAnalytics(first, now);
    CHECK_FALSE(std::filesystem::exists(dataDir / "analytics.json.tmp"));

    // The scratch file cannot be created while a directory occupies its name.
    std::filesystem::create_directories(dataDir / "analytics.json.tmp");
    EventLog second;
    second.standups.push_back({now - 30});
    second.standups.push_back({now - 20});
    CHECK_NOTHROW(storage.SaveAnalytics(second, now));

    const EventLog loaded = storage.LoadAnalytics(now);
    REQUIRE(loaded.standups.size() == 1);
    CHECK(loaded.standups[0].ts == now - 60);
}

TEST_CASE_FIXTURE(StorageFixture, "Saving and loading drop events past the retention window") {
    const std::int64_t now = UtcEpoch(2024, 5, 15, 12);
    EventLog log;
    log.sedentary.push_back({now - kRetentionSecs - 10, 300});
    log.sedentary.push_back({now - 10, 300});
    log.standups.push_back({now - kRetentionSecs - 1});
    storage.SaveAnalytics(log, now);

    const nlohmann::json doc = nlohmann::json::parse(ReadFile(dataDir / "analytics.json"));
    CHECK(doc["reminder_events"].size() == 1);
    CHECK(doc["standup_events"].empty());

    // A file written long ago is pruned again on load.
    const EventLog later = storage.LoadAnalytics(now + kRetentionSecs);
    CHECK(later.sedentary.empty());
}

TEST_CASE_FIXTURE(StorageFixture, "Malformed analytics fall back to legacy, then to empty") {
    const std::int64_t now = UtcEpoch(2024, 5, 15, 12);
    WriteFile(dataDir / "analytics.json", R"({"reminder_events": [{"ts": "soon"}], "standup_events": []})");
    WriteFile(legacyDir / "analytics.json",
              R"({"reminder_events": [], "standup_events": [)" + std::to_string(now - 5) + "]}");

    EventLog log = storage.LoadAnalytics(now);
    REQUIRE(log.standups.size() == 1);
    CHECK(log.standups[0].ts == now - 5);

    // Analytics are not rewritten on load.
    CHECK(ReadFile(dataDir / "analytics.json").find("soon") != std::string::npos);

    WriteFile(legacyDir / "analytics.json", "[]");
    log = storage.LoadAnalytics(now);
    CHECK(log.sedentary.empty());
    CHECK(log.standups.empty());
}

TEST_CASE_FIXTURE(StorageFixture, "Analytics documents missing either list are rejected") {
    WriteFile(dataDir / "analytics.json", R"({"reminder_events": []})");
    const EventLog log = storage.LoadAnalytics(UtcEpoch(2024, 5, 15));
    CHECK(log.sedentary.empty());
    CHECK(log.standups.empty());
}

TEST_CASE("Unwritable data directory is reported, not thrown") {
    TempDir tmp;
    // A regular file where the data directory should be.
    WriteFile(tmp.Path() / "blocked", "x");
    Storage storage(tmp.Path() / "blocked", tmp.Path() / "standby");

    Config cfg;
    CHECK_NOTHROW(cfg = storage.LoadConfig());
    CHECK(cfg.interval_minutes == 50);
    CHECK_NOTHROW(storage.SaveAnalytics(EventLog{}, 0));
}

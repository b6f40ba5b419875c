#include <doctest/doctest.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <string>

#include "analytics.hpp"
#include "test_support.hpp"

using testing_support::FixedOffsetZone;
using testing_support::GapAtMidnightZone;
using testing_support::UtcEpoch;

TEST_CASE("Daily period starts at local midnight") {
    FixedOffsetZone utc;
    const std::int64_t now = UtcEpoch(2024, 5, 15, 13, 45, 10);
    CHECK(PeriodStart(PERIOD_DAILY, now, utc) == UtcEpoch(2024, 5, 15));

    // 23:30 UTC is already the next day at UTC+2.
    FixedOffsetZone plusTwo(2 * 3600);
    const std::int64_t late = UtcEpoch(2024, 5, 15, 23, 30);
    CHECK(PeriodStart(PERIOD_DAILY, late, plusTwo) == UtcEpoch(2024, 5, 16) - 2 * 3600);
}

TEST_CASE("Weekly period on a Wednesday starts the previous Thursday") {
    using namespace std::chrono;
    REQUIRE(weekday{sys_days{2024y / May / 15}} == Wednesday);
    REQUIRE(weekday{sys_days{2024y / May / 9}} == Thursday);

    FixedOffsetZone utc;
    const std::int64_t now = UtcEpoch(2024, 5, 15, 9);
    const std::int64_t start = PeriodStart(PERIOD_WEEKLY, now, utc);
    CHECK(start == UtcEpoch(2024, 5, 9));

    EventLog log;
    log.standups.push_back({start});                 // inclusive lower bound
    log.standups.push_back({start - 1});             // Wednesday of last week
    log.standups.push_back({now});                   // inclusive upper bound
    const AnalyticsData data = Aggregate(log, PERIOD_WEEKLY, now, utc);
    CHECK(data.standup_sessions == 2);
}

TEST_CASE("Weekly and monthly periods cross month and year boundaries") {
    FixedOffsetZone utc;
    CHECK(PeriodStart(PERIOD_WEEKLY, UtcEpoch(2024, 3, 2, 12), utc) == UtcEpoch(2024, 2, 25));
    CHECK(PeriodStart(PERIOD_WEEKLY, UtcEpoch(2025, 1, 3, 12), utc) == UtcEpoch(2024, 12, 28));
    CHECK(PeriodStart(PERIOD_MONTHLY, UtcEpoch(2024, 2, 29, 18), utc) == UtcEpoch(2024, 2, 1));
    CHECK(PeriodStart(PERIOD_MONTHLY, UtcEpoch(2024, 2, 1), utc) == UtcEpoch(2024, 2, 1));
}

TEST_CASE("Local time resolution prefers unique, then earliest, then latest, then now") {
    LocalResolution unique;
    unique.single = 100;
    unique.earliest = 100;
    unique.latest = 100;
    CHECK(ResolveLocalTime(unique, 7) == 100);

    LocalResolution fold;
    fold.earliest = 100;
    fold.latest = 3700;
    CHECK(ResolveLocalTime(fold, 7) == 100);

    LocalResolution lateOnly;
    lateOnly.latest = 3700;
    CHECK(ResolveLocalTime(lateOnly, 7) == 3700);

    CHECK(ResolveLocalTime(LocalResolution{}, 7) == 7);
}

TEST_CASE("A midnight that does not exist falls back to now") {
    GapAtMidnightZone zone;
    const std::int64_t now = UtcEpoch(2024, 5, 15, 10);
    CHECK(PeriodStart(PERIOD_DAILY, now, zone) == now);

    EventLog log;
    log.standups.push_back({now - 60});
    log.standups.push_back({now});
    CHECK(Aggregate(log, PERIOD_DAILY, now, zone).standup_sessions == 1);
}

TEST_CASE("Aggregate buckets events by local hour and sums sitting time") {
    FixedOffsetZone plusOne(3600);
    const std::int64_t now = UtcEpoch(2024, 5, 15, 20);

    EventLog log;
    log.sedentary.push_back({UtcEpoch(2024, 5, 15, 8, 10), 3000});  // 09:10 local
    log.sedentary.push_back({UtcEpoch(2024, 5, 15, 8, 55), 1800});  // 09:55 local
    log.sedentary.push_back({UtcEpoch(2024, 5, 15, 13, 0), 600});   // 14:00 local
    log.sedentary.push_back({UtcEpoch(2024, 5, 14, 12, 0), 3000});  // yesterday
    log.standups.push_back({UtcEpoch(2024, 5, 15, 8, 30)});         // 09:30 local
    log.standups.push_back({UtcEpoch(2024, 5, 14, 22, 59)});        // 23:59 yesterday

    const AnalyticsData data = Aggregate(log, PERIOD_DAILY, now, plusOne);
    CHECK(data.sedentary_sessions == 3);
    CHECK(data.standup_sessions == 1);
    CHECK(data.record_count == 4);
    CHECK(data.total_sitting_secs == 5400);
    CHECK(data.hourly_sedentary[9] == 2);
    CHECK(data.hourly_sedentary_delay_secs[9] == 4800);
    CHECK(data.hourly_sedentary[14] == 1);
    CHECK(data.hourly_standup[9] == 1);
    CHECK(data.hourly_standup[23] == 0);
}

TEST_CASE("Pruning keeps exactly the retention window") {
    const std::int64_t now = UtcEpoch(2024, 5, 15);
    const std::int64_t cutoff = now - kRetentionSecs;

    EventLog log;
    log.sedentary.push_back({cutoff - 1, 300});
    log.sedentary.push_back({cutoff, 300});
    log.standups.push_back({cutoff - 86400});
    log.standups.push_back({now});

    PruneOldEvents(log, now);
    REQUIRE(log.sedentary.size() == 1);
    CHECK(log.sedentary[0].ts == cutoff);
    REQUIRE(log.standups.size() == 1);
    CHECK(log.standups[0].ts == now);
}

TEST_CASE("Period names round-trip and unknown names mean daily") {
    CHECK(ParsePeriod("weekly") == PERIOD_WEEKLY);
    CHECK(ParsePeriod("monthly") == PERIOD_MONTHLY);
    CHECK(ParsePeriod("daily") == PERIOD_DAILY);
    CHECK(ParsePeriod("yearly") == PERIOD_DAILY);
    CHECK(ParsePeriod("") == PERIOD_DAILY);
    CHECK(PeriodName(PERIOD_WEEKLY) == "weekly");
}

TEST_CASE("Analytics JSON uses snake_case keys and 24 buckets") {
    AnalyticsData data;
    data.hourly_standup[7] = 2;
    data.standup_sessions = 2;
    data.record_count = 2;

    const nlohmann::json j = AnalyticsToJson(data);
    CHECK(j["hourly_standup"].size() == 24);
    CHECK(j["hourly_standup"][7] == 2);
    CHECK(j["standup_sessions"] == 2);
    CHECK(j["record_count"] == 2);
    CHECK(j.contains("total_sitting_secs"));
}

TEST_CASE("System zone reports both instants of a DST fold") {
    if (!std::filesystem::exists("/usr/share/zoneinfo/America/New_York")) {
        MESSAGE("tzdata not installed, skipping");
        return;
    }

    const char *previous = std::getenv("TZ");
    const std::string saved = previous ? previous : "";
    setenv("TZ", "America/New_York", 1);
    tzset();

    SystemTimeZone zone;

    LocalDateTime fold;
    fold.year = 2024;
    fold.month = 11;
    fold.day = 3;
    fold.hour = 1;
    fold.minute = 30;
    const LocalResolution folded = zone.FromLocal(fold);
    CHECK_FALSE(folded.single.has_value());
    REQUIRE(folded.earliest.has_value());
    REQUIRE(folded.latest.has_value());
    CHECK(*folded.earliest == UtcEpoch(2024, 11, 3, 5, 30));
    CHECK(*folded.latest == UtcEpoch(2024, 11, 3, 6, 30));

    LocalDateTime gap;
    gap.year = 2024;
    gap.month = 3;
    gap.day = 10;
    gap.hour = 2;
    gap.minute = 30;
    const LocalResolution missing = zone.FromLocal(gap);
    CHECK_FALSE(missing.single.has_value());
    CHECK_FALSE(missing.earliest.has_value());
    CHECK_FALSE(missing.latest.has_value());

    LocalDateTime plain;
    plain.year = 2024;
    plain.month = 7;
    plain.day = 1;
    plain.hour = 12;
    const LocalResolution unique = zone.FromLocal(plain);
    REQUIRE(unique.single.has_value());
    CHECK(*unique.single == UtcEpoch(2024, 7, 1, 16));

    if (previous) {
        setenv("TZ", saved.c_str(), 1);
    } else {
        unsetenv("TZ");
    }
    tzset();
}

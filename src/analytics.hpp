#pragma once

#include <array>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "clock.hpp"
#include "common.hpp"

struct AnalyticsData {
    std::array<std::uint32_t, kHours> hourly_sedentary{};
    std::array<std::uint32_t, kHours> hourly_standup{};
    std::array<std::uint64_t, kHours> hourly_sedentary_delay_secs{};
    std::uint32_t sedentary_sessions = 0;
    std::uint32_t standup_sessions = 0;
    std::uint64_t total_sitting_secs = 0;
    std::uint32_t record_count = 0;
};

// "weekly" and "monthly" are recognised, anything else is daily.
Period ParsePeriod(const std::string &value);
std::string PeriodName(Period period);

// Unique mapping, else earliest, else latest, else `fallback`.
std::int64_t ResolveLocalTime(const LocalResolution &res, std::int64_t fallback);

// Local midnight that opens the reporting window containing `now`.
// daily: today; weekly: six calendar days back (7 days inclusive); monthly: the 1st.
std::int64_t PeriodStart(Period period, std::int64_t now, const TimeZone &tz);

void PruneOldEvents(EventLog &log, std::int64_t now);

AnalyticsData Aggregate(const EventLog &log, Period period, std::int64_t now, const TimeZone &tz);

nlohmann::json AnalyticsToJson(const AnalyticsData &data);

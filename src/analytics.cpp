#include "analytics.hpp"

#include <algorithm>
#include <chrono>

#include <spdlog/spdlog.h>

namespace {

// ─────────────────────────────────────
std::int64_t LocalMidnight(const std::chrono::year_month_day &date, std::int64_t now,
                           const TimeZone &tz) {
    if (!date.ok()) {
        return now;
    }
    LocalDateTime midnight;
    midnight.year = static_cast<int>(date.year());
    midnight.month = static_cast<unsigned>(date.month());
    midnight.day = static_cast<unsigned>(date.day());
    return ResolveLocalTime(tz.FromLocal(midnight), now);
}

} // namespace

// ─────────────────────────────────────
Period ParsePeriod(const std::string &value) {
    if (value == "weekly") {
        return PERIOD_WEEKLY;
    }
    if (value == "monthly") {
        return PERIOD_MONTHLY;
    }
    return PERIOD_DAILY;
}

// ─────────────────────────────────────
std::string PeriodName(Period period) {
    switch (period) {
    case PERIOD_WEEKLY:
        return "weekly";
    case PERIOD_MONTHLY:
        return "monthly";
    default:
        return "daily";
    }
}

// ─────────────────────────────────────
std::int64_t ResolveLocalTime(const LocalResolution &res, std::int64_t fallback) {
    if (res.single) {
        return *res.single;
    }
    if (res.earliest) {
        return *res.earliest;
    }
    if (res.latest) {
        return *res.latest;
    }
    return fallback;
}

// ─────────────────────────────────────
std::int64_t PeriodStart(Period period, std::int64_t now, const TimeZone &tz) {
    using namespace std::chrono;

    LocalDateTime local;
    if (!tz.ToLocal(now, local)) {
        spdlog::warn("Cannot convert {} to local time, period starts now", now);
        return now;
    }

    const year_month_day today{year{local.year}, month{local.month}, day{local.day}};
    switch (period) {
    case PERIOD_WEEKLY:
        return LocalMidnight(year_month_day{sys_days{today} - days{6}}, now, tz);
    case PERIOD_MONTHLY:
        return LocalMidnight(today.year() / today.month() / day{1}, now, tz);
    default:
        return LocalMidnight(today, now, tz);
    }
}

// ─────────────────────────────────────
void PruneOldEvents(EventLog &log, std::int64_t now) {
    const std::int64_t cutoff = now - kRetentionSecs;
    const auto sedentaryBefore = log.sedentary.size();
    const auto standupsBefore = log.standups.size();

    log.sedentary.erase(std::remove_if(log.sedentary.begin(), log.sedentary.end(),
                                       [cutoff](const SedentaryEvent &e) { return e.ts < cutoff; }),
                        log.sedentary.end());
    log.standups.erase(std::remove_if(log.standups.begin(), log.standups.end(),
                                      [cutoff](const StandupEvent &e) { return e.ts < cutoff; }),
                       log.standups.end());

    const auto dropped =
        (sedentaryBefore - log.sedentary.size()) + (standupsBefore - log.standups.size());
    if (dropped > 0) {
        spdlog::debug("Pruned {} events older than the retention window", dropped);
    }
}

// ─────────────────────────────────────
AnalyticsData Aggregate(const EventLog &log, Period period, std::int64_t now, const TimeZone &tz) {
    AnalyticsData data;
    const std::int64_t start = PeriodStart(period, now, tz);

    LocalDateTime local;
    for (const auto &event : log.sedentary) {
        if (event.ts < start) {
            continue;
        }
        data.sedentary_sessions++;
        data.total_sitting_secs += event.duration_secs;
        if (tz.ToLocal(event.ts, local)) {
            data.hourly_sedentary[local.hour]++;
            data.hourly_sedentary_delay_secs[local.hour] += event.duration_secs;
        }
    }

    for (const auto &event : log.standups) {
        if (event.ts < start) {
            continue;
        }
        data.standup_sessions++;
        if (tz.ToLocal(event.ts, local)) {
            data.hourly_standup[local.hour]++;
        }
    }

    data.record_count = data.sedentary_sessions + data.standup_sessions;
    return data;
}

// ─────────────────────────────────────
nlohmann::json AnalyticsToJson(const AnalyticsData &data) {
    return {
        {"hourly_sedentary", data.hourly_sedentary},
        {"hourly_standup", data.hourly_standup},
        {"hourly_sedentary_delay_secs", data.hourly_sedentary_delay_secs},
        {"sedentary_sessions", data.sedentary_sessions},
        {"standup_sessions", data.standup_sessions},
        {"total_sitting_secs", data.total_sitting_secs},
        {"record_count", data.record_count},
    };
}

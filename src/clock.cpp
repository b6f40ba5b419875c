#include "clock.hpp"

#include <algorithm>
#include <ctime>
#include <vector>

namespace {

// ─────────────────────────────────────
bool SameCivilTime(const std::tm &a, const LocalDateTime &b) {
    return a.tm_year + 1900 == b.year && static_cast<unsigned>(a.tm_mon + 1) == b.month &&
           static_cast<unsigned>(a.tm_mday) == b.day && a.tm_hour == b.hour &&
           a.tm_min == b.minute && a.tm_sec == b.second;
}

} // namespace

// ─────────────────────────────────────
std::int64_t SystemClock::Now() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ─────────────────────────────────────
std::chrono::steady_clock::time_point SystemClock::SteadyNow() const {
    return std::chrono::steady_clock::now();
}

// ─────────────────────────────────────
bool SystemTimeZone::ToLocal(std::int64_t ts, LocalDateTime &out) const {
    const std::time_t t = static_cast<std::time_t>(ts);
    std::tm tm{};
    if (!localtime_r(&t, &tm)) {
        return false;
    }
    out.year = tm.tm_year + 1900;
    out.month = static_cast<unsigned>(tm.tm_mon + 1);
    out.day = static_cast<unsigned>(tm.tm_mday);
    out.hour = tm.tm_hour;
    out.minute = tm.tm_min;
    out.second = tm.tm_sec;
    return true;
}

// ─────────────────────────────────────
LocalResolution SystemTimeZone::FromLocal(const LocalDateTime &local) const {
    // mktime picks one offset for a folded time; probing both DST flags and keeping the
    // candidates that round-trip gives every instant the civil time denotes.
    std::vector<std::int64_t> candidates;
    for (int isdst : {0, 1}) {
        std::tm tm{};
        tm.tm_year = local.year - 1900;
        tm.tm_mon = static_cast<int>(local.month) - 1;
        tm.tm_mday = static_cast<int>(local.day);
        tm.tm_hour = local.hour;
        tm.tm_min = local.minute;
        tm.tm_sec = local.second;
        tm.tm_isdst = isdst;

        const std::time_t t = mktime(&tm);
        if (t == static_cast<std::time_t>(-1)) {
            continue;
        }

        std::tm check{};
        if (!localtime_r(&t, &check) || !SameCivilTime(check, local)) {
            continue;
        }
        const auto value = static_cast<std::int64_t>(t);
        if (std::find(candidates.begin(), candidates.end(), value) == candidates.end()) {
            candidates.push_back(value);
        }
    }

    LocalResolution res;
    if (candidates.empty()) {
        return res;
    }
    std::sort(candidates.begin(), candidates.end());
    if (candidates.size() == 1) {
        res.single = candidates.front();
    }
    res.earliest = candidates.front();
    res.latest = candidates.back();
    return res;
}

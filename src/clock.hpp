#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

class Clock {
  public:
    virtual ~Clock() = default;
    // Wall clock, Unix epoch seconds.
    virtual std::int64_t Now() const = 0;
    virtual std::chrono::steady_clock::time_point SteadyNow() const = 0;
};

class SystemClock : public Clock {
  public:
    std::int64_t Now() const override;
    std::chrono::steady_clock::time_point SteadyNow() const override;
};

struct LocalDateTime {
    int year = 1970;
    unsigned month = 1; // 1..12
    unsigned day = 1;   // 1..31
    int hour = 0;
    int minute = 0;
    int second = 0;
};

// Every instant a local civil time can denote. `single` is set only for an unambiguous time,
// `earliest`/`latest` for a fold (both equal `single` when unique), nothing for a gap.
struct LocalResolution {
    std::optional<std::int64_t> single;
    std::optional<std::int64_t> earliest;
    std::optional<std::int64_t> latest;
};

class TimeZone {
  public:
    virtual ~TimeZone() = default;
    virtual bool ToLocal(std::int64_t ts, LocalDateTime &out) const = 0;
    virtual LocalResolution FromLocal(const LocalDateTime &local) const = 0;
};

// Host zone through localtime_r/mktime (honours TZ).
class SystemTimeZone : public TimeZone {
  public:
    bool ToLocal(std::int64_t ts, LocalDateTime &out) const override;
    LocalResolution FromLocal(const LocalDateTime &local) const override;
};

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "common.hpp"

struct ActiveSession {
    std::uint64_t id = 0;
    std::optional<std::int64_t> start_ts;
    std::optional<std::chrono::steady_clock::time_point> shown_at;
    std::uint64_t interval_secs_snapshot = kDefaultIntervalMinutes * 60;
    bool logged_sedentary = false;
    std::string tip_text = "Time to stand up and stretch.";
    bool visible = false;

    void Clear() {
        visible = false;
        start_ts.reset();
        shown_at.reset();
    }
};

// Everything the scheduler thread and external callers share. Guarded as one unit by
// ReminderScheduler::m_StateMutex.
struct RuntimeState {
    Config config;
    std::uint64_t elapsed_secs = 0;
    std::chrono::steady_clock::time_point last_interval_change{};
    EventLog events;
    ActiveSession session;
};

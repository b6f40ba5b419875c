#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// Libs
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// parts
#include "clock.hpp"
#include "common.hpp"
#include "notification.hpp"
#include "reminder.hpp"
#include "storage.hpp"

#define UPSTAND_DEFAULT_PORT 8078
#define EVENT_FEED_CAPACITY 64
#define NOTIFICATION_POLL_MS 200

class Upstand {
  public:
    Upstand(unsigned port, LogLevel log_level, std::filesystem::path dataDir,
            std::optional<WorkArea> workArea);
    ~Upstand();

    // False when the HTTP server could not bind.
    bool Start();
    // Pumps notification signals until `shutdown` is set.
    void Run(const std::atomic<bool> &shutdown);

  private:
    bool InitServer();
    void RecordEvent(const std::string &event, const nlohmann::json &payload);
    nlohmann::json EventsSince(std::uint64_t since);

  private:
    const unsigned m_Port;

    // Parts
    SystemClock m_Clock;
    SystemTimeZone m_Tz;
    std::unique_ptr<Storage> m_Storage;
    std::unique_ptr<Notification> m_Notification;
    std::unique_ptr<ReminderScheduler> m_Scheduler;

    // Event feed
    struct FeedEntry {
        std::uint64_t seq = 0;
        std::string event;
        nlohmann::json payload;
    };
    std::mutex m_FeedMutex;
    std::deque<FeedEntry> m_Feed;
    std::uint64_t m_FeedSeq = 0;

    // Server
    std::thread m_Thread;
    httplib::Server m_Server;
};

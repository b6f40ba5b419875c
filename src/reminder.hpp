#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "analytics.hpp"
#include "clock.hpp"
#include "runtime_state.hpp"
#include "storage.hpp"
#include "tips.hpp"

#define REMINDER_TICK_SECONDS 5
// An armed reminder left alone this long is logged as a sedentary session.
#define REMINDER_STALE_AFTER 60 // seconds
#define REMINDER_DEBOUNCE_MS 700

struct WorkArea {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

struct PromptPlacement {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

struct ReminderPrompt {
    std::uint64_t id = 0;
    std::string text;
    Theme theme = THEME_NIGHT;
    std::optional<PromptPlacement> placement;
};

enum PromptStatus { PROMPT_VISIBLE = 1, PROMPT_HIDDEN = 2, PROMPT_MISSING = 3 };

// Surface that shows the reminder to the user.
class ReminderPresenter {
  public:
    virtual ~ReminderPresenter() = default;
    // False when there is nothing to show a prompt on at all.
    virtual bool Available() = 0;
    virtual PromptStatus Status() = 0;
    virtual std::optional<WorkArea> PrimaryWorkArea() = 0;
    virtual void Show(const ReminderPrompt &prompt) = 0;
    virtual void Hide() = 0;
};

struct ActiveReminder {
    std::uint64_t id = 0;
    std::string text;
    Theme theme = THEME_NIGHT;
    bool visible = false;
};

PromptPlacement ComputePromptPlacement(const WorkArea &area, int width, int height, int margin);

class ReminderScheduler {
  public:
    using EventSink = std::function<void(const std::string &event, const nlohmann::json &payload)>;

    ReminderScheduler(Storage &storage, ReminderPresenter *presenter, const Clock &clock,
                      const TimeZone &tz, TipSelector tips = TipSelector());
    ~ReminderScheduler();

    ReminderScheduler(const ReminderScheduler &) = delete;
    ReminderScheduler &operator=(const ReminderScheduler &) = delete;

    void SetEventSink(EventSink sink);
    void Load();

    // Background loop, one Tick() every REMINDER_TICK_SECONDS until Stop().
    void Start();
    void Stop();
    void Tick();

    void Acknowledge(bool stoodUp, std::optional<std::uint64_t> reminderId);

    unsigned SetInterval(long long minutes);
    unsigned GetInterval();
    Language SetLanguage(const std::string &language);
    Language GetLanguage();
    Language SetReminderLanguage(const std::string &language);
    Language GetReminderLanguage();
    Theme SetTheme(const std::string &theme);
    Theme GetTheme();

    std::uint32_t LogStandup();
    std::uint32_t GetStandupCount();
    AnalyticsData GetAnalytics(Period period);
    void ResetDailyRecords();

    std::size_t NextTipIndex();
    std::string NextTipText();
    ActiveReminder GetActiveReminder();

    EventLog SnapshotEvents();
    std::uint64_t ElapsedSeconds();

    static constexpr int kPromptWidth = 640;
    static constexpr int kPromptHeight = 196;
    static constexpr int kPromptMargin = 28;

  private:
    void RunLoop();
    void TickIdle();
    void TickArmed();
    void PersistConfig();
    void PersistEvents();
    void Publish(const std::string &event, const nlohmann::json &payload = nullptr);

  private:
    Storage &m_Storage;
    ReminderPresenter *m_Presenter;
    const Clock &m_Clock;
    const TimeZone &m_Tz;

    std::mutex m_StateMutex;
    RuntimeState m_State;
    TipSelector m_Tips;

    // Serializes snapshot+write so analytics snapshots reach disk in order.
    std::mutex m_PersistMutex;

    std::mutex m_SinkMutex;
    EventSink m_Sink;

    std::mutex m_LoopMutex;
    std::condition_variable m_LoopCv;
    std::atomic<bool> m_StopRequested{false};
    std::thread m_Thread;
};

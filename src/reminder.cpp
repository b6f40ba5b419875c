#include "reminder.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
PromptPlacement ComputePromptPlacement(const WorkArea &area, int width, int height, int margin) {
    PromptPlacement placement;
    placement.width = width;
    placement.height = height;
    placement.x = area.x + area.width - width - margin;
    placement.y = area.y + area.height - height - margin;
    return placement;
}

// ─────────────────────────────────────
ReminderScheduler::ReminderScheduler(Storage &storage, ReminderPresenter *presenter,
                                     const Clock &clock, const TimeZone &tz, TipSelector tips)
    : m_Storage(storage), m_Presenter(presenter), m_Clock(clock), m_Tz(tz),
      m_Tips(std::move(tips)) {
    m_State.last_interval_change = m_Clock.SteadyNow();
}

// ─────────────────────────────────────
ReminderScheduler::~ReminderScheduler() {
    Stop();
}

// ─────────────────────────────────────
void ReminderScheduler::SetEventSink(EventSink sink) {
    std::lock_guard<std::mutex> lock(m_SinkMutex);
    m_Sink = std::move(sink);
}

// ─────────────────────────────────────
void ReminderScheduler::Load() {
    Config cfg = m_Storage.LoadConfig();
    EventLog events = m_Storage.LoadAnalytics(m_Clock.Now());

    std::lock_guard<std::mutex> lock(m_StateMutex);
    m_State.config = cfg;
    m_State.events = std::move(events);
    m_State.elapsed_secs = 0;
    spdlog::info("Reminder every {} minutes, language={}, reminder_language={}, theme={}",
                 cfg.interval_minutes, LanguageName(cfg.ui_language),
                 LanguageName(cfg.reminder_language), ThemeName(cfg.theme));
}

// ─────────────────────────────────────
void ReminderScheduler::Start() {
    if (m_Thread.joinable()) {
        return;
    }
    m_StopRequested.store(false);
    m_Thread = std::thread([this]() { RunLoop(); });
    spdlog::debug("Reminder scheduler started ({}s tick)", REMINDER_TICK_SECONDS);
}

// ─────────────────────────────────────
void ReminderScheduler::Stop() {
    {
        std::lock_guard<std::mutex> lock(m_LoopMutex);
        m_StopRequested.store(true);
    }
    m_LoopCv.notify_all();
    if (m_Thread.joinable()) {
        m_Thread.join();
        spdlog::debug("Reminder scheduler stopped");
    }
}

// ─────────────────────────────────────
void ReminderScheduler::RunLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lk(m_LoopMutex);
            if (m_LoopCv.wait_for(lk, std::chrono::seconds(REMINDER_TICK_SECONDS),
                                  [this] { return m_StopRequested.load(); })) {
                break;
            }
        }
        Tick();
    }
}

// ─────────────────────────────────────
void ReminderScheduler::Tick() {
    bool armed = false;
    {
        std::lock_guard<std::mutex> lock(m_StateMutex);
        armed = m_State.session.visible;
    }

    if (armed) {
        TickArmed();
    } else {
        TickIdle();
    }
}

// ─────────────────────────────────────
void ReminderScheduler::TickIdle() {
    // Asked before taking the state lock: the presenter never runs under it.
    const bool available = m_Presenter && m_Presenter->Available();

    ReminderPrompt prompt;
    bool fired = false;
    bool shown = false;
    {
        std::lock_guard<std::mutex> lock(m_StateMutex);
        if (m_State.session.visible) {
            return;
        }

        m_State.elapsed_secs += REMINDER_TICK_SECONDS;
        const std::uint64_t limit = static_cast<std::uint64_t>(m_State.config.interval_minutes) * 60;
        if (m_State.elapsed_secs < limit) {
            return;
        }

        fired = true;
        if (available) {
            ActiveSession &s = m_State.session;
            s.id += 1;
            s.tip_text = TipSelector::TipText(m_Tips.Next());
            s.interval_secs_snapshot = limit;
            s.start_ts = m_Clock.Now();
            s.shown_at = m_Clock.SteadyNow();
            s.logged_sedentary = false;
            s.visible = true;

            prompt.id = s.id;
            prompt.text = s.tip_text;
            prompt.theme = m_State.config.theme;
            shown = true;
        }
        m_State.elapsed_secs = 0;
    }

    if (shown) {
        if (auto area = m_Presenter->PrimaryWorkArea()) {
            prompt.placement =
                ComputePromptPlacement(*area, kPromptWidth, kPromptHeight, kPromptMargin);
        }
        spdlog::info("Reminder {} armed: \"{}\"", prompt.id, prompt.text);
        m_Presenter->Show(prompt);
    } else {
        spdlog::warn("Reminder due but no prompt surface is available");
    }

    if (fired) {
        Publish("reminder-fired", shown ? nlohmann::json(prompt.id) : nlohmann::json(nullptr));
    }
}

// ─────────────────────────────────────
void ReminderScheduler::TickArmed() {
    const PromptStatus status = m_Presenter ? m_Presenter->Status() : PROMPT_MISSING;

    if (status == PROMPT_MISSING) {
        std::lock_guard<std::mutex> lock(m_StateMutex);
        if (m_State.session.visible) {
            spdlog::info("Reminder {} lost its prompt, session aborted", m_State.session.id);
            m_State.session.Clear();
        }
        return;
    }

    if (status == PROMPT_HIDDEN) {
        ReminderPrompt prompt;
        {
            std::lock_guard<std::mutex> lock(m_StateMutex);
            if (!m_State.session.visible) {
                return;
            }
            prompt.id = m_State.session.id;
            prompt.text = m_State.session.tip_text;
            prompt.theme = m_State.config.theme;
        }
        if (auto area = m_Presenter->PrimaryWorkArea()) {
            prompt.placement =
                ComputePromptPlacement(*area, kPromptWidth, kPromptHeight, kPromptMargin);
        }
        spdlog::debug("Reminder {} was hidden, showing it again", prompt.id);
        m_Presenter->Show(prompt);
    }

    bool logged = false;
    {
        std::lock_guard<std::mutex> lock(m_StateMutex);
        ActiveSession &s = m_State.session;
        if (s.visible && s.start_ts && !s.logged_sedentary) {
            const std::int64_t lag = std::max<std::int64_t>(0, m_Clock.Now() - *s.start_ts);
            if (lag >= REMINDER_STALE_AFTER) {
                s.logged_sedentary = true;
                m_State.events.sedentary.push_back({*s.start_ts, s.interval_secs_snapshot});
                logged = true;
                spdlog::info("Reminder {} unanswered for {}s, logged {}s sedentary", s.id, lag,
                             s.interval_secs_snapshot);
            }
        }
    }

    if (logged) {
        PersistEvents();
        Publish("analytics-updated");
    }
}

// ─────────────────────────────────────
void ReminderScheduler::Acknowledge(bool stoodUp, std::optional<std::uint64_t> reminderId) {
    bool wrote = false;
    {
        std::lock_guard<std::mutex> lock(m_StateMutex);
        ActiveSession &s = m_State.session;

        if (reminderId && *reminderId != s.id) {
            spdlog::debug("Acknowledge for stale reminder {} (active {}), ignored", *reminderId,
                          s.id);
            return;
        }
        if (!s.visible) {
            spdlog::debug("Acknowledge with no visible reminder, ignored");
            return;
        }
        if (s.shown_at && m_Clock.SteadyNow() - *s.shown_at <
                              std::chrono::milliseconds(REMINDER_DEBOUNCE_MS)) {
            spdlog::debug("Acknowledge within {}ms of showing reminder {}, ignored",
                          REMINDER_DEBOUNCE_MS, s.id);
            return;
        }

        const std::int64_t now = m_Clock.Now();
        if (s.start_ts) {
            const std::int64_t lag = std::max<std::int64_t>(0, now - *s.start_ts);
            if (!s.logged_sedentary && lag >= REMINDER_STALE_AFTER) {
                m_State.events.sedentary.push_back({*s.start_ts, s.interval_secs_snapshot});
                s.logged_sedentary = true;
                wrote = true;
                spdlog::info("Reminder {} answered after {}s, logged {}s sedentary", s.id, lag,
                             s.interval_secs_snapshot);
            } else if (!s.logged_sedentary && stoodUp) {
                m_State.events.standups.push_back({now});
                wrote = true;
                spdlog::info("Reminder {} answered, standup logged", s.id);
            }
        } else if (stoodUp) {
            m_State.events.standups.push_back({now});
            wrote = true;
        }

        m_State.elapsed_secs = 0;
        s.Clear();
    }

    if (m_Presenter) {
        m_Presenter->Hide();
    }

    if (wrote) {
        PersistEvents();
        Publish("analytics-updated");
        if (stoodUp) {
            Publish("standup-logged");
        }
    }
}

// ─────────────────────────────────────
unsigned ReminderScheduler::SetInterval(long long minutes) {
    const unsigned normalized = NormalizeIntervalMinutes(minutes);
    {
        std::lock_guard<std::mutex> lock(m_StateMutex);
        m_State.config.interval_minutes = normalized;
        m_State.elapsed_secs = 0;
        m_State.last_interval_change = m_Clock.SteadyNow();
    }
    PersistConfig();
    spdlog::info("Interval set to {} minutes", normalized);
    return normalized;
}

// ─────────────────────────────────────
unsigned ReminderScheduler::GetInterval() {
    std::lock_guard<std::mutex> lock(m_StateMutex);
    return m_State.config.interval_minutes;
}

// ─────────────────────────────────────
Language ReminderScheduler::SetLanguage(const std::string &language) {
    const Language normalized = ParseLanguage(language);
    {
        std::lock_guard<std::mutex> lock(m_StateMutex);
        m_State.config.ui_language = normalized;
    }
    PersistConfig();
    Publish("language-changed", LanguageName(normalized));
    return normalized;
}

// ─────────────────────────────────────
Language ReminderScheduler::GetLanguage() {
    std::lock_guard<std::mutex> lock(m_StateMutex);
    return m_State.config.ui_language;
}

// ─────────────────────────────────────
Language ReminderScheduler::SetReminderLanguage(const std::string &language) {
    const Language normalized = ParseLanguage(language);
    {
        std::lock_guard<std::mutex> lock(m_StateMutex);
        m_State.config.reminder_language = normalized;
    }
    PersistConfig();
    Publish("reminder-language-changed", LanguageName(normalized));
    return normalized;
}

// ─────────────────────────────────────
Language ReminderScheduler::GetReminderLanguage() {
    std::lock_guard<std::mutex> lock(m_StateMutex);
    return m_State.config.reminder_language;
}

// ─────────────────────────────────────
Theme ReminderScheduler::SetTheme(const std::string &theme) {
    const Theme normalized = ParseTheme(theme);
    {
        std::lock_guard<std::mutex> lock(m_StateMutex);
        m_State.config.theme = normalized;
    }
    PersistConfig();
    Publish("theme-changed", ThemeName(normalized));
    return normalized;
}

// ─────────────────────────────────────
Theme ReminderScheduler::GetTheme() {
    std::lock_guard<std::mutex> lock(m_StateMutex);
    return m_State.config.theme;
}

// ─────────────────────────────────────
std::uint32_t ReminderScheduler::LogStandup() {
    bool wasVisible = false;
    {
        std::lock_guard<std::mutex> lock(m_StateMutex);
        wasVisible = m_State.session.visible;
        m_State.elapsed_secs = 0;
        m_State.session.Clear();
        m_State.events.standups.push_back({m_Clock.Now()});
    }
    if (wasVisible && m_Presenter) {
        m_Presenter->Hide();
    }

    PersistEvents();
    const std::uint32_t count = GetStandupCount();
    spdlog::info("Standup logged, {} today", count);

    Publish("standup-logged");
    Publish("analytics-updated");
    return count;
}

// ─────────────────────────────────────
std::uint32_t ReminderScheduler::GetStandupCount() {
    return GetAnalytics(PERIOD_DAILY).standup_sessions;
}

// ─────────────────────────────────────
AnalyticsData ReminderScheduler::GetAnalytics(Period period) {
    const std::int64_t now = m_Clock.Now();
    EventLog snapshot;
    {
        std::lock_guard<std::mutex> lock(m_StateMutex);
        PruneOldEvents(m_State.events, now);
        snapshot = m_State.events;
    }
    return Aggregate(snapshot, period, now, m_Tz);
}

// ─────────────────────────────────────
void ReminderScheduler::ResetDailyRecords() {
    const std::int64_t start = PeriodStart(PERIOD_DAILY, m_Clock.Now(), m_Tz);
    {
        std::lock_guard<std::mutex> lock(m_StateMutex);
        auto &sedentary = m_State.events.sedentary;
        auto &standups = m_State.events.standups;
        sedentary.erase(std::remove_if(sedentary.begin(), sedentary.end(),
                                       [start](const SedentaryEvent &e) { return e.ts >= start; }),
                        sedentary.end());
        standups.erase(std::remove_if(standups.begin(), standups.end(),
                                      [start](const StandupEvent &e) { return e.ts >= start; }),
                       standups.end());
    }
    spdlog::info("Today's records cleared");
    PersistEvents();
    Publish("analytics-updated");
}

// ─────────────────────────────────────
std::size_t ReminderScheduler::NextTipIndex() {
    std::lock_guard<std::mutex> lock(m_StateMutex);
    return m_Tips.Next();
}

// ─────────────────────────────────────
std::string ReminderScheduler::NextTipText() {
    return TipSelector::TipText(NextTipIndex());
}

// ─────────────────────────────────────
ActiveReminder ReminderScheduler::GetActiveReminder() {
    std::lock_guard<std::mutex> lock(m_StateMutex);
    ActiveReminder active;
    active.id = m_State.session.id;
    active.text = m_State.session.tip_text;
    active.theme = m_State.config.theme;
    active.visible = m_State.session.visible;
    return active;
}

// ─────────────────────────────────────
EventLog ReminderScheduler::SnapshotEvents() {
    std::lock_guard<std::mutex> lock(m_StateMutex);
    return m_State.events;
}

// ─────────────────────────────────────
std::uint64_t ReminderScheduler::ElapsedSeconds() {
    std::lock_guard<std::mutex> lock(m_StateMutex);
    return m_State.elapsed_secs;
}

// ─────────────────────────────────────
void ReminderScheduler::PersistConfig() {
    std::lock_guard<std::mutex> persist(m_PersistMutex);
    Config cfg;
    {
        std::lock_guard<std::mutex> lock(m_StateMutex);
        cfg = m_State.config;
    }
    m_Storage.SaveConfig(cfg);
}

// ─────────────────────────────────────
void ReminderScheduler::PersistEvents() {
    std::lock_guard<std::mutex> persist(m_PersistMutex);
    const std::int64_t now = m_Clock.Now();
    EventLog snapshot;
    {
        std::lock_guard<std::mutex> lock(m_StateMutex);
        PruneOldEvents(m_State.events, now);
        snapshot = m_State.events;
    }
    m_Storage.SaveAnalytics(snapshot, now);
}

// ─────────────────────────────────────
void ReminderScheduler::Publish(const std::string &event, const nlohmann::json &payload) {
    EventSink sink;
    {
        std::lock_guard<std::mutex> lock(m_SinkMutex);
        sink = m_Sink;
    }
    spdlog::debug("Event {} {}", event, payload.dump());
    if (sink) {
        sink(event, payload);
    }
}

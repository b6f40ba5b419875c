#pragma once

#include <dbus/dbus.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "reminder.hpp"

// Reminder prompt as a freedesktop notification on the session bus.
class Notification : public ReminderPresenter {
  public:
    using AcknowledgeCallback = std::function<void(bool stoodUp, std::uint64_t reminderId)>;

    Notification();
    ~Notification() override;

    Notification(const Notification &) = delete;
    Notification &operator=(const Notification &) = delete;

    void SetAcknowledgeCallback(AcknowledgeCallback callback);
    void SetWorkArea(std::optional<WorkArea> area);

    // ReminderPresenter
    bool Available() override;
    PromptStatus Status() override;
    std::optional<WorkArea> PrimaryWorkArea() override;
    void Show(const ReminderPrompt &prompt) override;
    void Hide() override;

    void SendNotification(const std::string &icon, const std::string &summary,
                          const std::string &msg);
    // Dispatches ActionInvoked / NotificationClosed signals; call from the main loop.
    void Poll();

  private:
    void AddSignalMatch(const char *member);

  private:
    std::mutex m_Mutex;
    DBusError m_Err;
    DBusConnection *m_Conn = nullptr;

    std::chrono::time_point<std::chrono::system_clock> m_LastNotification;
    std::optional<WorkArea> m_WorkArea;
    AcknowledgeCallback m_OnAcknowledge;

    // Current reminder notification.
    std::uint32_t m_PromptId = 0;
    std::uint64_t m_ReminderId = 0;
    PromptStatus m_PromptStatus = PROMPT_MISSING;
};

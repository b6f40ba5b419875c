#include "notification.hpp"

#include <cstring>
#include <optional>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

constexpr const char *kAppName = "Upstand";
constexpr const char *kNotifyService = "org.freedesktop.Notifications";
constexpr const char *kNotifyPath = "/org/freedesktop/Notifications";
constexpr const char *kNotifyInterface = "org.freedesktop.Notifications";
constexpr int kCallTimeoutMs = 2000;

// NotificationClosed reasons.
constexpr std::uint32_t kClosedExpired = 1;

// ─────────────────────────────────────
void AppendByteHint(DBusMessageIter *hints, const char *key, unsigned char value) {
    DBusMessageIter entry, variant;
    dbus_message_iter_open_container(hints, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, DBUS_TYPE_BYTE_AS_STRING, &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BYTE, &value);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(hints, &entry);
}

// ─────────────────────────────────────
void AppendIntHint(DBusMessageIter *hints, const char *key, int32_t value) {
    DBusMessageIter entry, variant;
    dbus_message_iter_open_container(hints, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, DBUS_TYPE_INT32_AS_STRING,
                                     &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_INT32, &value);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(hints, &entry);
}

// ─────────────────────────────────────
struct NotifyCall {
    std::uint32_t replaces_id = 0;
    const char *icon = "";
    const char *summary = "";
    const char *body = "";
    std::vector<const char *> actions; // id, label pairs
    bool critical = false;
    std::optional<PromptPlacement> placement;
    std::int32_t timeout_ms = -1; // -1: server default, 0: persistent
};

// ─────────────────────────────────────
DBusMessage *BuildNotify(const NotifyCall &call) {
    DBusMessage *m = dbus_message_new_method_call(kNotifyService, kNotifyPath, kNotifyInterface,
                                                  "Notify");
    if (!m) {
        return nullptr;
    }

    DBusMessageIter args;
    dbus_message_iter_init_append(m, &args);

    const char *appName = kAppName;
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &appName);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_UINT32, &call.replaces_id);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &call.icon);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &call.summary);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &call.body);

    DBusMessageIter actions;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "s", &actions);
    for (const char *action : call.actions) {
        dbus_message_iter_append_basic(&actions, DBUS_TYPE_STRING, &action);
    }
    dbus_message_iter_close_container(&args, &actions);

    DBusMessageIter hints;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "{sv}", &hints);
    if (call.critical) {
        AppendByteHint(&hints, "urgency", 2);
    }
    if (call.placement) {
        AppendIntHint(&hints, "x", call.placement->x);
        AppendIntHint(&hints, "y", call.placement->y);
    }
    dbus_message_iter_close_container(&args, &hints);

    dbus_message_iter_append_basic(&args, DBUS_TYPE_INT32, &call.timeout_ms);
    return m;
}

} // namespace

// ─────────────────────────────────────
Notification::Notification() {
    dbus_threads_init_default();
    dbus_error_init(&m_Err);
    m_Conn = dbus_bus_get(DBUS_BUS_SESSION, &m_Err);
    if (dbus_error_is_set(&m_Err) || !m_Conn) {
        spdlog::error("Failed to connect to session bus: {}",
                      m_Err.message ? m_Err.message : "unknown error");
        dbus_error_free(&m_Err);
        m_Conn = nullptr;
        return;
    }

    AddSignalMatch("ActionInvoked");
    AddSignalMatch("NotificationClosed");
}

// ─────────────────────────────────────
Notification::~Notification() {
    if (m_Conn) {
        dbus_connection_unref(m_Conn);
        m_Conn = nullptr;
    }

    if (dbus_error_is_set(&m_Err)) {
        dbus_error_free(&m_Err);
    }
}

// ─────────────────────────────────────
void Notification::AddSignalMatch(const char *member) {
    const std::string rule = std::string("type='signal',interface='") + kNotifyInterface +
                             "',member='" + member + "'";
    DBusError err;
    dbus_error_init(&err);
    dbus_bus_add_match(m_Conn, rule.c_str(), &err);
    if (dbus_error_is_set(&err)) {
        spdlog::warn("Cannot subscribe to {}: {}", member, err.message);
        dbus_error_free(&err);
    }
}

// ─────────────────────────────────────
void Notification::SetAcknowledgeCallback(AcknowledgeCallback callback) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_OnAcknowledge = std::move(callback);
}

// ─────────────────────────────────────
void Notification::SetWorkArea(std::optional<WorkArea> area) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_WorkArea = area;
}

// ─────────────────────────────────────
bool Notification::Available() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Conn != nullptr;
}

// ─────────────────────────────────────
PromptStatus Notification::Status() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (!m_Conn) {
        return PROMPT_MISSING;
    }
    return m_PromptStatus;
}

// ─────────────────────────────────────
std::optional<WorkArea> Notification::PrimaryWorkArea() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_WorkArea;
}

// ─────────────────────────────────────
void Notification::Show(const ReminderPrompt &prompt) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (!m_Conn) {
        return;
    }

    NotifyCall call;
    call.replaces_id = m_PromptStatus == PROMPT_MISSING ? 0 : m_PromptId;
    call.icon = prompt.theme == THEME_DAY ? "dialog-information" : "dialog-warning";
    call.summary = "Time to stand up";
    call.body = prompt.text.c_str();
    call.actions = {"stood_up", "I stood up", "later", "Not now"};
    call.critical = true;
    call.placement = prompt.placement;
    call.timeout_ms = 0;

    DBusMessage *m = BuildNotify(call);
    if (!m) {
        spdlog::error("Failed to create DBus message");
        m_PromptStatus = PROMPT_MISSING;
        return;
    }

    DBusError err;
    dbus_error_init(&err);
    DBusMessage *reply = dbus_connection_send_with_reply_and_block(m_Conn, m, kCallTimeoutMs, &err);
    dbus_message_unref(m);

    if (!reply) {
        spdlog::error("Notify failed: {}", dbus_error_is_set(&err) ? err.message : "no reply");
        dbus_error_free(&err);
        m_PromptStatus = PROMPT_MISSING;
        return;
    }

    std::uint32_t notifId = 0;
    if (!dbus_message_get_args(reply, nullptr, DBUS_TYPE_UINT32, &notifId, DBUS_TYPE_INVALID)) {
        spdlog::warn("Notify reply carried no id");
    }
    dbus_message_unref(reply);

    m_PromptId = notifId;
    m_ReminderId = prompt.id;
    m_PromptStatus = PROMPT_VISIBLE;
    spdlog::debug("Reminder {} shown as notification {}", prompt.id, notifId);
}

// ─────────────────────────────────────
void Notification::Hide() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (!m_Conn || m_PromptId == 0 || m_PromptStatus == PROMPT_MISSING) {
        return;
    }

    DBusMessage *m = dbus_message_new_method_call(kNotifyService, kNotifyPath, kNotifyInterface,
                                                  "CloseNotification");
    if (m) {
        dbus_message_append_args(m, DBUS_TYPE_UINT32, &m_PromptId, DBUS_TYPE_INVALID);
        if (!dbus_connection_send(m_Conn, m, nullptr)) {
            spdlog::error("Failed to send CloseNotification");
        }
        dbus_connection_flush(m_Conn);
        dbus_message_unref(m);
    }
    m_PromptStatus = PROMPT_MISSING;
    m_PromptId = 0;
}

// ─────────────────────────────────────
void Notification::SendNotification(const std::string &icon, const std::string &summary,
                                    const std::string &msg) {
    const auto minGap = std::chrono::seconds(3);

    std::lock_guard<std::mutex> lock(m_Mutex);
    if (!m_Conn) {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    if (now - m_LastNotification < minGap) {
        spdlog::debug("Notification skipped: rate limit exceeded");
        return;
    }

    NotifyCall call;
    call.icon = icon.c_str();
    call.summary = summary.c_str();
    call.body = msg.c_str();
    call.timeout_ms = 3000;

    DBusMessage *m = BuildNotify(call);
    if (!m) {
        spdlog::error("Failed to create DBus message");
        return;
    }
    if (!dbus_connection_send(m_Conn, m, nullptr)) {
        spdlog::error("Failed to send notification '{}'", summary);
        dbus_message_unref(m);
        return;
    }
    dbus_connection_flush(m_Conn);
    dbus_message_unref(m);
    m_LastNotification = now;
}

// ─────────────────────────────────────
void Notification::Poll() {
    std::vector<std::pair<bool, std::uint64_t>> answers;
    AcknowledgeCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (!m_Conn) {
            return;
        }
        dbus_connection_read_write(m_Conn, 0);

        DBusMessage *msg;
        while ((msg = dbus_connection_pop_message(m_Conn)) != nullptr) {
            if (dbus_message_is_signal(msg, kNotifyInterface, "ActionInvoked")) {
                uint32_t id = 0;
                const char *action = "";
                if (dbus_message_get_args(msg, nullptr, DBUS_TYPE_UINT32, &id, DBUS_TYPE_STRING,
                                          &action, DBUS_TYPE_INVALID) &&
                    id == m_PromptId && m_PromptStatus != PROMPT_MISSING) {
                    answers.emplace_back(strcmp(action, "stood_up") == 0, m_ReminderId);
                    // Kept re-showable in case the answer is debounced.
                    m_PromptStatus = PROMPT_HIDDEN;
                }
            } else if (dbus_message_is_signal(msg, kNotifyInterface, "NotificationClosed")) {
                uint32_t id = 0;
                uint32_t reason = 0;
                if (dbus_message_get_args(msg, nullptr, DBUS_TYPE_UINT32, &id, DBUS_TYPE_UINT32,
                                          &reason, DBUS_TYPE_INVALID) &&
                    id == m_PromptId && m_PromptStatus == PROMPT_VISIBLE) {
                    m_PromptStatus = reason == kClosedExpired ? PROMPT_HIDDEN : PROMPT_MISSING;
                    spdlog::debug("Notification {} closed (reason {})", id, reason);
                }
            }
            dbus_message_unref(msg);
        }
        callback = m_OnAcknowledge;
    }

    // Outside the lock: acknowledging hides the prompt, which takes it again.
    for (const auto &answer : answers) {
        if (callback) {
            callback(answer.first, answer.second);
        }
    }
}

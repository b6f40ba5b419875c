#include "upstand.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "analytics.hpp"
#include "exporter.hpp"
#include "tips.hpp"

namespace {

// ─────────────────────────────────────
void SendJson(httplib::Response &res, const nlohmann::json &body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

// ─────────────────────────────────────
void SendError(httplib::Response &res, int status, const std::string &code,
               const std::string &message) {
    SendJson(res, {{"error", code}, {"message", message}}, status);
}

// ─────────────────────────────────────
int ExportHttpStatus(ExportStatus status) {
    switch (status) {
    case EXPORT_OK:
        return 200;
    case EXPORT_NOT_ENOUGH_DATA:
        return 422;
    case EXPORT_INVALID_PAYLOAD:
    case EXPORT_DECODE_FAILED:
        return 400;
    case EXPORT_WRITE_FAILED:
    case EXPORT_NO_EXPORT_DIR:
        return 500;
    }
    return 500;
}

// ─────────────────────────────────────
nlohmann::json ParseBody(const httplib::Request &req) {
    if (req.body.empty()) {
        return nlohmann::json::object();
    }
    nlohmann::json body = nlohmann::json::parse(req.body);
    if (!body.is_object()) {
        throw std::runtime_error("request body must be a JSON object");
    }
    return body;
}

} // namespace

// ─────────────────────────────────────
Upstand::Upstand(unsigned port, LogLevel log_level, std::filesystem::path dataDir,
                 std::optional<WorkArea> workArea)
    : m_Port(port) {

    if (log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }

    if (dataDir.empty()) {
        dataDir = Storage::DefaultDataDir();
    }
    spdlog::info("Data directory: {}", dataDir.string());

    // Storage
    m_Storage = std::make_unique<Storage>(dataDir, Storage::LegacyDirFor(dataDir));

    // Notifications
    m_Notification = std::make_unique<Notification>();
    m_Notification->SetWorkArea(workArea);
    spdlog::info("Notification system initialized");

    // Scheduler
    m_Scheduler =
        std::make_unique<ReminderScheduler>(*m_Storage, m_Notification.get(), m_Clock, m_Tz);
    m_Scheduler->SetEventSink([this](const std::string &event, const nlohmann::json &payload) {
        RecordEvent(event, payload);
    });
    m_Scheduler->Load();

    m_Notification->SetAcknowledgeCallback([this](bool stoodUp, std::uint64_t reminderId) {
        m_Scheduler->Acknowledge(stoodUp, reminderId);
    });
}

// ─────────────────────────────────────
Upstand::~Upstand() {
    if (m_Scheduler) {
        m_Scheduler->Stop();
    }

    m_Server.stop();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
}

// ─────────────────────────────────────
bool Upstand::Start() {
    if (!InitServer()) {
        return false;
    }
    spdlog::info("Serving on: http://127.0.0.1:{}", m_Port);

    m_Scheduler->Start();
    m_Notification->SendNotification(
        "dialog-information", "Upstand",
        fmt::format("Reminding you every {} minutes", m_Scheduler->GetInterval()));
    return true;
}

// ─────────────────────────────────────
void Upstand::Run(const std::atomic<bool> &shutdown) {
    while (!shutdown.load()) {
        m_Notification->Poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(NOTIFICATION_POLL_MS));
    }
    spdlog::info("Shutting down");
}

// ─────────────────────────────────────
void Upstand::RecordEvent(const std::string &event, const nlohmann::json &payload) {
    std::lock_guard<std::mutex> lock(m_FeedMutex);
    m_Feed.push_back({++m_FeedSeq, event, payload});
    while (m_Feed.size() > EVENT_FEED_CAPACITY) {
        m_Feed.pop_front();
    }
}

// ─────────────────────────────────────
nlohmann::json Upstand::EventsSince(std::uint64_t since) {
    std::lock_guard<std::mutex> lock(m_FeedMutex);
    nlohmann::json events = nlohmann::json::array();
    for (const FeedEntry &entry : m_Feed) {
        if (entry.seq > since) {
            events.push_back(
                nlohmann::json{{"seq", entry.seq}, {"event", entry.event}, {"payload", entry.payload}});
        }
    }
    return {{"seq", m_FeedSeq}, {"events", events}};
}

// ─────────────────────────────────────
bool Upstand::InitServer() {
    m_Server.set_keep_alive_max_count(1);
    m_Server.set_keep_alive_timeout(1);
    m_Server.set_payload_max_length(16 * 1024 * 1024); // heatmap data URLs

    m_Server.set_read_timeout(5, 0);
    m_Server.set_write_timeout(5, 0);
    m_Server.set_idle_interval(1, 0);

    // clang-format off
    // Settings
    {
        m_Server.Get("/api/v1/interval", [this](const httplib::Request &, httplib::Response &res) {
            SendJson(res, {{"minutes", m_Scheduler->GetInterval()}});
        });

        m_Server.Post("/api/v1/interval", [this](const httplib::Request &req, httplib::Response &res) {
            try {
                nlohmann::json body = ParseBody(req);
                if (!body.contains("minutes") || !body["minutes"].is_number_integer()) {
                    SendError(res, 400, "INVALID_REQUEST", "minutes must be an integer");
                    return;
                }
                const unsigned minutes = m_Scheduler->SetInterval(body["minutes"].get<long long>());
                SendJson(res, {{"minutes", minutes}});
            } catch (const std::exception &e) {
                SendError(res, 400, "INVALID_REQUEST", e.what());
            }
        });

        m_Server.Get("/api/v1/language", [this](const httplib::Request &, httplib::Response &res) {
            SendJson(res, {{"language", LanguageName(m_Scheduler->GetLanguage())}});
        });

        m_Server.Post("/api/v1/language", [this](const httplib::Request &req, httplib::Response &res) {
            try {
                nlohmann::json body = ParseBody(req);
                const Language lang = m_Scheduler->SetLanguage(body.value("language", std::string()));
                SendJson(res, {{"language", LanguageName(lang)}});
            } catch (const std::exception &e) {
                SendError(res, 400, "INVALID_REQUEST", e.what());
            }
        });

        m_Server.Get("/api/v1/reminder-language", [this](const httplib::Request &, httplib::Response &res) {
            SendJson(res, {{"language", LanguageName(m_Scheduler->GetReminderLanguage())}});
        });

        m_Server.Post("/api/v1/reminder-language", [this](const httplib::Request &req, httplib::Response &res) {
            try {
                nlohmann::json body = ParseBody(req);
                const Language lang =
                    m_Scheduler->SetReminderLanguage(body.value("language", std::string()));
                SendJson(res, {{"language", LanguageName(lang)}});
            } catch (const std::exception &e) {
                SendError(res, 400, "INVALID_REQUEST", e.what());
            }
        });

        m_Server.Get("/api/v1/theme", [this](const httplib::Request &, httplib::Response &res) {
            SendJson(res, {{"theme", ThemeName(m_Scheduler->GetTheme())}});
        });

        m_Server.Post("/api/v1/theme", [this](const httplib::Request &req, httplib::Response &res) {
            try {
                nlohmann::json body = ParseBody(req);
                const Theme theme = m_Scheduler->SetTheme(body.value("theme", std::string()));
                SendJson(res, {{"theme", ThemeName(theme)}});
            } catch (const std::exception &e) {
                SendError(res, 400, "INVALID_REQUEST", e.what());
            }
        });

        m_Server.Get("/api/v1/system/language", [](const httplib::Request &, httplib::Response &res) {
            SendJson(res, {{"language", LanguageName(GetSystemLanguage())}});
        });
    }

    // Reminder
    {
        m_Server.Post("/api/v1/standup", [this](const httplib::Request &, httplib::Response &res) {
            SendJson(res, {{"count", m_Scheduler->LogStandup()}});
        });

        m_Server.Post("/api/v1/reminder/acknowledge", [this](const httplib::Request &req, httplib::Response &res) {
            try {
                nlohmann::json body = ParseBody(req);
                if (!body.contains("stood_up") || !body["stood_up"].is_boolean()) {
                    SendError(res, 400, "INVALID_REQUEST", "stood_up must be a boolean");
                    return;
                }
                std::optional<std::uint64_t> reminderId;
                if (body.contains("reminder_id") && !body["reminder_id"].is_null()) {
                    reminderId = body["reminder_id"].get<std::uint64_t>();
                }
                m_Scheduler->Acknowledge(body["stood_up"].get<bool>(), reminderId);
                SendJson(res, {{"status", "ok"}});
            } catch (const std::exception &e) {
                SendError(res, 400, "INVALID_REQUEST", e.what());
            }
        });

        m_Server.Get("/api/v1/reminder/active", [this](const httplib::Request &, httplib::Response &res) {
            const ActiveReminder active = m_Scheduler->GetActiveReminder();
            SendJson(res, {{"id", active.id},
                           {"text", active.text},
                           {"theme", ThemeName(active.theme)},
                           {"visible", active.visible}});
        });

        m_Server.Get("/api/v1/tips/next", [this](const httplib::Request &, httplib::Response &res) {
            const std::size_t index = m_Scheduler->NextTipIndex();
            SendJson(res, {{"index", index}, {"text", TipSelector::TipText(index)}});
        });
    }

    // Analytics
    {
        m_Server.Get("/api/v1/standups/count", [this](const httplib::Request &, httplib::Response &res) {
            SendJson(res, {{"count", m_Scheduler->GetStandupCount()}});
        });

        m_Server.Get("/api/v1/analytics", [this](const httplib::Request &req, httplib::Response &res) {
            const Period period = ParsePeriod(req.get_param_value("period"));
            nlohmann::json body = AnalyticsToJson(m_Scheduler->GetAnalytics(period));
            body["period"] = PeriodName(period);
            SendJson(res, body);
        });

        m_Server.Post("/api/v1/records/reset-today", [this](const httplib::Request &, httplib::Response &res) {
            m_Scheduler->ResetDailyRecords();
            SendJson(res, {{"status", "ok"}});
        });

        m_Server.Post("/api/v1/export/csv", [this](const httplib::Request &req, httplib::Response &res) {
            try {
                nlohmann::json body = ParseBody(req);
                const Period period = ParsePeriod(body.value("period", std::string()));
                const AnalyticsData data = m_Scheduler->GetAnalytics(period);

                std::filesystem::path out;
                std::string error;
                const ExportStatus status = ExportCsv(data, period, ResolveExportDir(m_Storage->DataDir()),
                                                      m_Clock.Now(), out, error);
                if (status != EXPORT_OK) {
                    SendError(res, ExportHttpStatus(status), ExportStatusCode(status), error);
                    return;
                }
                m_Notification->SendNotification("document-save", "Upstand",
                                                 "Analytics exported to " + out.string());
                SendJson(res, {{"path", out.string()}});
            } catch (const std::exception &e) {
                SendError(res, 400, "INVALID_REQUEST", e.what());
            }
        });

        m_Server.Post("/api/v1/export/png", [this](const httplib::Request &req, httplib::Response &res) {
            try {
                nlohmann::json body = ParseBody(req);
                std::filesystem::path out;
                std::string error;
                const ExportStatus status =
                    ExportPng(body.value("data_url", std::string()),
                              ResolveExportDir(m_Storage->DataDir()), m_Clock.Now(), out, error);
                if (status != EXPORT_OK) {
                    SendError(res, ExportHttpStatus(status), ExportStatusCode(status), error);
                    return;
                }
                m_Notification->SendNotification("document-save", "Upstand",
                                                 "Heatmap exported to " + out.string());
                SendJson(res, {{"path", out.string()}});
            } catch (const std::exception &e) {
                SendError(res, 400, "INVALID_REQUEST", e.what());
            }
        });
    }

    // Event feed
    {
        m_Server.Get("/api/v1/events", [this](const httplib::Request &req, httplib::Response &res) {
            try {
                std::uint64_t since = 0;
                if (req.has_param("since")) {
                    since = std::stoull(req.get_param_value("since"));
                }
                SendJson(res, EventsSince(since));
            } catch (const std::exception &) {
                SendError(res, 400, "INVALID_REQUEST", "since must be a sequence number");
            }
        });
    }
    // clang-format on

    const std::string host = "127.0.0.1";
    int port = static_cast<int>(m_Port);
    if (!m_Server.bind_to_port(host, port)) {
        spdlog::error("Cannot bind {}:{}", host, port);
        return false;
    }
    m_Thread = std::thread([this] { m_Server.listen_after_bind(); });
    return true;
}

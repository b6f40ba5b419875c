#include "storage.hpp"

#include "analytics.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
Storage::Storage(std::filesystem::path dataDir, std::filesystem::path legacyDir)
    : m_DataDir(std::move(dataDir)), m_LegacyDir(std::move(legacyDir)) {
    spdlog::debug("Storage: data dir {}, legacy dir {}", m_DataDir.string(), m_LegacyDir.string());
}

// ─────────────────────────────────────
std::filesystem::path Storage::DefaultDataDir() {
    const char *xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return std::filesystem::path(xdgDataHome) / "upstand";
    }
    const char *home = std::getenv("HOME");
    if (!home || !*home) {
        spdlog::warn("HOME is not set, keeping data in the working directory");
        return std::filesystem::current_path() / ".upstand";
    }
    return std::filesystem::path(home) / ".local" / "share" / "upstand";
}

// ─────────────────────────────────────
std::filesystem::path Storage::LegacyDirFor(const std::filesystem::path &dataDir) {
    return dataDir.parent_path() / "standby";
}

// ─────────────────────────────────────
std::filesystem::path Storage::ConfigPath() const {
    return m_DataDir / "config.json";
}

// ─────────────────────────────────────
std::filesystem::path Storage::AnalyticsPath() const {
    return m_DataDir / "analytics.json";
}

// ─────────────────────────────────────
bool Storage::ReadDocument(const std::filesystem::path &path, nlohmann::json &out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::warn("Storage: cannot open {}", path.string());
        return false;
    }
    std::string body((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (!m_JsonParse.ParseDocument(body, out)) {
        spdlog::warn("Storage: {} is not valid JSON, ignoring it", path.string());
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool Storage::WriteDocument(const std::filesystem::path &path, const nlohmann::json &doc) {
    std::lock_guard<std::mutex> lock(m_WriteMutex);

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        spdlog::warn("Storage: cannot create {}: {}", path.parent_path().string(), ec.message());
    }

    // Written beside the target and renamed over it, so a torn write never replaces a good file.
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::warn("Storage: cannot write {}", tmp.string());
            return false;
        }
        file << doc.dump(2);
        file.flush();
        if (!file) {
            spdlog::warn("Storage: short write on {}", tmp.string());
            file.close();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        spdlog::warn("Storage: cannot replace {}: {}", path.string(), ec.message());
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool Storage::ParseConfig(const nlohmann::json &doc, Config &out) {
    if (!doc.is_object()) {
        return false;
    }
    out.interval_minutes = NormalizeIntervalMinutes(
        m_JsonParse.GetInt(doc, "interval_minutes", kDefaultIntervalMinutes));
    out.ui_language = ParseLanguage(m_JsonParse.GetString(doc, "language", "en"));
    out.reminder_language = ParseLanguage(m_JsonParse.GetString(doc, "reminder_language", "en"));
    out.theme = ParseTheme(m_JsonParse.GetString(doc, "theme", "night"));
    return true;
}

// ─────────────────────────────────────
bool Storage::ParseAnalytics(const nlohmann::json &doc, EventLog &out) {
    if (!doc.is_object()) {
        return false;
    }
    auto reminders = doc.find("reminder_events");
    auto standups = doc.find("standup_events");
    if (reminders == doc.end() || !reminders->is_array() || standups == doc.end() ||
        !standups->is_array()) {
        return false;
    }

    EventLog log;
    for (const auto &entry : *reminders) {
        if (!entry.is_object()) {
            return false;
        }
        auto ts = entry.find("ts");
        auto duration = entry.find("duration_secs");
        if (ts == entry.end() || !ts->is_number_integer() || duration == entry.end() ||
            !duration->is_number_unsigned()) {
            return false;
        }
        log.sedentary.push_back({ts->get<std::int64_t>(), duration->get<std::uint64_t>()});
    }
    for (const auto &entry : *standups) {
        if (!entry.is_number_integer()) {
            return false;
        }
        log.standups.push_back({entry.get<std::int64_t>()});
    }

    out = std::move(log);
    return true;
}

// ─────────────────────────────────────
Config Storage::LoadConfig() {
    Config cfg;
    nlohmann::json doc;

    if (ReadDocument(ConfigPath(), doc) && ParseConfig(doc, cfg)) {
        spdlog::debug("Config loaded from {}", ConfigPath().string());
    } else if (ReadDocument(m_LegacyDir / "config.json", doc) && ParseConfig(doc, cfg)) {
        spdlog::info("Config migrated from legacy directory {}", m_LegacyDir.string());
    } else {
        cfg = Config{};
        spdlog::info("No usable config found, using defaults");
    }

    // Rewrite the normalized config so corrupt or outdated files heal on first load.
    SaveConfig(cfg);
    return cfg;
}

// ─────────────────────────────────────
void Storage::SaveConfig(unsigned minutes, Language uiLanguage, Language reminderLanguage,
                         Theme theme) {
    nlohmann::json doc = {
        {"interval_minutes", minutes},
        {"language", LanguageName(uiLanguage)},
        {"reminder_language", LanguageName(reminderLanguage)},
        {"theme", ThemeName(theme)},
    };
    if (WriteDocument(ConfigPath(), doc)) {
        spdlog::debug("Config saved: interval={}min language={} reminder_language={} theme={}",
                      minutes, LanguageName(uiLanguage), LanguageName(reminderLanguage),
                      ThemeName(theme));
    }
}

// ─────────────────────────────────────
void Storage::SaveConfig(const Config &cfg) {
    SaveConfig(cfg.interval_minutes, cfg.ui_language, cfg.reminder_language, cfg.theme);
}

// ─────────────────────────────────────
EventLog Storage::LoadAnalytics(std::int64_t now) {
    EventLog log;
    nlohmann::json doc;

    if (ReadDocument(AnalyticsPath(), doc) && ParseAnalytics(doc, log)) {
        spdlog::debug("Analytics loaded from {}", AnalyticsPath().string());
    } else if (ReadDocument(m_LegacyDir / "analytics.json", doc) && ParseAnalytics(doc, log)) {
        spdlog::info("Analytics migrated from legacy directory {}", m_LegacyDir.string());
    } else {
        log = EventLog{};
    }

    PruneOldEvents(log, now);
    spdlog::info("Loaded {} sedentary and {} standup events", log.sedentary.size(),
                 log.standups.size());
    return log;
}

// ─────────────────────────────────────
void Storage::SaveAnalytics(const EventLog &log, std::int64_t now) {
    EventLog pruned = log;
    PruneOldEvents(pruned, now);

    nlohmann::json reminders = nlohmann::json::array();
    for (const auto &event : pruned.sedentary) {
        reminders.push_back({{"ts", event.ts}, {"duration_secs", event.duration_secs}});
    }
    nlohmann::json standups = nlohmann::json::array();
    for (const auto &event : pruned.standups) {
        standups.push_back(event.ts);
    }

    nlohmann::json doc = {{"reminder_events", reminders}, {"standup_events", standups}};
    WriteDocument(AnalyticsPath(), doc);
}

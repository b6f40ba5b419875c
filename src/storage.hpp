#pragma once

#include <filesystem>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "common.hpp"
#include "json.hpp"

// config.json and analytics.json under the data directory, with read fallback to the
// pre-migration directory. Never throws: missing or malformed files read as defaults.
class Storage {
  public:
    Storage(std::filesystem::path dataDir, std::filesystem::path legacyDir);

    // $XDG_DATA_HOME/upstand, or ~/.local/share/upstand.
    static std::filesystem::path DefaultDataDir();
    static std::filesystem::path LegacyDirFor(const std::filesystem::path &dataDir);

    Config LoadConfig();
    void SaveConfig(unsigned minutes, Language uiLanguage, Language reminderLanguage, Theme theme);
    void SaveConfig(const Config &cfg);

    EventLog LoadAnalytics(std::int64_t now);
    void SaveAnalytics(const EventLog &log, std::int64_t now);

    const std::filesystem::path &DataDir() const {
        return m_DataDir;
    }

  private:
    std::filesystem::path ConfigPath() const;
    std::filesystem::path AnalyticsPath() const;

    bool ReadDocument(const std::filesystem::path &path, nlohmann::json &out);
    bool WriteDocument(const std::filesystem::path &path, const nlohmann::json &doc);
    bool ParseConfig(const nlohmann::json &doc, Config &out);
    bool ParseAnalytics(const nlohmann::json &doc, EventLog &out);

  private:
    std::filesystem::path m_DataDir;
    std::filesystem::path m_LegacyDir;
    std::mutex m_WriteMutex;
    JsonParse m_JsonParse;
};

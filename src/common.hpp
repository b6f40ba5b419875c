#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum Language { LANG_EN = 1, LANG_ZH_CN = 2 };

enum Theme { THEME_DAY = 1, THEME_NIGHT = 2 };

enum Period { PERIOD_DAILY = 1, PERIOD_WEEKLY = 2, PERIOD_MONTHLY = 3 };

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

constexpr int kHours = 24;
constexpr std::int64_t kSecondsPerDay = 24 * 60 * 60;
constexpr std::int64_t kRetentionSecs = 180 * kSecondsPerDay;
constexpr unsigned kDefaultIntervalMinutes = 50;
constexpr unsigned kAllowedIntervalMinutes[] = {5, 10, 20, 30, 50};
constexpr unsigned kMinExportRecords = 5;

struct SedentaryEvent {
    std::int64_t ts = 0;
    std::uint64_t duration_secs = 0;
};

struct StandupEvent {
    std::int64_t ts = 0;
};

struct EventLog {
    std::vector<SedentaryEvent> sedentary;
    std::vector<StandupEvent> standups;
};

struct Config {
    unsigned interval_minutes = kDefaultIntervalMinutes;
    Language ui_language = LANG_EN;
    Language reminder_language = LANG_EN;
    Theme theme = THEME_NIGHT;
};

unsigned NormalizeIntervalMinutes(long long minutes);
Language ParseLanguage(const std::string &value);
Theme ParseTheme(const std::string &value);
std::string LanguageName(Language lang);
std::string ThemeName(Theme theme);

// Host locale from LC_ALL / LC_MESSAGES / LANG: "zh*" maps to zh-CN, the rest to en.
Language GetSystemLanguage();

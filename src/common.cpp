#include "common.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

// ─────────────────────────────────────
unsigned NormalizeIntervalMinutes(long long minutes) {
    for (unsigned allowed : kAllowedIntervalMinutes) {
        if (minutes == static_cast<long long>(allowed)) {
            return allowed;
        }
    }
    return kDefaultIntervalMinutes;
}

// ─────────────────────────────────────
Language ParseLanguage(const std::string &value) {
    return value == "zh-CN" ? LANG_ZH_CN : LANG_EN;
}

// ─────────────────────────────────────
Theme ParseTheme(const std::string &value) {
    return value == "day" ? THEME_DAY : THEME_NIGHT;
}

// ─────────────────────────────────────
std::string LanguageName(Language lang) {
    return lang == LANG_ZH_CN ? "zh-CN" : "en";
}

// ─────────────────────────────────────
std::string ThemeName(Theme theme) {
    return theme == THEME_DAY ? "day" : "night";
}

// ─────────────────────────────────────
Language GetSystemLanguage() {
    std::string locale = "en-US";
    for (const char *var : {"LC_ALL", "LC_MESSAGES", "LANG"}) {
        const char *value = std::getenv(var);
        if (value && *value) {
            locale = value;
            break;
        }
    }

    std::transform(locale.begin(), locale.end(), locale.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return locale.rfind("zh", 0) == 0 ? LANG_ZH_CN : LANG_EN;
}

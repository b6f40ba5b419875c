#include "exporter.hpp"

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <optional>

#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace {

constexpr const char *kPngDataUrlPrefix = "data:image/png;base64,";

// ─────────────────────────────────────
std::string FileStamp(std::int64_t now) {
    const std::time_t t = static_cast<std::time_t>(now);
    std::tm tm{};
    if (!localtime_r(&t, &tm)) {
        return std::to_string(now);
    }
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}

// ─────────────────────────────────────
std::filesystem::path HomeDir() {
    const char *home = std::getenv("HOME");
    if (!home || !*home) {
        return {};
    }
    return home;
}

// ─────────────────────────────────────
// XDG user directory, from the environment or user-dirs.dirs ("$HOME/..." entries).
std::optional<std::filesystem::path> XdgUserDir(const std::string &key) {
    const char *env = std::getenv(key.c_str());
    if (env && *env) {
        return std::filesystem::path(env);
    }

    const std::filesystem::path home = HomeDir();
    std::filesystem::path configHome;
    const char *xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = xdgConfigHome;
    } else if (!home.empty()) {
        configHome = home / ".config";
    } else {
        return std::nullopt;
    }

    std::ifstream file(configHome / "user-dirs.dirs");
    std::string line;
    const std::string prefix = key + "=\"";
    while (std::getline(file, line)) {
        if (line.rfind(prefix, 0) != 0 || line.size() <= prefix.size() || line.back() != '"') {
            continue;
        }
        std::string value = line.substr(prefix.size(), line.size() - prefix.size() - 1);
        if (value.rfind("$HOME", 0) == 0) {
            if (home.empty()) {
                return std::nullopt;
            }
            value = home.string() + value.substr(5);
        }
        if (value.empty() || value == home.string() || value == home.string() + "/") {
            // xdg-user-dirs points disabled entries at $HOME itself.
            return std::nullopt;
        }
        return std::filesystem::path(value);
    }
    return std::nullopt;
}

// ─────────────────────────────────────
std::optional<std::filesystem::path> UserDir(const std::string &key, const char *fallbackName) {
    if (auto dir = XdgUserDir(key)) {
        return dir;
    }
    const std::filesystem::path home = HomeDir();
    if (home.empty()) {
        return std::nullopt;
    }
    std::error_code ec;
    const std::filesystem::path candidate = home / fallbackName;
    if (std::filesystem::is_directory(candidate, ec)) {
        return candidate;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
bool WriteBytes(const std::filesystem::path &path, const char *data, std::size_t size,
                std::string &error) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        error = "write failed: cannot open " + path.string();
        return false;
    }
    file.write(data, static_cast<std::streamsize>(size));
    file.flush();
    if (!file) {
        error = "write failed: " + path.string();
        return false;
    }
    return true;
}

} // namespace

// ─────────────────────────────────────
std::string ExportStatusCode(ExportStatus status) {
    switch (status) {
    case EXPORT_OK:
        return "OK";
    case EXPORT_NOT_ENOUGH_DATA:
        return "NOT_ENOUGH_DATA";
    case EXPORT_INVALID_PAYLOAD:
        return "INVALID_PAYLOAD";
    case EXPORT_DECODE_FAILED:
        return "DECODE_FAILED";
    case EXPORT_WRITE_FAILED:
        return "WRITE_FAILED";
    case EXPORT_NO_EXPORT_DIR:
        return "NO_EXPORT_DIR";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────
std::string BuildCsv(const AnalyticsData &data) {
    std::string csv = "hour,sedentary_sessions,standup_sessions";
    for (int hour = 0; hour < kHours; ++hour) {
        csv += fmt::format("\n{:02}:00,{},{}", hour, data.hourly_sedentary[hour],
                           data.hourly_standup[hour]);
    }
    csv += fmt::format("\ntotals,{},{}", data.sedentary_sessions, data.standup_sessions);
    csv += fmt::format("\ntotal_sitting_minutes,{},", data.total_sitting_secs / 60);
    return csv;
}

// ─────────────────────────────────────
std::filesystem::path ResolveExportDir(const std::filesystem::path &appDataDir) {
    if (auto downloads = UserDir("XDG_DOWNLOAD_DIR", "Downloads")) {
        return *downloads;
    }
    if (auto desktop = UserDir("XDG_DESKTOP_DIR", "Desktop")) {
        return *desktop;
    }
    return appDataDir;
}

// ─────────────────────────────────────
ExportStatus ExportCsv(const AnalyticsData &data, Period period, const std::filesystem::path &dir,
                       std::int64_t now, std::filesystem::path &out, std::string &error) {
    if (data.record_count < kMinExportRecords) {
        error = fmt::format("NOT_ENOUGH_DATA:{}", kMinExportRecords);
        return EXPORT_NOT_ENOUGH_DATA;
    }
    if (dir.empty()) {
        error = "cannot resolve export directory";
        return EXPORT_NO_EXPORT_DIR;
    }

    const std::string csv = BuildCsv(data);
    const std::filesystem::path path =
        dir / fmt::format("upstand_{}_analytics_{}.csv", PeriodName(period), FileStamp(now));
    if (!WriteBytes(path, csv.data(), csv.size(), error)) {
        spdlog::error("CSV export failed: {}", error);
        return EXPORT_WRITE_FAILED;
    }

    spdlog::info("Analytics exported to {}", path.string());
    out = path;
    return EXPORT_OK;
}

// ─────────────────────────────────────
ExportStatus ExportPng(const std::string &dataUrl, const std::filesystem::path &dir,
                       std::int64_t now, std::filesystem::path &out, std::string &error) {
    const std::string prefix = kPngDataUrlPrefix;
    if (dataUrl.compare(0, prefix.size(), prefix) != 0) {
        error = "invalid png payload";
        return EXPORT_INVALID_PAYLOAD;
    }

    std::vector<unsigned char> bytes;
    if (!DecodeBase64(dataUrl.substr(prefix.size()), bytes)) {
        error = "decode failed: malformed base64";
        return EXPORT_DECODE_FAILED;
    }
    if (dir.empty()) {
        error = "cannot resolve export directory";
        return EXPORT_NO_EXPORT_DIR;
    }

    const std::filesystem::path path =
        dir / fmt::format("upstand_24h_heatmap_{}.png", FileStamp(now));
    if (!WriteBytes(path, reinterpret_cast<const char *>(bytes.data()), bytes.size(), error)) {
        spdlog::error("PNG export failed: {}", error);
        return EXPORT_WRITE_FAILED;
    }

    spdlog::info("Heatmap exported to {}", path.string());
    out = path;
    return EXPORT_OK;
}

// ─────────────────────────────────────
bool DecodeBase64(const std::string &text, std::vector<unsigned char> &out) {
    out.clear();
    if (text.empty()) {
        return true;
    }
    if (text.size() % 4 != 0) {
        return false;
    }
    // Padding may only close the last group, and never fills more than two of its slots.
    const std::size_t firstPad = text.find('=');
    if (firstPad != std::string::npos) {
        if (firstPad < text.size() - 2 ||
            text.find_first_not_of('=', firstPad) != std::string::npos) {
            return false;
        }
    }

    out.resize(text.size() / 4 * 3);
    const int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char *>(text.data()),
                                        static_cast<int>(text.size()));
    if (written < 0) {
        out.clear();
        return false;
    }

    // EVP_DecodeBlock counts padding as zero bytes.
    std::size_t padding = 0;
    if (text[text.size() - 1] == '=') {
        padding++;
        if (text[text.size() - 2] == '=') {
            padding++;
        }
    }
    out.resize(static_cast<std::size_t>(written) - padding);
    return true;
}

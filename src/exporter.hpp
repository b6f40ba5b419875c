#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "analytics.hpp"

enum ExportStatus {
    EXPORT_OK = 0,
    EXPORT_NOT_ENOUGH_DATA,
    EXPORT_INVALID_PAYLOAD,
    EXPORT_DECODE_FAILED,
    EXPORT_WRITE_FAILED,
    EXPORT_NO_EXPORT_DIR,
};

std::string ExportStatusCode(ExportStatus status);

std::string BuildCsv(const AnalyticsData &data);

// Downloads, then desktop, then `appDataDir`. Empty when none is usable.
std::filesystem::path ResolveExportDir(const std::filesystem::path &appDataDir);

ExportStatus ExportCsv(const AnalyticsData &data, Period period, const std::filesystem::path &dir,
                       std::int64_t now, std::filesystem::path &out, std::string &error);
ExportStatus ExportPng(const std::string &dataUrl, const std::filesystem::path &dir,
                       std::int64_t now, std::filesystem::path &out, std::string &error);

bool DecodeBase64(const std::string &text, std::vector<unsigned char> &out);

#include "json.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
bool JsonParse::ParseDocument(const std::string &text, nlohmann::json &out) {
    out = nlohmann::json::parse(text, nullptr, false);
    if (out.is_discarded()) {
        spdlog::debug("JsonParse: document is not valid JSON ({} bytes)", text.size());
        return false;
    }
    return true;
}

// ─────────────────────────────────────
long long JsonParse::GetInt(const nlohmann::json &j, const std::string &key, long long fallback) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback {}", key, fallback);
        return fallback;
    }
    if (j.at(key).is_number_integer()) {
        return j.at(key).get<long long>();
    }
    spdlog::warn("JsonParse: Key '{}' is not an integer, using fallback {}", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
std::string JsonParse::GetString(const nlohmann::json &j, const std::string &key,
                                 const std::string &fallback) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback '{}'", key, fallback);
        return fallback;
    }
    if (j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a string, using fallback '{}'", key, fallback);
    return fallback;
}


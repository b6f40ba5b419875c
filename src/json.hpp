#pragma once

#include <string>

#include <nlohmann/json.hpp>

class JsonParse {
  public:
    // Non-throwing parse; false on syntax errors.
    bool ParseDocument(const std::string &text, nlohmann::json &out);

    long long GetInt(const nlohmann::json &j, const std::string &key, long long fallback);
    std::string GetString(const nlohmann::json &j, const std::string &key,
                          const std::string &fallback);
};

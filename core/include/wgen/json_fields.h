#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace wgen::fields {

// Readers leave `out` untouched when the key is absent or null. A present key of
// the wrong type appends "field '<key>' must be ..." to `errors` (when given)
// and returns false.
bool read(const nlohmann::json& j, const char* key, std::string& out,
          std::vector<std::string>* errors = nullptr);
bool read(const nlohmann::json& j, const char* key, int& out,
          std::vector<std::string>* errors = nullptr);
bool read(const nlohmann::json& j, const char* key, float& out,
          std::vector<std::string>* errors = nullptr);
bool read(const nlohmann::json& j, const char* key, double& out,
          std::vector<std::string>* errors = nullptr);
bool read(const nlohmann::json& j, const char* key, bool& out,
          std::vector<std::string>* errors = nullptr);
bool read(const nlohmann::json& j, const char* key, std::vector<std::string>& out,
          std::vector<std::string>* errors = nullptr);

// Array of objects under `key`; a missing key yields an empty array.
const nlohmann::json& objects(const nlohmann::json& j, const char* key,
                              std::vector<std::string>* errors = nullptr);

std::string join(const std::vector<std::string>& values, const std::string& sep);

} // namespace wgen::fields

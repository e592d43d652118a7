#include "wgen/json_fields.h"

#include <cmath>
#include <cstdint>
#include <limits>

namespace wgen::fields {

namespace {
const nlohmann::json* lookup(const nlohmann::json& j, const char* key) {
  if (!j.is_object()) {
    return nullptr;
  }
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return nullptr;
  }
  return &(*it);
}

bool type_error(const char* key, const char* expected, std::vector<std::string>* errors) {
  if (errors) {
    errors->push_back(std::string("field '") + key + "' must be " + expected);
  }
  return false;
}
} // namespace

bool read(const nlohmann::json& j, const char* key, std::string& out,
          std::vector<std::string>* errors) {
  const auto* v = lookup(j, key);
  if (!v) return true;
  if (v->is_string()) {
    out = v->get<std::string>();
    return true;
  }
  // Config files converted from YAML may carry plain scalars as numbers.
  if (v->is_number() || v->is_boolean()) {
    out = v->dump();
    return true;
  }
  return type_error(key, "a string", errors);
}

bool read(const nlohmann::json& j, const char* key, int& out,
          std::vector<std::string>* errors) {
  const auto* v = lookup(j, key);
  if (!v) return true;
  if (v->is_number_unsigned()) {
    const auto value = v->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      return type_error(key, "an integer within 32-bit range", errors);
    }
    out = static_cast<int>(value);
    return true;
  }
  if (v->is_number_integer()) {
    const auto value = v->get<std::int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
      return type_error(key, "an integer within 32-bit range", errors);
    }
    out = static_cast<int>(value);
    return true;
  }
  if (v->is_number_float()) {
    const double value = v->get<double>();
    if (!std::isfinite(value) || value < std::numeric_limits<int>::min() ||
        value > std::numeric_limits<int>::max()) {
      return type_error(key, "an integer within 32-bit range", errors);
    }
    out = static_cast<int>(std::lround(value));
    return true;
  }
  return type_error(key, "an integer", errors);
}

bool read(const nlohmann::json& j, const char* key, double& out,
          std::vector<std::string>* errors) {
  const auto* v = lookup(j, key);
  if (!v) return true;
  if (v->is_number()) {
    out = v->get<double>();
    return true;
  }
  return type_error(key, "a number", errors);
}

bool read(const nlohmann::json& j, const char* key, float& out,
          std::vector<std::string>* errors) {
  double value = out;
  if (!read(j, key, value, errors)) {
    return false;
  }
  out = static_cast<float>(value);
  return true;
}

bool read(const nlohmann::json& j, const char* key, bool& out,
          std::vector<std::string>* errors) {
  const auto* v = lookup(j, key);
  if (!v) return true;
  if (v->is_boolean()) {
    out = v->get<bool>();
    return true;
  }
  return type_error(key, "a boolean", errors);
}

bool read(const nlohmann::json& j, const char* key, std::vector<std::string>& out,
          std::vector<std::string>* errors) {
  const auto* v = lookup(j, key);
  if (!v) return true;
  if (!v->is_array()) {
    return type_error(key, "an array of strings", errors);
  }
  std::vector<std::string> values;
  for (const auto& item : *v) {
    if (!item.is_string()) {
      return type_error(key, "an array of strings", errors);
    }
    values.push_back(item.get<std::string>());
  }
  out = std::move(values);
  return true;
}

const nlohmann::json& objects(const nlohmann::json& j, const char* key,
                              std::vector<std::string>* errors) {
  static const nlohmann::json kEmpty = nlohmann::json::array();
  const auto* v = lookup(j, key);
  if (!v) return kEmpty;
  if (!v->is_array()) {
    type_error(key, "an array", errors);
    return kEmpty;
  }
  for (const auto& item : *v) {
    if (!item.is_object()) {
      type_error(key, "an array of objects", errors);
      return kEmpty;
    }
  }
  return *v;
}

std::string join(const std::vector<std::string>& values, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) out += sep;
    out += values[i];
  }
  return out;
}

} // namespace wgen::fields

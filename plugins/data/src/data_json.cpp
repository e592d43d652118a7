#include "wgen_data/serialization.h"

#include "wgen/log.h"

#include <fstream>

namespace wgen::data {

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out, std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = "JSON read failed: " + path.string();
    log::warn(error);
    return false;
  }
  try {
    in >> out;
  } catch (const std::exception& e) {
    error = "JSON parse failed (" + path.string() + "): " + e.what();
    log::warn(error);
    return false;
  }
  return true;
}

bool save_json_file(const std::filesystem::path& path, const nlohmann::json& node, std::string& error) {
  return write_text_file(path, node.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n", error);
}

} // namespace wgen::data

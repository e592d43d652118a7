#include "wgen_data/serialization.h"

#include "wgen/log.h"

#include <fstream>

namespace wgen::data {

bool ensure_directory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    return true;
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create directory " + dir.string() + ": " + ec.message();
    log::warn(error);
    return false;
  }
  return true;
}

bool write_text_file(const std::filesystem::path& path, const std::string& contents, std::string& error) {
  if (!ensure_directory(path.parent_path(), error)) {
    return false;
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    error = "failed to write file: " + path.string();
    log::warn(error);
    return false;
  }
  out << contents;
  if (!out) {
    error = "short write: " + path.string();
    log::warn(error);
    return false;
  }
  return true;
}

} // namespace wgen::data

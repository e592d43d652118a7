#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace wgen::log {

void init(const std::string& app_name, const std::filesystem::path& log_dir);
void shutdown();
void install_crash_handlers();

// Console echo is on by default; tests turn it off to keep output readable.
void set_console(bool enabled);
void set_verbose(bool enabled);
bool verbose();

void debug(std::string_view msg);
void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

std::vector<std::string> recent(size_t max_entries = 200);

} // namespace wgen::log

#include "wgen/log.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace wgen::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::deque<std::string> g_ring;
constexpr size_t kRingMax = 200;
std::atomic<bool> g_console{true};
std::atomic<bool> g_verbose{false};

std::string format_now(const char* pattern) {
  const auto now = std::chrono::system_clock::now();
  const auto tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, pattern);
  return oss.str();
}

void log_line(const char* level, std::string_view msg) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const std::string line = "[" + format_now("%Y-%m-%d %H:%M:%S") + "][" + level + "] " + std::string(msg);
  if (g_console.load()) {
    std::cout << line << "\n";
  }
  if (g_log_file.is_open()) {
    g_log_file << line << "\n";
    g_log_file.flush();
  }
  g_ring.push_back(line);
  if (g_ring.size() > kRingMax) {
    g_ring.pop_front();
  }
}
} // namespace

void init(const std::string& app_name, const std::filesystem::path& log_dir) {
  std::error_code ec;
  std::filesystem::create_directories(log_dir, ec);
  const std::string file_name = app_name + "_" + format_now("%Y%m%d_%H%M%S") + ".log";
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file.is_open()) {
      g_log_file.close();
    }
    g_log_file.open(log_dir / file_name, std::ios::out | std::ios::app);
  }
  log_line("INFO", "log init: " + app_name);
  if (ec) {
    log_line("WARN", "log dir unavailable: " + log_dir.string());
  }
#ifdef WGEN_GIT_HASH
  log_line("INFO", std::string("git: ") + WGEN_GIT_HASH);
#endif
}

void shutdown() {
  log_line("INFO", "log shutdown");
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
}

void set_console(bool enabled) {
  g_console.store(enabled);
}

void set_verbose(bool enabled) {
  g_verbose.store(enabled);
}

bool verbose() {
  return g_verbose.load();
}

void debug(std::string_view msg) {
  if (g_verbose.load()) {
    log_line("DEBUG", msg);
  }
}

void info(std::string_view msg) {
  log_line("INFO", msg);
}

void warn(std::string_view msg) {
  log_line("WARN", msg);
}

void error(std::string_view msg) {
  log_line("ERROR", msg);
}

std::vector<std::string> recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const size_t count = std::min(max_entries, g_ring.size());
  return std::vector<std::string>(g_ring.end() - static_cast<std::ptrdiff_t>(count), g_ring.end());
}

namespace {
void signal_handler(int sig) {
  log_line("ERROR", std::string("crash signal: ") + std::to_string(sig));
  std::_Exit(1);
}
} // namespace

void install_crash_handlers() {
  std::signal(SIGSEGV, signal_handler);
  std::signal(SIGABRT, signal_handler);
  std::signal(SIGFPE, signal_handler);
  std::signal(SIGILL, signal_handler);
}

} // namespace wgen::log

#include "wgen/config.h"
#include "wgen/content_store.h"
#include "wgen/content_validation.h"
#include "wgen/event_bus.h"
#include "wgen/generation_events.h"
#include "wgen/log.h"
#include "wgen/prompt_builder.h"
#include "wgen/run_report.h"
#include "wgen/world_generator.h"
#include "wgen_data/journal.h"
#include "wgen_data/serialization.h"
#include "wgen_llm/curl_transport.h"
#include "wgen_llm/model_client.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace fs = std::filesystem;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) {
  g_interrupted = 1;
}

void print_usage() {
  std::cout << "Usage:\n"
            << "  wgenctl generate --config <file> [--out <dir>] [--chapters <n>] [--verbose]\n"
            << "  wgenctl next-chapter --world <dir> [--verbose]\n"
            << "  wgenctl validate --world <dir>\n"
            << "  wgenctl history --world <dir> [--runs <n>]\n"
            << "  wgenctl prompt system|outline --config <file>\n"
            << "  wgenctl export-config --world <dir> --out <file.yaml>\n"
            << "\n"
            << "The provider credential is read from WGEN_API_KEY, falling back to\n"
            << "OPENAI_API_KEY or ANTHROPIC_API_KEY depending on the provider.\n";
}

std::string env_or_empty(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

std::string resolve_credential(const wgen::ProviderConfig& provider) {
  std::string key = env_or_empty("WGEN_API_KEY");
  if (!key.empty()) {
    return key;
  }
  if (provider.provider == "anthropic" || provider.provider == "claude") {
    return env_or_empty("ANTHROPIC_API_KEY");
  }
  return env_or_empty("OPENAI_API_KEY");
}

void start_logging(const fs::path& log_dir, bool verbose) {
  wgen::log::init("wgenctl", log_dir);
  wgen::log::install_crash_handlers();
  wgen::log::set_verbose(verbose);
}

void subscribe_console(wgen::EventBus& bus) {
  bus.subscribe<wgen::runtime::ProgressEvent>([](const wgen::runtime::ProgressEvent& ev) {
    if (wgen::log::verbose()) {
      std::cout << "[" << std::setw(3) << static_cast<int>(ev.fraction * 100.0f + 0.5f) << "%] " << ev.stage
                << "\n";
    }
  });
  bus.subscribe<wgen::runtime::ChapterCompletedEvent>([](const wgen::runtime::ChapterCompletedEvent& ev) {
    std::cout << "chapter " << ev.chapter_number << " (" << ev.chapter_id << "): " << ev.rooms << " rooms, "
              << ev.quests << " quests, " << ev.enemies << " enemies, " << ev.items << " items\n";
  });
}

// Runs in the background so Ctrl-C can request a cooperative cancel.
int drive(wgen::runtime::WorldGenerator& generator) {
  while (generator.is_generating()) {
    if (g_interrupted) {
      std::cout << "interrupt received; finishing the current request before stopping\n";
      generator.cancel();
      g_interrupted = 0;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  generator.wait();
  const wgen::RunReport report = generator.last_report();
  std::cout << wgen::format_content_report(generator.content(), &report);
  if (report.cancelled) {
    return 130;
  }
  if (report.aborted || !report.persisted) {
    return 1;
  }
  return report.errors.empty() ? 0 : 2;
}

int cmd_generate(const fs::path& config_path, const fs::path& out_override, int chapters_override,
                 bool verbose) {
  wgen::GenerationConfig config;
  std::string error;
  if (!wgen::load_generation_config(config_path, config, error)) {
    std::cerr << "config error: " << error << "\n";
    return 1;
  }
  if (!out_override.empty()) {
    config.output_root = out_override;
  }
  if (chapters_override > 0) {
    config.settings.total_chapters = chapters_override;
  }
  if (!wgen::check_generation_config(config, error)) {
    std::cerr << "config error: " << error << "\n";
    return 1;
  }
  const std::string credential = resolve_credential(config.provider);
  if (credential.empty()) {
    std::cerr << "no API key: set WGEN_API_KEY\n";
    return 1;
  }

  start_logging(config.output_root / config.world_id / "logs", verbose);
  wgen::EventBus bus;
  subscribe_console(bus);
  wgen::llm::QueuedModelClient client(std::make_shared<wgen::llm::CurlHttpTransport>());
  wgen::runtime::WorldGenerator generator(client, bus);

  std::signal(SIGINT, on_interrupt);
  if (!generator.start_generation(config, credential, error)) {
    std::cerr << "generate failed: " << error << "\n";
    wgen::log::shutdown();
    return 1;
  }
  const int rc = drive(generator);
  wgen::log::shutdown();
  return rc;
}

int cmd_next_chapter(const fs::path& world_dir, bool verbose) {
  start_logging(world_dir / "logs", verbose);
  wgen::EventBus bus;
  subscribe_console(bus);
  wgen::llm::QueuedModelClient client(std::make_shared<wgen::llm::CurlHttpTransport>());
  wgen::runtime::WorldGenerator generator(client, bus);

  std::string error;
  if (!generator.load_world(world_dir, error)) {
    std::cerr << "load failed: " << error << "\n";
    wgen::log::shutdown();
    return 1;
  }
  const std::string credential = resolve_credential(generator.manifest().provider);
  if (credential.empty()) {
    std::cerr << "no API key: set WGEN_API_KEY\n";
    wgen::log::shutdown();
    return 1;
  }

  std::signal(SIGINT, on_interrupt);
  if (!generator.generate_next_chapter(credential, error)) {
    std::cerr << "next-chapter failed: " << error << "\n";
    wgen::log::shutdown();
    return 1;
  }
  const int rc = drive(generator);
  wgen::log::shutdown();
  return rc;
}

int cmd_validate(const fs::path& world_dir) {
  wgen::log::set_console(false);
  wgen::runtime::ContentStore store(world_dir);
  wgen::WorldManifest manifest;
  wgen::WorldContent content;
  std::string error;
  if (!store.load(manifest, content, error)) {
    std::cerr << "load failed: " << error << "\n";
    return 1;
  }
  wgen::RunReport report;
  report.mode = "validate";
  report.world_id = manifest.config_id;
  const auto summary = wgen::runtime::validate_content(content, {}, report);
  std::cout << wgen::format_content_report(content, &report);
  for (const auto& warning : summary.warnings) {
    std::cout << "warning: " << warning << "\n";
  }
  return summary.ok() ? 0 : 2;
}

int cmd_history(const fs::path& world_dir, int runs) {
  wgen::log::set_console(false);
  wgen::runtime::ContentStore store(world_dir);
  wgen::data::RunJournal journal;
  std::string error;
  if (!fs::exists(store.journal_path())) {
    std::cerr << "no journal at " << store.journal_path().string() << "\n";
    return 1;
  }
  if (!journal.open(store.journal_path(), error)) {
    std::cerr << "journal error: " << error << "\n";
    return 1;
  }
  const auto rows = journal.recent_runs(runs, error);
  if (!error.empty()) {
    std::cerr << "journal error: " << error << "\n";
    return 1;
  }
  if (rows.empty()) {
    std::cout << "no runs recorded\n";
    return 0;
  }
  for (const auto& run : rows) {
    std::cout << run.run_id << "  " << std::left << std::setw(13) << run.mode << std::setw(22) << run.status
              << std::right << " chapters=" << run.chapters << " tokens=" << run.total_tokens
              << " errors=" << run.error_count << " warnings=" << run.warning_count << "\n";
    const auto requests = journal.requests_for_run(run.run_id, error);
    int failed = 0;
    int retried = 0;
    for (const auto& req : requests) {
      if (!req.ok) ++failed;
      if (req.attempts > 1) ++retried;
    }
    std::cout << "    requests=" << requests.size() << " failed=" << failed << " retried=" << retried << "\n";
    for (const auto& issue : journal.issues_for_run(run.run_id, error)) {
      std::cout << "    [" << wgen::to_string(issue.kind) << "] " << issue.message << "\n";
    }
  }
  return 0;
}

int cmd_prompt(const std::string& which, const fs::path& config_path) {
  wgen::log::set_console(false);
  wgen::GenerationConfig config;
  std::string error;
  if (!wgen::load_generation_config(config_path, config, error)) {
    std::cerr << "config error: " << error << "\n";
    return 1;
  }
  if (which == "system") {
    std::cout << wgen::prompts::system_prompt(config.brief);
  } else if (which == "outline") {
    std::cout << wgen::prompts::outline_prompt(config.brief, config.settings, 1, nullptr);
  } else {
    print_usage();
    return 1;
  }
  return 0;
}

int cmd_export_config(const fs::path& world_dir, const fs::path& out_path) {
  wgen::log::set_console(false);
  wgen::runtime::ContentStore store(world_dir);
  wgen::WorldManifest manifest;
  wgen::WorldContent content;
  std::string error;
  if (!store.load(manifest, content, error)) {
    std::cerr << "load failed: " << error << "\n";
    return 1;
  }
  wgen::GenerationConfig config;
  config.world_id = manifest.config_id;
  config.world_name = manifest.config_name;
  config.brief = manifest.brief;
  config.settings = manifest.settings;
  config.provider = manifest.provider;
  config.output_root = world_dir.parent_path().empty() ? fs::path(".") : world_dir.parent_path();
  if (!wgen::data::save_yaml_file(out_path, wgen::data::config_to_yaml(config), error)) {
    std::cerr << "export failed: " << error << "\n";
    return 1;
  }
  std::cout << "config written: " << out_path.string() << "\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string command = argv[1];
  std::string sub;
  int first_flag = 2;
  if (command == "prompt") {
    if (argc < 3) {
      print_usage();
      return 1;
    }
    sub = argv[2];
    first_flag = 3;
  }

  fs::path config_path;
  fs::path world_dir;
  fs::path out_path;
  int chapters = 0;
  int runs = 10;
  bool verbose = false;
  for (int i = first_flag; i < argc; ++i) {
    const std::string arg = argv[i];
    try {
      if (arg == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (arg == "--world" && i + 1 < argc) {
        world_dir = argv[++i];
      } else if (arg == "--out" && i + 1 < argc) {
        out_path = argv[++i];
      } else if (arg == "--chapters" && i + 1 < argc) {
        chapters = std::max(1, std::stoi(argv[++i]));
      } else if (arg == "--runs" && i + 1 < argc) {
        runs = std::max(1, std::stoi(argv[++i]));
      } else if (arg == "--verbose" || arg == "-v") {
        verbose = true;
      } else {
        std::cerr << "unknown argument: " << arg << "\n";
        print_usage();
        return 1;
      }
    } catch (const std::exception&) {
      std::cerr << "invalid number for " << arg << "\n";
      return 1;
    }
  }

  if (command == "generate" && !config_path.empty()) {
    return cmd_generate(config_path, out_path, chapters, verbose);
  }
  if (command == "next-chapter" && !world_dir.empty()) {
    return cmd_next_chapter(world_dir, verbose);
  }
  if (command == "validate" && !world_dir.empty()) {
    return cmd_validate(world_dir);
  }
  if (command == "history" && !world_dir.empty()) {
    return cmd_history(world_dir, runs);
  }
  if (command == "prompt" && !config_path.empty()) {
    return cmd_prompt(sub, config_path);
  }
  if (command == "export-config" && !world_dir.empty() && !out_path.empty()) {
    return cmd_export_config(world_dir, out_path);
  }
  print_usage();
  return 1;
}

#include <csignal>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <quire/archive/archive_extractor.hpp>
#include <quire/archive/temp_workspace.hpp>
#include <quire/backup/service.hpp>
#include <quire/config/options.hpp>
#include <quire/schema/encoding/json/file.hpp>
#include <quire/storage/rocksdb/storage.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;

namespace {

constexpr auto kExitOk = 0;
constexpr auto kExitFailure = 1;
constexpr auto kExitUsage = 2;
constexpr auto kExitInterrupted = 130;

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

struct command_line final {
  std::string command;
  std::string archive;
  std::string output;
  std::string payload_dir;
  std::vector<std::string> workspaces;
};

std::string read_payload(const std::string& payload_dir,
                         const std::string& workspace_id) {
  if (payload_dir.empty()) {
    return std::string{quire::schema::kEmptyLegacyPayload};
  }
  auto error = std::string{};
  auto payload = quire::schema::encoding::json::read_text_file(
      std::filesystem::path{payload_dir} / (workspace_id + ".json"), error);
  if (!payload) {
    spdlog::warn("No legacy payload for workspace '{}' ({}), using empty",
                 workspace_id, error);
    return std::string{quire::schema::kEmptyLegacyPayload};
  }
  return *payload;
}

int run_backup(quire::backup::service& service, const command_line& cli) {
  if (cli.output.empty()) {
    spdlog::error("backup requires --output");
    return kExitUsage;
  }
  auto requests = std::vector<quire::schema::backup_request_t>{};
  for (const auto& id : cli.workspaces) {
    requests.push_back(quire::schema::backup_request_t{
        .workspace_id = id,
        .legacy_payload = read_payload(cli.payload_dir, id)});
  }

  auto result = quire::common::status{};
  auto stream = service.create_backup(requests, result);
  if (!stream) {
    spdlog::error("Backup failed [{}]: {} {}",
                  quire::common::to_string(result.code), result.log,
                  result.info);
    return kExitFailure;
  }

  auto out = std::ofstream{cli.output, std::ios::binary | std::ios::trunc};
  if (!out) {
    spdlog::error("Cannot open '{}' for writing", cli.output);
    return kExitFailure;
  }
  const auto size = stream->size();
  result = stream->copy_to(out);
  if (!result) {
    spdlog::error("Failed to write backup: {} {}", result.log, result.info);
    return kExitFailure;
  }
  spdlog::info("Wrote {} ({} bytes) to '{}'", stream->file_name(), size,
               cli.output);
  return kExitOk;
}

int run_restore(quire::backup::service& service, const command_line& cli) {
  if (cli.archive.empty()) {
    spdlog::error("restore requires an archive path");
    return kExitUsage;
  }
  auto result = service.restore_from_backup(cli.archive);
  for (const auto& workspace : result.workspace_results) {
    spdlog::info("  {}: {}", workspace.workspace_id,
                 workspace.status ? std::string{"restored"}
                                  : workspace.status.log);
  }
  for (const auto& payload : result.restored_payloads) {
    if (cli.payload_dir.empty()) {
      std::cout << payload.workspace_id << '\t' << payload.payload << '\n';
      continue;
    }
    auto written = quire::schema::encoding::json::write_text_file(
        std::filesystem::path{cli.payload_dir} /
            (payload.workspace_id + ".json"),
        payload.payload);
    if (!written) {
      spdlog::error("Failed to save payload of '{}': {}", payload.workspace_id,
                    written.info);
    }
  }
  if (!result.status) {
    spdlog::error("{} [{}] {}", result.message,
                  quire::common::to_string(result.status.code),
                  result.status.info);
    return kExitFailure;
  }
  spdlog::info("{}", result.message);
  return kExitOk;
}

int run_inspect(const quire::config::options& options,
                const command_line& cli) {
  if (cli.archive.empty()) {
    spdlog::error("inspect requires an archive path");
    return kExitUsage;
  }
  auto extractor = quire::archive::archive_extractor{options};
  auto result = quire::common::status{};
  auto extracted = extractor.extract(cli.archive, result);
  if (!extracted) {
    spdlog::error("Invalid archive [{}]: {} {}",
                  quire::common::to_string(result.code), result.log,
                  result.info);
    return kExitFailure;
  }
  std::cout << "format version: " << extracted->manifest.format_version << '\n'
            << "created at:     " << extracted->manifest.created_at << '\n'
            << "workspaces:     " << extracted->manifest.workspace_ids.size()
            << '\n';
  for (const auto& id : extracted->manifest.workspace_ids) {
    std::cout << "  " << id << '\n';
  }
  return kExitOk;
}

int run_command(const quire::config::options& options,
                const command_line& cli) {
  if (cli.command == "inspect") {
    return run_inspect(options, cli);
  }

  auto storage = quire::storage::make_storage<
      quire::storage::rocksdb_storage_tag>(options.database_path);
  if (!storage.is_open()) {
    return kExitFailure;
  }
  auto service = quire::backup::service{storage, options};
  if (cli.command == "backup") {
    return run_backup(service, cli);
  }
  return run_restore(service, cli);
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("quire.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "quire", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);

  auto options = quire::config::make_default_options();
  auto cli = command_line{};
  auto config_file = std::string{};

  auto general = po::options_description{"Quire"};
  general.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable verbose output")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with store settings")(
      "command", po::value<std::string>(&cli.command),
      "backup, restore or inspect")(
      "archive", po::value<std::string>(&cli.archive),
      "Archive to restore or inspect")(
      "workspace,w", po::value<std::vector<std::string>>(&cli.workspaces),
      "Workspace id to back up, repeatable")(
      "output,o", po::value<std::string>(&cli.output),
      "Destination of the backup archive")(
      "payload-dir", po::value<std::string>(&cli.payload_dir),
      "Directory of per-workspace legacy payloads ({id}.json)");
  auto store = quire::config::describe_options(options);
  auto description = po::options_description{};
  description.add(general).add(store);

  auto positional = po::positional_options_description{};
  positional.add("command", 1).add("archive", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto loaded = quire::config::load_config_file(
          vm["config"].as<std::string>(), store, vm);
      if (!loaded) {
        spdlog::error("{}: {}", loaded.log, loaded.info);
        spdlog::shutdown();
        return kExitUsage;
      }
    }
    po::notify(vm);
  } catch (const po::error& e) {
    spdlog::error("{}", e.what());
    spdlog::shutdown();
    return kExitUsage;
  }

  if (vm.contains("help") || cli.command.empty()) {
    std::cout << "Usage: quire <backup|restore|inspect> [archive] [options]\n"
              << description << std::endl;
    spdlog::shutdown();
    return vm.contains("help") ? kExitOk : kExitUsage;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  if (cli.command != "backup" && cli.command != "restore" &&
      cli.command != "inspect") {
    spdlog::error("Unknown command '{}'", cli.command);
    spdlog::shutdown();
    return kExitUsage;
  }

  auto validated = quire::config::validate_options(options);
  if (!validated) {
    spdlog::error("{}: {}", validated.log, validated.info);
    spdlog::shutdown();
    return kExitUsage;
  }

  auto exit_code = std::atomic<int>{kExitOk};
  auto finished = std::atomic<bool>{false};
  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] {
    exit_code = run_command(options, cli);
    finished = true;
  });
  threads.emplace_back([&] {
    while (!finished) {
      if (shutdown_requested()) {
        // The worker cannot be cancelled; remove its scratch state and leave.
        auto released = quire::archive::release_all_temp_directories();
        spdlog::warn("Interrupted, removed {} temporary director(ies)",
                     released);
        spdlog::shutdown();
        std::_Exit(kExitInterrupted);
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return exit_code;
}

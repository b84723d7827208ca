#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>
#include <ibc/handler/engine.hpp>
#include <ibc/router/acknowledging_module.hpp>
#include <ibc/storage/rocksdb/storage.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

// Blocks of hex envelopes; a blank line ends a block and `#` starts a
// comment.
std::vector<std::vector<std::string>> read_blocks(std::istream& input) {
  auto blocks = std::vector<std::vector<std::string>>{};
  auto current = std::vector<std::string>{};
  auto line = std::string{};
  while (std::getline(input, line)) {
    boost::algorithm::trim(line);
    if (line.starts_with('#')) {
      continue;
    }
    if (line.empty()) {
      if (!current.empty()) {
        blocks.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current.push_back(line);
  }
  if (!current.empty()) {
    blocks.push_back(std::move(current));
  }
  return blocks;
}

uint64_t wall_clock_ms() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto db_path = std::string{};
  auto chain_id = std::string{};
  auto input_path = std::string{};
  auto log_file = std::string{};
  auto block_time_ms = uint64_t{};
  auto start_height = uint64_t{};
  auto genesis_time_ms = uint64_t{};
  auto ports = std::vector<std::string>{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"ibc_node"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "ibc-db"),
      "RocksDB directory of the host store")(
      "chain-id,c",
      boost::program_options::value<std::string>(&chain_id)->default_value(
          "ibc-0"),
      "Host chain id, `{name}-{revision}`")(
      "input,i", boost::program_options::value<std::string>(&input_path),
      "File of hex SCALE message envelopes, blocks separated by blank lines")(
      "block-time-ms",
      boost::program_options::value<uint64_t>(&block_time_ms)
          ->default_value(5000),
      "Host time between blocks")(
      "start-height",
      boost::program_options::value<uint64_t>(&start_height)->default_value(1),
      "Height of the first replayed block on a fresh store")(
      "genesis-time-ms",
      boost::program_options::value<uint64_t>(&genesis_time_ms),
      "Host time of the first block, defaults to the wall clock")(
      "port,p",
      boost::program_options::value<std::vector<std::string>>(&ports)
          ->composing(),
      "Bind an acknowledging module to this port (repeatable)")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "ibc_node.log"),
      "Log file path")("verbose,v", "Enable debug logging");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "ibc", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  if (!vm.contains("input")) {
    spdlog::error("--input is required");
    spdlog::shutdown();
    return 1;
  }
  auto input = std::ifstream{input_path};
  if (!input) {
    spdlog::error("Cannot open input {}", input_path);
    spdlog::shutdown();
    return 1;
  }

  auto modules = ibc::router::router{};
  for (const auto& port : ports) {
    auto bound = modules.add_route(
        ibc::host::port_id_t{port},
        std::make_shared<ibc::router::acknowledging_module>("ics20-1"));
    if (!bound) {
      spdlog::error("Cannot bind port {}: {}", port,
                    ibc::common::describe(bound.error()));
      spdlog::shutdown();
      return 1;
    }
  }

  auto chain = ibc::host::chain_store<ibc::storage::rocksdb_storage_tag>{
      ibc::storage::make_storage<ibc::storage::rocksdb_storage_tag>(db_path),
      ibc::host::make_chain_info(chain_id)};
  auto engine =
      ibc::handler::engine<ibc::storage::rocksdb_storage_tag>{chain, modules};

  auto height = start_height;
  auto time_ms = vm.contains("genesis-time-ms") ? genesis_time_ms
                                                : wall_clock_ms();
  if (auto committed = chain.host_height().revision_height; committed > 0) {
    height = committed + 1;
    time_ms = chain.host_timestamp().nanoseconds / 1'000'000 + block_time_ms;
  }

  auto rejected = uint64_t{};
  for (const auto& block : read_blocks(input)) {
    if (shutdown_requested()) {
      spdlog::warn("Interrupted before block {}", height);
      break;
    }
    engine.begin_block(height, ibc::core::from_milliseconds(time_ms),
                       ibc::schema::make_zero_hash());
    for (const auto& line : block) {
      auto envelope = ibc::schema::try_from_hex(line);
      if (!envelope) {
        spdlog::warn("Block {}: skipping non-hex line", height);
        ++rejected;
        continue;
      }
      auto events = engine.dispatch(ibc::schema::make_bytes_view(*envelope));
      if (!events) {
        ++rejected;
        continue;
      }
      for (const auto& event : events.value()) {
        spdlog::info("Block {}: event {}", height, event.type);
        for (const auto& attribute : event.attributes) {
          spdlog::debug("  {} = {}", attribute.key, attribute.value);
        }
      }
    }
    auto root = engine.commit();
    if (!root) {
      spdlog::critical("Commit of block {} failed: {}", height,
                       ibc::common::describe(root.error()));
      spdlog::shutdown();
      return 1;
    }
    std::cout << height << " " << ibc::schema::to_hex(root.value())
              << std::endl;
    ++height;
    time_ms += block_time_ms;
  }

  spdlog::info("Replay finished with {} rejected message(s)", rejected);
  spdlog::shutdown();
  return 0;
}

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

#include "config/network.hpp"
#include "node/block_feed.hpp"
#include "node/chain_tracker.hpp"
#include "scan/identity_registry.hpp"
#include "storage/payment_index.hpp"
#include "storage/tweak_store.hpp"
#include "util/logging.hpp"

namespace {

using sps::util::LogDebug;
using sps::util::LogError;
using sps::util::LogInfo;
using sps::util::LogWarn;

std::atomic<bool> g_shutdown_requested{false};

bool ShutdownRequested() { return g_shutdown_requested.load(); }

void HandleSignal(int) {
  // Keep signal handler minimal and async-signal-safe.
  g_shutdown_requested.store(true);
}

void InstallSignalHandlers() {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
}

struct Options {
  std::string network{"mainnet"};
  std::string data_dir;
  std::string identities_path;
  std::string feed_path{"-"};
  std::size_t scan_threads{0};
  std::uint32_t max_reorg_depth{100};
  std::optional<std::uint32_t> start_height;
  std::uint32_t commit_retries{5};
  std::uint32_t commit_backoff_ms{100};
  std::string debug_log_path;
  std::string log_level{"info"};
  std::size_t log_max_size_mb{0};
  std::size_t log_max_files{0};
  std::string config_path;
  bool disable_config_file{false};
};

void PrintUsage() {
  std::cout << "spsd options:\n"
            << "  --network <net>            mainnet, testnet, signet, regtest (default: mainnet)\n"
            << "  --data-dir <path>          Base data directory (default: ~/.sps)\n"
            << "  --identities <path>        Register the scan identities listed in a JSON file\n"
            << "  --feed <path|->            Block feed input, one JSON record per line (default: stdin)\n"
            << "  --scan-threads <n>         Worker threads per block (0=hardware concurrency)\n"
            << "  --max-reorg-depth <n>      Deepest rollback accepted (0=unbounded, default: 100)\n"
            << "  --start-height <h>         First height to scan (default: network taproot activation)\n"
            << "  --commit-retries <n>       Commit attempts per block before halting (default: 5)\n"
            << "  --commit-backoff-ms <ms>   Initial delay between commit attempts (default: 100)\n"
            << "  --debug-log <path>         Append structured logs to the given file\n"
            << "  --log-level <lvl>          Log level: debug, info, warn, error (default: info)\n"
            << "  --log-max-size-mb <mb>     Rotate debug log after approximately <mb> megabytes (0=disable)\n"
            << "  --log-max-files <n>        Number of rotated debug log files to keep (default: 0)\n"
            << "  --conf <path>              Load options from spsd.conf (default: ./spsd.conf)\n"
            << "  --no-conf                  Disable config file loading\n";
}

std::string Trim(const std::string& input) {
  const std::string whitespace = " \t\r\n";
  const auto first = input.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(whitespace);
  return input.substr(first, last - first + 1);
}

std::uint32_t ParseUint32(const std::string& name, const std::string& value) {
  unsigned long long parsed = 0;
  std::size_t used = 0;
  try {
    parsed = std::stoull(value, &used);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid " + name + " (expected a non-negative integer)");
  }
  if (used != value.size() || parsed > 0xFFFFFFFFULL || value.front() == '-') {
    throw std::runtime_error("invalid " + name + " (out of range)");
  }
  return static_cast<std::uint32_t>(parsed);
}

std::string NormalizeKey(std::string key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

// Shared by the config file, SPS_* environment variables and flags, so every
// option is spelled the same way in all three.
bool ApplyOption(const std::string& raw_key, const std::string& value, Options* opts) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "network") {
    opts->network = value;
  } else if (key == "datadir") {
    opts->data_dir = value;
  } else if (key == "identities") {
    opts->identities_path = value;
  } else if (key == "feed") {
    opts->feed_path = value;
  } else if (key == "scanthreads") {
    opts->scan_threads = ParseUint32(raw_key, value);
  } else if (key == "maxreorgdepth") {
    opts->max_reorg_depth = ParseUint32(raw_key, value);
  } else if (key == "startheight") {
    opts->start_height = ParseUint32(raw_key, value);
  } else if (key == "commitretries") {
    opts->commit_retries = ParseUint32(raw_key, value);
  } else if (key == "commitbackoffms") {
    opts->commit_backoff_ms = ParseUint32(raw_key, value);
  } else if (key == "debuglog") {
    opts->debug_log_path = value;
  } else if (key == "loglevel") {
    opts->log_level = value;
  } else if (key == "logmaxsizemb") {
    opts->log_max_size_mb = ParseUint32(raw_key, value);
  } else if (key == "logmaxfiles") {
    opts->log_max_files = ParseUint32(raw_key, value);
  } else {
    return false;
  }
  return true;
}

void ApplyEnvironmentOverrides(Options* opts) {
  static constexpr std::string_view kEnvKeys[] = {
      "NETWORK",         "DATA_DIR",     "IDENTITIES",     "FEED",
      "SCAN_THREADS",    "MAX_REORG_DEPTH", "START_HEIGHT", "COMMIT_RETRIES",
      "COMMIT_BACKOFF_MS", "DEBUG_LOG",  "LOG_LEVEL",      "LOG_MAX_SIZE_MB",
      "LOG_MAX_FILES",
  };
  for (const auto key : kEnvKeys) {
    const std::string name = "SPS_" + std::string(key);
    if (auto value = sps::config::GetEnvValue(name)) {
      ApplyOption(name.substr(4), *value, opts);
    }
  }
}

void LoadConfigFile(const std::filesystem::path& path, Options* opts) {
  if (path.empty() || !std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    const auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) +
                               ": expected key=value");
    }
    const std::string key = Trim(line.substr(0, eq_pos));
    const std::string value = Trim(line.substr(eq_pos + 1));
    try {
      if (!ApplyOption(key, value, opts)) {
        std::cerr << "[spsd] warn: unknown config key '" << key << "'\n";
      }
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

Options ParseOptions(int argc, char** argv) {
  Options opts;
  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 1; i < argc; ++i) {
    std::string token = argv[i];
    auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      args.push_back(token.substr(0, eq_pos));
      args.push_back(token.substr(eq_pos + 1));
    } else {
      args.push_back(std::move(token));
    }
  }
  auto ensure_value = [&](std::size_t& idx) -> std::string {
    if (idx + 1 >= args.size()) {
      throw std::runtime_error("missing value for argument " + args[idx]);
    }
    return args[++idx];
  };

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      std::exit(0);
    }
    if (arg == "--conf") {
      opts.config_path = ensure_value(i);
    } else if (arg == "--no-conf") {
      opts.disable_config_file = true;
    }
  }

  if (!opts.disable_config_file) {
    std::filesystem::path config_path = opts.config_path.empty()
                                            ? std::filesystem::path("spsd.conf")
                                            : std::filesystem::path(opts.config_path);
    LoadConfigFile(config_path, &opts);
  }

  ApplyEnvironmentOverrides(&opts);

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string arg = args[i];
    if (arg == "--conf") {
      ++i;
      continue;
    }
    if (arg == "--no-conf") {
      continue;
    }
    if (arg.rfind("--", 0) != 0) {
      throw std::runtime_error("unexpected argument: " + arg);
    }
    const std::string value = ensure_value(i);
    if (!ApplyOption(arg.substr(2), value, &opts)) {
      throw std::runtime_error("unknown option: " + arg);
    }
  }

  sps::config::NetworkType net_type{};
  if (!sps::config::ParseNetwork(opts.network, &net_type)) {
    throw std::runtime_error("unknown network: " + opts.network);
  }
  sps::config::SelectNetwork(net_type);
  if (opts.data_dir.empty()) {
    opts.data_dir = sps::config::DefaultDataDir().string();
  }
  if (!opts.start_height) {
    opts.start_height = sps::config::GetNetworkConfig().default_start_height;
  }
  if (opts.scan_threads == 0) {
    opts.scan_threads = std::max(1u, std::thread::hardware_concurrency());
  }
  return opts;
}

bool ConfigureLogging(const Options& opts) {
  sps::util::LogLevel level = sps::util::LogLevel::kInfo;
  try {
    level = sps::util::ParseLogLevel(opts.log_level);
  } catch (const std::exception& ex) {
    std::cerr << "[spsd] warn: " << ex.what() << " (falling back to info level)\n";
  }
  sps::util::Logger().SetConsoleThreshold(level);
  if (opts.debug_log_path.empty()) {
    return true;
  }
  try {
    std::uintmax_t max_bytes = 0;
    if (opts.log_max_size_mb > 0) {
      max_bytes = static_cast<std::uintmax_t>(opts.log_max_size_mb) * 1024ULL * 1024ULL;
    }
    sps::util::Logger().Configure(level, max_bytes, opts.log_max_files);
    sps::util::Logger().Enable(opts.debug_log_path);
    LogDebug("spsd", "debug log enabled at " + opts.debug_log_path);
  } catch (const std::exception& ex) {
    std::cerr << "[spsd] fatal: " << ex.what() << "\n";
    return false;
  }
  return true;
}

bool RegisterIdentities(const Options& opts, sps::scan::IdentityRegistry* registry,
                        std::uint32_t registered_height) {
  std::vector<sps::scan::RegistrationRequest> requests;
  std::string error;
  if (!sps::scan::LoadRegistrationRequests(opts.identities_path, &requests, &error)) {
    LogError("registry", error);
    return false;
  }
  for (const auto& request : requests) {
    std::uint32_t id = 0;
    if (!registry->Register(request, registered_height, &id, &error)) {
      LogError("registry", error);
      return false;
    }
    LogInfo("registry", "identity " + std::to_string(id) + " active with " +
                            std::to_string(request.label_count) + " label(s)");
  }
  return true;
}

int RunFeedLoop(sps::node::ChainTracker* tracker, sps::node::BlockFeed* feed,
                std::stop_source* shutdown) {
  while (!shutdown->stop_requested()) {
    sps::node::FeedEvent event;
    const auto result =
        feed->WaitNext(shutdown->get_token(), std::chrono::milliseconds(200), &event);
    if (result == sps::node::FeedWaitResult::kClosed) {
      LogInfo("spsd", "block feed closed");
      return 0;
    }
    if (result != sps::node::FeedWaitResult::kEvent) {
      continue;
    }
    const auto status = tracker->Process(event, shutdown->get_token());
    if (sps::node::IsFatal(status)) {
      std::cerr << "[spsd] fatal: " << sps::node::AdvanceStatusName(status) << ": "
                << tracker->LastError() << "\n";
      return 1;
    }
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const auto opts = ParseOptions(argc, argv);
    if (!ConfigureLogging(opts)) {
      return 1;
    }
    InstallSignalHandlers();

    const auto& net_cfg = sps::config::GetNetworkConfig();
    const std::filesystem::path data_root =
        std::filesystem::path(opts.data_dir) / net_cfg.data_subdir;
    std::error_code ec;
    std::filesystem::create_directories(data_root, ec);
    if (ec) {
      std::cerr << "[spsd] fatal: failed to create " << data_root.string() << ": "
                << ec.message() << "\n";
      return 1;
    }
    LogInfo("spsd", "starting on network=" + net_cfg.network_id +
                        ", data_dir=" + data_root.string() +
                        ", scan_threads=" + std::to_string(opts.scan_threads) +
                        ", start_height=" + std::to_string(*opts.start_height));

    sps::scan::IdentityRegistry registry(data_root / "identities.json");
    sps::storage::TweakStore tweaks(data_root / "tweaks");
    sps::storage::PaymentIndex index(data_root / "payments.dat");
    sps::node::ChainTrackerOptions tracker_options;
    tracker_options.max_reorg_depth = opts.max_reorg_depth;
    tracker_options.start_height = *opts.start_height;
    tracker_options.scan_threads = opts.scan_threads;
    tracker_options.commit_attempts = opts.commit_retries;
    tracker_options.commit_backoff = std::chrono::milliseconds(opts.commit_backoff_ms);
    sps::node::ChainTracker tracker(&tweaks, &index, &registry, data_root / "watermark.dat",
                                    tracker_options);

    std::string error;
    if (!registry.Load(&error) || !tracker.Initialize(&error)) {
      std::cerr << "[spsd] fatal: " << error << "\n";
      return 1;
    }
    if (!opts.identities_path.empty()) {
      const auto tip = tracker.Tip();
      if (!RegisterIdentities(opts, &registry, tip ? tip->height : *opts.start_height)) {
        return 1;
      }
    }
    if (registry.ActiveIdentities()->empty()) {
      LogWarn("spsd", "no scan identities registered; only tweak data will be indexed");
    }

    int feed_fd = 0;
#ifndef _WIN32
    if (opts.feed_path != "-") {
      feed_fd = ::open(opts.feed_path.c_str(), O_RDONLY);
      if (feed_fd < 0) {
        std::cerr << "[spsd] fatal: failed to open feed " << opts.feed_path << "\n";
        return 1;
      }
    }
#endif

    sps::node::BlockFeed feed;
    feed.SetDisconnectObserver(
        [&tracker](const sps::node::FeedEvent& event) { tracker.OnDisconnectNotice(event); });
    std::stop_source shutdown;
    std::jthread signal_watcher([&shutdown](std::stop_token stop) {
      while (!stop.stop_requested() && !ShutdownRequested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
      }
      shutdown.request_stop();
    });
    std::jthread reader(
        [feed_fd, &feed](std::stop_token stop) { sps::node::RunFeedReader(feed_fd, &feed, stop); });

    const int rc = RunFeedLoop(&tracker, &feed, &shutdown);

    reader.request_stop();
    reader.join();
    signal_watcher.request_stop();
    signal_watcher.join();
#ifndef _WIN32
    if (feed_fd > 0) {
      ::close(feed_fd);
    }
#endif
    const auto telemetry = tracker.GetTelemetry();
    const auto tip = tracker.Tip();
    LogInfo("spsd", "stopped at height " + (tip ? std::to_string(tip->height) : "none") +
                        ": connected=" + std::to_string(telemetry.blocks_connected) +
                        " disconnected=" + std::to_string(telemetry.blocks_disconnected) +
                        " reorgs=" + std::to_string(telemetry.reorg_events) +
                        " payments=" + std::to_string(telemetry.payments_detected));
    return rc;
  } catch (const std::exception& ex) {
    std::cerr << "[spsd] fatal: " << ex.what() << "\n";
    return 1;
  }
}

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "config/network.hpp"
#include "node/query.hpp"
#include "nlohmann/json.hpp"
#include "scan/identity_registry.hpp"
#include "storage/payment_index.hpp"
#include "storage/tweak_store.hpp"
#include "storage/watermark.hpp"
#include "util/logging.hpp"

namespace {

struct CliOptions {
  std::string data_dir;
  std::string network{"mainnet"};
  std::optional<std::uint32_t> min_height;
  std::optional<std::uint32_t> max_height;
  std::optional<std::size_t> limit;
  bool raw{false};
  std::vector<std::string> args;
};

void PrintUsage() {
  std::cout << "Usage: sps-cli [options] <command> [params]\n"
            << "Commands:\n"
            << "  tip                         Last fully committed block\n"
            << "  identities                  Registered scan identities\n"
            << "  payments <identity>         Detected payments, optionally bounded by\n"
            << "                              --min-height/--max-height\n"
            << "  since <identity> <height>   Payments above <height>, up to --limit entries\n"
            << "  tweaks <height>             Tweak data of one block\n"
            << "Options:\n"
            << "  --network <net>             mainnet, testnet, signet, regtest (default: mainnet)\n"
            << "  --data-dir <path>           Base data directory (default: ~/.sps)\n"
            << "  --min-height <h>            Lower height bound for payments\n"
            << "  --max-height <h>            Upper height bound for payments\n"
            << "  --limit <n>                 Maximum entries returned by since\n"
            << "  --raw                       Print compact JSON\n";
}

std::uint32_t ParseUint32(std::string_view name, const std::string& value) {
  std::size_t used = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value, &used);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid " + std::string(name) + ": " + value);
  }
  if (used != value.size() || value.front() == '-' || parsed > 0xFFFFFFFFULL) {
    throw std::runtime_error("invalid " + std::string(name) + ": " + value);
  }
  return static_cast<std::uint32_t>(parsed);
}

CliOptions ParseOptions(int argc, char** argv) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--network") {
      if (++i >= argc) throw std::runtime_error("missing value for --network");
      opts.network = argv[i];
    } else if (arg == "--data-dir") {
      if (++i >= argc) throw std::runtime_error("missing value for --data-dir");
      opts.data_dir = argv[i];
    } else if (arg == "--min-height") {
      if (++i >= argc) throw std::runtime_error("missing value for --min-height");
      opts.min_height = ParseUint32("--min-height", argv[i]);
    } else if (arg == "--max-height") {
      if (++i >= argc) throw std::runtime_error("missing value for --max-height");
      opts.max_height = ParseUint32("--max-height", argv[i]);
    } else if (arg == "--limit") {
      if (++i >= argc) throw std::runtime_error("missing value for --limit");
      opts.limit = ParseUint32("--limit", argv[i]);
    } else if (arg == "--raw") {
      opts.raw = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      std::exit(0);
    } else {
      opts.args.emplace_back(arg);
    }
  }
  return opts;
}

void ThrowIfFailed(bool ok, const std::string& error) {
  if (!ok) {
    throw std::runtime_error(error);
  }
}

struct ReadOnlyStores {
  explicit ReadOnlyStores(const std::filesystem::path& root)
      : registry(root / "identities.json"),
        tweaks(root / "tweaks", true),
        index(root / "payments.dat", true),
        watermark_path(root / "watermark.dat") {}

  void Open() {
    std::string error;
    ThrowIfFailed(registry.Load(&error), error);
    ThrowIfFailed(sps::storage::LoadWatermark(watermark_path, &tip, &error), error);
    ThrowIfFailed(tweaks.Open(&error), error);
    const auto committed = tip ? std::optional<std::uint32_t>(tip->height) : std::nullopt;
    ThrowIfFailed(index.Open(committed, &error), error);
  }

  sps::scan::IdentityRegistry registry;
  sps::storage::TweakStore tweaks;
  sps::storage::PaymentIndex index;
  std::filesystem::path watermark_path;
  std::optional<sps::storage::Watermark> tip;
};

nlohmann::json PaymentsToJson(const std::vector<sps::scan::DetectedPayment>& payments) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& payment : payments) {
    out.push_back(sps::node::PaymentToJson(payment));
  }
  return out;
}

nlohmann::json RunCommand(const CliOptions& opts, const sps::node::QueryInterface& query) {
  if (opts.args.empty()) {
    throw std::runtime_error("no command given (see --help)");
  }
  const std::string& command = opts.args.front();
  auto require_args = [&](std::size_t count) {
    if (opts.args.size() != count + 1) {
      throw std::runtime_error(command + " expects " + std::to_string(count) + " argument(s)");
    }
  };
  if (command == "tip") {
    require_args(0);
    return sps::node::TipToJson(query.Tip());
  }
  if (command == "identities") {
    require_args(0);
    nlohmann::json out = nlohmann::json::array();
    for (const auto& record : query.Identities()) {
      out.push_back(sps::node::IdentityToJson(record));
    }
    return out;
  }
  if (command == "payments") {
    require_args(1);
    const auto identity = ParseUint32("identity", opts.args[1]);
    return PaymentsToJson(query.Payments(identity, opts.min_height, opts.max_height));
  }
  if (command == "since") {
    require_args(2);
    const auto identity = ParseUint32("identity", opts.args[1]);
    const auto height = ParseUint32("height", opts.args[2]);
    auto cursor = query.PaymentsSince(identity, height);
    std::vector<sps::scan::DetectedPayment> payments;
    while (!opts.limit || payments.size() < *opts.limit) {
      auto next = cursor.Next();
      if (!next) {
        break;
      }
      payments.push_back(*next);
    }
    nlohmann::json out;
    out["payments"] = PaymentsToJson(payments);
    out["complete"] = !cursor.Next().has_value();
    return out;
  }
  if (command == "tweaks") {
    require_args(1);
    sps::storage::BlockTweaks block;
    std::string error;
    if (!query.BlockTweaks(ParseUint32("height", opts.args[1]), &block, &error)) {
      throw std::runtime_error(error);
    }
    return sps::node::BlockTweaksToJson(block);
  }
  throw std::runtime_error("unknown command: " + command);
}

}  // namespace

int main(int argc, char** argv) {
  try {
    auto opts = ParseOptions(argc, argv);
    sps::util::Logger().SetConsoleThreshold(sps::util::LogLevel::kWarn);
    sps::config::NetworkType net{};
    if (!sps::config::ParseNetwork(opts.network, &net)) {
      throw std::runtime_error("unknown network: " + opts.network);
    }
    sps::config::SelectNetwork(net);
    if (opts.data_dir.empty()) {
      opts.data_dir = sps::config::DefaultDataDir().string();
    }
    const auto root =
        std::filesystem::path(opts.data_dir) / sps::config::GetNetworkConfig().data_subdir;
    ReadOnlyStores stores(root);
    stores.Open();
    const sps::node::IndexQueryService query(&stores.index, &stores.tweaks, &stores.registry,
                                             [&stores] { return stores.tip; });
    const auto result = RunCommand(opts, query);
    std::cout << (opts.raw ? result.dump() : result.dump(2)) << "\n";
  } catch (const std::exception& ex) {
    std::cerr << "sps-cli: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}

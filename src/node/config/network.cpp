#include "config/network.hpp"

#include <cstdlib>

namespace sps::config {

namespace {

constexpr std::uint32_t kMainnetTaprootActivationHeight = 709632;

NetworkConfig BuildConfig(NetworkType type, std::string id, std::string subdir,
                          std::string hrp, std::uint32_t start_height) {
  NetworkConfig cfg;
  cfg.type = type;
  cfg.network_id = std::move(id);
  cfg.data_subdir = std::move(subdir);
  cfg.silent_payment_hrp = std::move(hrp);
  cfg.default_start_height = start_height;
  return cfg;
}

const NetworkConfig& ConfigFor(NetworkType type) {
  static const NetworkConfig mainnet =
      BuildConfig(NetworkType::kMainnet, "mainnet", "", "sp", kMainnetTaprootActivationHeight);
  static const NetworkConfig testnet =
      BuildConfig(NetworkType::kTestnet, "testnet", "testnet3", "tsp", 0);
  static const NetworkConfig signet =
      BuildConfig(NetworkType::kSignet, "signet", "signet", "tsp", 0);
  static const NetworkConfig regtest =
      BuildConfig(NetworkType::kRegtest, "regtest", "regtest", "sprt", 0);
  switch (type) {
    case NetworkType::kMainnet:
      return mainnet;
    case NetworkType::kTestnet:
      return testnet;
    case NetworkType::kSignet:
      return signet;
    case NetworkType::kRegtest:
      return regtest;
  }
  return mainnet;
}

NetworkConfig g_network_config = ConfigFor(NetworkType::kMainnet);

}  // namespace

const NetworkConfig& GetNetworkConfig() { return g_network_config; }

void SelectNetwork(NetworkType type) { g_network_config = ConfigFor(type); }

bool ParseNetwork(std::string_view name, NetworkType* out) {
  if (name == "mainnet" || name == "main") {
    *out = NetworkType::kMainnet;
  } else if (name == "testnet" || name == "test") {
    *out = NetworkType::kTestnet;
  } else if (name == "signet" || name == "sig") {
    *out = NetworkType::kSignet;
  } else if (name == "regtest" || name == "reg") {
    *out = NetworkType::kRegtest;
  } else {
    return false;
  }
  return true;
}

std::string_view NetworkName(NetworkType type) {
  switch (type) {
    case NetworkType::kMainnet:
      return "mainnet";
    case NetworkType::kTestnet:
      return "testnet";
    case NetworkType::kSignet:
      return "signet";
    case NetworkType::kRegtest:
      return "regtest";
  }
  return "mainnet";
}

std::optional<std::string> GetEnvValue(std::string_view name) {
  const std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::filesystem::path DefaultDataDir() {
  if (auto value = GetEnvValue("SPS_DATA_DIR")) {
    return std::filesystem::path(*value);
  }
#ifdef _WIN32
  if (auto appdata = GetEnvValue("APPDATA")) {
    return std::filesystem::path(*appdata) / "SilentPayments";
  }
#else
  if (auto xdg_data = GetEnvValue("XDG_DATA_HOME")) {
    return std::filesystem::path(*xdg_data) / "sps";
  }
  if (auto home = GetEnvValue("HOME")) {
    return std::filesystem::path(*home) / ".sps";
  }
#endif
  return std::filesystem::path("data");
}

}  // namespace sps::config

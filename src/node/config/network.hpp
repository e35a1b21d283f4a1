#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sps::config {

enum class NetworkType {
  kMainnet,
  kTestnet,
  kSignet,
  kRegtest,
};

struct NetworkConfig {
  NetworkType type{NetworkType::kMainnet};
  std::string network_id{"mainnet"};
  // Subdirectory of the base data directory, following Bitcoin Core's
  // layout. Empty for mainnet.
  std::string data_subdir;
  // BIP-352 address human-readable part.
  std::string silent_payment_hrp{"sp"};
  // First block worth scanning: taproot activation on mainnet.
  std::uint32_t default_start_height{0};
};

const NetworkConfig& GetNetworkConfig();
void SelectNetwork(NetworkType type);
// Accepts the long and short names ("testnet"/"test"). Returns false for
// anything else.
bool ParseNetwork(std::string_view name, NetworkType* out);
std::string_view NetworkName(NetworkType type);

// Value of an environment variable; nullopt when unset or empty.
std::optional<std::string> GetEnvValue(std::string_view name);

// Base data directory shared by spsd and sps-cli, before the network
// subdirectory is appended: SPS_DATA_DIR, then the platform default.
std::filesystem::path DefaultDataDir();

}  // namespace sps::config

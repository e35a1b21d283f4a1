#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "crypto/secp256k1_ops.hpp"
#include "scan/scan_identity.hpp"

namespace sps::scan {

struct RegistrationRequest {
  crypto::Scalar scan_secret{};
  crypto::PubKey spend_pubkey{};
  std::uint32_t label_count{0};
};

struct IdentityRecord {
  std::uint32_t id{0};
  crypto::Scalar scan_secret{};
  crypto::PubKey spend_pubkey{};
  std::uint32_t label_count{0};
  bool active{true};
  // Chain tip when the identity was registered; earlier blocks are not rescanned.
  std::uint32_t registered_height{0};
};

// Parses an operator-supplied JSON array of
// {"scan_secret": hex, "spend_pubkey": hex, "labels": n}.
bool LoadRegistrationRequests(const std::filesystem::path& path,
                              std::vector<RegistrationRequest>* out, std::string* error);

// Persistent set of scan identities (identities.json in the data directory).
// Registrations are immutable: registering the same keys with a different
// label count retires the previous identity and issues a new id.
class IdentityRegistry {
 public:
  explicit IdentityRegistry(std::filesystem::path path);

  bool Load(std::string* error);
  bool Register(const RegistrationRequest& request, std::uint32_t registered_height,
                std::uint32_t* id, std::string* error);

  // Snapshot of the identities currently scanned, ordered by id.
  std::shared_ptr<const std::vector<ScanIdentity>> ActiveIdentities() const;
  std::vector<IdentityRecord> Records() const;
  std::optional<IdentityRecord> Find(std::uint32_t id) const;

 private:
  bool SaveLocked(const std::vector<IdentityRecord>& records, std::string* error) const;
  bool BuildActiveLocked(const std::vector<IdentityRecord>& records,
                         std::shared_ptr<const std::vector<ScanIdentity>>* out,
                         std::string* error) const;

  std::filesystem::path path_;
  std::vector<IdentityRecord> records_;
  std::shared_ptr<const std::vector<ScanIdentity>> active_;
  mutable std::shared_mutex mutex_;
};

}  // namespace sps::scan

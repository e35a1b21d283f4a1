#include "scan/identity_registry.hpp"

#include <algorithm>
#include <fstream>
#include <mutex>
#include <system_error>

#include <nlohmann/json.hpp>

#include "util/atomic_file.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"

namespace sps::scan {

namespace {

constexpr int kRegistryVersion = 1;

bool ParseRequest(const nlohmann::json& item, RegistrationRequest* out, std::string* error) {
  if (!item.is_object() || !item.contains("scan_secret") || !item.contains("spend_pubkey")) {
    if (error) *error = "identity entry requires scan_secret and spend_pubkey";
    return false;
  }
  const auto& scan = item.at("scan_secret");
  const auto& spend = item.at("spend_pubkey");
  if (!scan.is_string() || !util::HexDecodeInto(scan.get<std::string>(), out->scan_secret)) {
    if (error) *error = "scan_secret must be 32 bytes of hex";
    return false;
  }
  if (!spend.is_string() || !util::HexDecodeInto(spend.get<std::string>(), out->spend_pubkey)) {
    if (error) *error = "spend_pubkey must be a 33-byte compressed key in hex";
    return false;
  }
  out->label_count = 0;
  if (item.contains("labels")) {
    const auto& labels = item.at("labels");
    if (!labels.is_number_unsigned() || labels.get<std::uint64_t>() > kMaxLabels) {
      if (error) *error = "labels must be an integer between 0 and " + std::to_string(kMaxLabels);
      return false;
    }
    out->label_count = static_cast<std::uint32_t>(labels.get<std::uint64_t>());
  }
  return true;
}

nlohmann::json RecordToJson(const IdentityRecord& record) {
  nlohmann::json out;
  out["id"] = record.id;
  out["scan_secret"] = util::HexEncode(record.scan_secret);
  out["spend_pubkey"] = util::HexEncode(record.spend_pubkey);
  out["labels"] = record.label_count;
  out["active"] = record.active;
  out["registered_height"] = record.registered_height;
  return out;
}

bool RecordFromJson(const nlohmann::json& item, IdentityRecord* out, std::string* error) {
  RegistrationRequest request;
  if (!ParseRequest(item, &request, error)) {
    return false;
  }
  if (!item.contains("id") || !item.at("id").is_number_unsigned()) {
    if (error) *error = "identity record missing id";
    return false;
  }
  out->id = item.at("id").get<std::uint32_t>();
  out->scan_secret = request.scan_secret;
  out->spend_pubkey = request.spend_pubkey;
  out->label_count = request.label_count;
  out->active = item.value("active", true);
  out->registered_height = item.value("registered_height", 0u);
  return true;
}

}  // namespace

bool LoadRegistrationRequests(const std::filesystem::path& path,
                              std::vector<RegistrationRequest>* out, std::string* error) {
  std::ifstream in(path);
  if (!in) {
    if (error) *error = "failed to open identities file: " + path.string();
    return false;
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::exception& ex) {
    if (error) *error = path.string() + ": " + ex.what();
    return false;
  }
  if (!doc.is_array()) {
    if (error) *error = path.string() + ": expected a JSON array of identities";
    return false;
  }
  out->clear();
  for (std::size_t i = 0; i < doc.size(); ++i) {
    RegistrationRequest request;
    std::string item_error;
    if (!ParseRequest(doc[i], &request, &item_error)) {
      if (error) *error = path.string() + "[" + std::to_string(i) + "]: " + item_error;
      return false;
    }
    out->push_back(request);
  }
  return true;
}

IdentityRegistry::IdentityRegistry(std::filesystem::path path)
    : path_(std::move(path)), active_(std::make_shared<const std::vector<ScanIdentity>>()) {}

bool IdentityRegistry::Load(std::string* error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::vector<IdentityRecord> records;
  std::error_code ec;
  if (std::filesystem::exists(path_, ec)) {
    std::ifstream in(path_);
    if (!in) {
      if (error) *error = "failed to open " + path_.string();
      return false;
    }
    nlohmann::json doc;
    try {
      in >> doc;
    } catch (const nlohmann::json::exception& ex) {
      if (error) *error = path_.string() + ": " + ex.what();
      return false;
    }
    if (!doc.is_object() || doc.value("version", 0) != kRegistryVersion ||
        !doc.contains("identities") || !doc.at("identities").is_array()) {
      if (error) *error = path_.string() + ": unsupported identity registry format";
      return false;
    }
    for (const auto& item : doc.at("identities")) {
      IdentityRecord record;
      if (!RecordFromJson(item, &record, error)) {
        return false;
      }
      records.push_back(record);
    }
    std::sort(records.begin(), records.end(),
              [](const IdentityRecord& a, const IdentityRecord& b) { return a.id < b.id; });
  }
  std::shared_ptr<const std::vector<ScanIdentity>> active;
  if (!BuildActiveLocked(records, &active, error)) {
    return false;
  }
  records_ = std::move(records);
  active_ = std::move(active);
  util::LogInfo("registry", "loaded " + std::to_string(records_.size()) + " identities (" +
                                std::to_string(active_->size()) + " active)");
  return true;
}

bool IdentityRegistry::Register(const RegistrationRequest& request,
                                std::uint32_t registered_height, std::uint32_t* id,
                                std::string* error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::vector<IdentityRecord> records = records_;
  std::uint32_t next_id = 1;
  for (auto& record : records) {
    next_id = std::max(next_id, record.id + 1);
  }
  for (auto& record : records) {
    if (!record.active || record.scan_secret != request.scan_secret ||
        record.spend_pubkey != request.spend_pubkey) {
      continue;
    }
    if (record.label_count == request.label_count) {
      if (id) *id = record.id;
      return true;
    }
    util::LogInfo("registry", "retiring identity " + std::to_string(record.id) +
                                  " (label count changed)");
    record.active = false;
  }

  IdentityRecord added;
  added.id = next_id;
  added.scan_secret = request.scan_secret;
  added.spend_pubkey = request.spend_pubkey;
  added.label_count = request.label_count;
  added.active = true;
  added.registered_height = registered_height;
  records.push_back(added);

  std::shared_ptr<const std::vector<ScanIdentity>> active;
  if (!BuildActiveLocked(records, &active, error)) {
    return false;
  }
  if (!SaveLocked(records, error)) {
    return false;
  }
  records_ = std::move(records);
  active_ = std::move(active);
  util::LogInfo("registry", "registered identity " + std::to_string(added.id) + " with " +
                                std::to_string(added.label_count) + " labels");
  if (id) *id = added.id;
  return true;
}

std::shared_ptr<const std::vector<ScanIdentity>> IdentityRegistry::ActiveIdentities() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return active_;
}

std::vector<IdentityRecord> IdentityRegistry::Records() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return records_;
}

std::optional<IdentityRecord> IdentityRegistry::Find(std::uint32_t id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (const auto& record : records_) {
    if (record.id == id) {
      return record;
    }
  }
  return std::nullopt;
}

bool IdentityRegistry::SaveLocked(const std::vector<IdentityRecord>& records,
                                  std::string* error) const {
  nlohmann::json doc;
  doc["version"] = kRegistryVersion;
  doc["identities"] = nlohmann::json::array();
  for (const auto& record : records) {
    doc["identities"].push_back(RecordToJson(record));
  }
  const std::string text = doc.dump(2) + "\n";
  if (!util::AtomicWriteFile(
          path_,
          [&text](std::ofstream& out) {
            out << text;
            return out.good();
          },
          error)) {
    return false;
  }
  // The file holds scan secrets.
  std::error_code ec;
  std::filesystem::permissions(
      path_, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
      std::filesystem::perm_options::replace, ec);
  if (ec) {
    util::LogWarn("registry", "failed to restrict permissions on " + path_.string());
  }
  return true;
}

bool IdentityRegistry::BuildActiveLocked(const std::vector<IdentityRecord>& records,
                                         std::shared_ptr<const std::vector<ScanIdentity>>* out,
                                         std::string* error) const {
  auto identities = std::make_shared<std::vector<ScanIdentity>>();
  for (const auto& record : records) {
    if (!record.active) {
      continue;
    }
    ScanIdentity identity;
    std::string build_error;
    if (!ScanIdentity::Create(record.id, record.scan_secret, record.spend_pubkey,
                              record.label_count, &identity, &build_error)) {
      if (error) *error = "identity " + std::to_string(record.id) + ": " + build_error;
      return false;
    }
    identities->push_back(std::move(identity));
  }
  *out = std::move(identities);
  return true;
}

}  // namespace sps::scan

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "scan/detected_payment.hpp"
#include "scan/identity_registry.hpp"
#include "storage/payment_index.hpp"
#include "storage/tweak_store.hpp"
#include "storage/watermark.hpp"

namespace sps::node {

// Read surface for a transport layer. Results never extend above the
// committed tip.
class QueryInterface {
 public:
  virtual ~QueryInterface() = default;

  virtual std::optional<storage::Watermark> Tip() const = 0;
  virtual std::vector<scan::IdentityRecord> Identities() const = 0;
  virtual std::vector<scan::DetectedPayment> Payments(
      std::uint32_t identity, std::optional<std::uint32_t> min_height,
      std::optional<std::uint32_t> max_height) const = 0;
  // Cursor over payments strictly above `height`, bounded by the tip at the
  // time of the call. Its position() can be stored and resumed with Seek().
  virtual storage::PaymentCursor PaymentsSince(std::uint32_t identity,
                                               std::uint32_t height) const = 0;
  virtual bool BlockTweaks(std::uint32_t height, storage::BlockTweaks* out,
                           std::string* error) const = 0;
};

class IndexQueryService : public QueryInterface {
 public:
  using TipFn = std::function<std::optional<storage::Watermark>()>;

  IndexQueryService(const storage::PaymentIndex* index, const storage::TweakStore* tweaks,
                    const scan::IdentityRegistry* registry, TipFn tip);

  std::optional<storage::Watermark> Tip() const override;
  std::vector<scan::IdentityRecord> Identities() const override;
  std::vector<scan::DetectedPayment> Payments(
      std::uint32_t identity, std::optional<std::uint32_t> min_height,
      std::optional<std::uint32_t> max_height) const override;
  storage::PaymentCursor PaymentsSince(std::uint32_t identity,
                                       std::uint32_t height) const override;
  bool BlockTweaks(std::uint32_t height, storage::BlockTweaks* out,
                   std::string* error) const override;

 private:
  std::optional<std::uint32_t> CapAtTip(std::optional<std::uint32_t> max_height,
                                        bool* empty) const;

  const storage::PaymentIndex* index_;
  const storage::TweakStore* tweaks_;
  const scan::IdentityRegistry* registry_;
  TipFn tip_;
};

nlohmann::json TipToJson(const std::optional<storage::Watermark>& tip);
nlohmann::json PaymentToJson(const scan::DetectedPayment& payment);
// Public view of an identity; the scan secret is never rendered.
nlohmann::json IdentityToJson(const scan::IdentityRecord& record);
nlohmann::json BlockTweaksToJson(const storage::BlockTweaks& block);

}  // namespace sps::node

#include "crypto/secp256k1_ops.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

#include <secp256k1.h>

namespace sps::crypto {

namespace {

struct ContextDeleter {
  void operator()(secp256k1_context* ctx) const { secp256k1_context_destroy(ctx); }
};

// Shared by all threads; the context is never mutated after creation.
const secp256k1_context* Context() {
  static const std::unique_ptr<secp256k1_context, ContextDeleter> ctx([] {
    secp256k1_context* created = secp256k1_context_create(SECP256K1_CONTEXT_NONE);
    if (created == nullptr) {
      throw std::runtime_error("failed to create secp256k1 context");
    }
    return created;
  }());
  return ctx.get();
}

bool Parse(const PubKey& key, secp256k1_pubkey* out) {
  return secp256k1_ec_pubkey_parse(Context(), out, key.data(), key.size()) == 1;
}

bool Serialize(const secp256k1_pubkey& point, PubKey* out) {
  std::size_t len = out->size();
  return secp256k1_ec_pubkey_serialize(Context(), out->data(), &len, &point,
                                       SECP256K1_EC_COMPRESSED) == 1 &&
         len == out->size();
}

}  // namespace

bool IsValidPubKey(const PubKey& key) {
  secp256k1_pubkey parsed;
  return Parse(key, &parsed);
}

bool IsValidScalar(const Scalar& scalar) {
  return secp256k1_ec_seckey_verify(Context(), scalar.data()) == 1;
}

bool PubKeyFromScalar(const Scalar& secret, PubKey* out) {
  secp256k1_pubkey point;
  if (secp256k1_ec_pubkey_create(Context(), &point, secret.data()) != 1) {
    return false;
  }
  return Serialize(point, out);
}

bool NegateScalar(const Scalar& scalar, Scalar* out) {
  Scalar tmp = scalar;
  if (secp256k1_ec_seckey_negate(Context(), tmp.data()) != 1) {
    return false;
  }
  *out = tmp;
  return true;
}

bool AddScalars(const Scalar& a, const Scalar& b, Scalar* out) {
  Scalar tmp = a;
  if (secp256k1_ec_seckey_tweak_add(Context(), tmp.data(), b.data()) != 1) {
    return false;
  }
  *out = tmp;
  return true;
}

bool MultiplyScalars(const Scalar& a, const Scalar& b, Scalar* out) {
  Scalar tmp = a;
  if (secp256k1_ec_seckey_tweak_mul(Context(), tmp.data(), b.data()) != 1) {
    return false;
  }
  *out = tmp;
  return true;
}

bool SumPubKeys(std::span<const PubKey> keys, PubKey* out, bool* is_infinity) {
  if (is_infinity) {
    *is_infinity = false;
  }
  if (keys.empty()) {
    return false;
  }
  std::vector<secp256k1_pubkey> parsed(keys.size());
  std::vector<const secp256k1_pubkey*> pointers;
  pointers.reserve(keys.size());
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (!Parse(keys[i], &parsed[i])) {
      return false;
    }
    pointers.push_back(&parsed[i]);
  }
  secp256k1_pubkey sum;
  if (secp256k1_ec_pubkey_combine(Context(), &sum, pointers.data(), pointers.size()) != 1) {
    // Every input parsed, so the only failure left is the identity element.
    if (is_infinity) {
      *is_infinity = true;
    }
    return false;
  }
  return Serialize(sum, out);
}

bool AddPoints(const PubKey& a, const PubKey& b, PubKey* out) {
  const std::array<PubKey, 2> keys{a, b};
  return SumPubKeys(keys, out, nullptr);
}

bool NegatePoint(const PubKey& point, PubKey* out) {
  secp256k1_pubkey parsed;
  if (!Parse(point, &parsed) || secp256k1_ec_pubkey_negate(Context(), &parsed) != 1) {
    return false;
  }
  return Serialize(parsed, out);
}

bool SubtractPoints(const PubKey& a, const PubKey& b, PubKey* out) {
  PubKey negated{};
  if (!NegatePoint(b, &negated)) {
    return false;
  }
  return AddPoints(a, negated, out);
}

bool MultiplyPoint(const PubKey& point, const Scalar& scalar, PubKey* out) {
  secp256k1_pubkey parsed;
  if (!Parse(point, &parsed) ||
      secp256k1_ec_pubkey_tweak_mul(Context(), &parsed, scalar.data()) != 1) {
    return false;
  }
  return Serialize(parsed, out);
}

bool AddTweakToPoint(const PubKey& point, const Scalar& tweak, PubKey* out) {
  secp256k1_pubkey parsed;
  if (!Parse(point, &parsed) ||
      secp256k1_ec_pubkey_tweak_add(Context(), &parsed, tweak.data()) != 1) {
    return false;
  }
  return Serialize(parsed, out);
}

Scalar TaggedHash(std::string_view tag, std::span<const std::uint8_t> msg) {
  Scalar out{};
  if (secp256k1_tagged_sha256(Context(), out.data(),
                              reinterpret_cast<const unsigned char*>(tag.data()), tag.size(),
                              msg.data(), msg.size()) != 1) {
    throw std::runtime_error("secp256k1_tagged_sha256 failed");
  }
  return out;
}

XOnlyKey ToXOnly(const PubKey& key) {
  XOnlyKey out{};
  std::copy(key.begin() + 1, key.end(), out.begin());
  return out;
}

PubKey EvenYFromXOnly(const XOnlyKey& x) {
  PubKey out{};
  out[0] = 0x02;
  std::copy(x.begin(), x.end(), out.begin() + 1);
  return out;
}

}  // namespace sps::crypto

#include "pine/hash.hpp"

// Hash authority for the integrity index.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive.
//   2. Domain separation: "evt:" for leaves, "node:" for interior nodes. A leaf
//      digest can never be replayed as an interior node and vice versa.
//   3. Interior nodes hash the raw 32-byte children, left then right. Proofs
//      produced by any implementation verify against any other only if this
//      exact pairing is kept.
//
// MICRO_DOCUMENTED: to_hex() uses a lookup table (kHexChars) for nibble
// encoding instead of snprintf("%02x").

extern "C" {
#include <blake3.h>
}

namespace pine {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

// Decode a single hex character to its nibble value.
// Returns 0xFF on invalid character.
inline uint8_t hex_nibble(char c) {
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
  return 0xFF;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.version = blake3_version();
  info.primitive = "blake3";
  info.backend = "system";
  info.blake3_available = true;
  return info;
}

std::string blake3_hex(std::string_view payload) {
  const Digest d = hash_bytes_blake3(payload);
  return to_hex(d.data(), d.size());
}

Digest hash_bytes_blake3(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  Digest out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return out;
}

Digest hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  Digest out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return out;
}

Digest event_content_hash(std::string_view canonical_event_json) {
  return hash_domain("evt:", canonical_event_json);
}

Digest node_hash(const Digest& left, const Digest& right) {
  static constexpr char kDomain[] = "node:";
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, kDomain, sizeof(kDomain) - 1);
  blake3_hasher_update(&hasher, left.data(), left.size());
  blake3_hasher_update(&hasher, right.data(), right.size());
  Digest out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return out;
}

const Digest& zero_digest() {
  static const Digest kZero{};
  return kZero;
}

std::string digest_to_hex(const Digest& d) {
  return to_hex(d.data(), d.size());
}

std::optional<Digest> digest_from_hex(std::string_view hex) {
  if (hex.size() != 64) return std::nullopt;
  Digest out{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    const uint8_t hi = hex_nibble(hex[i * 2]);
    const uint8_t lo = hex_nibble(hex[i * 2 + 1]);
    if (hi == 0xFF || lo == 0xFF) return std::nullopt;
    out[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return out;
}

}  // namespace pine

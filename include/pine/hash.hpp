#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pine {

// Raw 32-byte BLAKE3 output. Hex encoding is only used at the edges
// (JSON, CLI, logs).
using Digest = std::array<uint8_t, 32>;

struct HashRuntimeInfo {
  std::string primitive;
  std::string backend;
  std::string version;
  bool blake3_available{false};
};

HashRuntimeInfo hash_runtime_info();

// Core BLAKE3 hashing
std::string blake3_hex(std::string_view payload);
Digest hash_bytes_blake3(std::string_view payload);

// Domain-separated hashing. The domain prefix is part of the hash schema
// (see version::HASH_ALGORITHM_VERSION).
Digest hash_domain(std::string_view domain, std::string_view payload);

// Leaf hash of an event's canonical JSON form.
Digest event_content_hash(std::string_view canonical_event_json);

// Interior Merkle node. Order-sensitive: node_hash(a, b) != node_hash(b, a)
// whenever a != b.
Digest node_hash(const Digest& left, const Digest& right);

// All-zero padding leaf.
const Digest& zero_digest();

std::string digest_to_hex(const Digest& d);

// Parses a 64-char hex string. Returns nullopt on bad length or character.
std::optional<Digest> digest_from_hex(std::string_view hex);

}  // namespace pine

#pragma once

// pine/merkle.hpp: Integrity index over captured events.
//
// TREE SHAPE:
//   Leaves are the event content hashes ordered by ascending EventId. The leaf
//   row is padded with zero_digest() up to the next power of two, then
//   adjacent pairs are combined with node_hash(left, right) until one digest
//   remains. An empty leaf set has no root.
//
// INVARIANTS:
//   - The root is a pure function of the leaf set. Insertion order is
//     irrelevant because leaves are always combined in key order.
//   - Every level is rebuilt from scratch on insert (O(n)). levels_ caches
//     the result so proof generation is O(log n) reads.
//   - Proofs emitted here verify under verify_proof() with any root computed
//     by the same pairing, padding and left/right convention.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pine/hash.hpp"
#include "pine/types.hpp"

namespace pine {

struct ProofStep {
  Digest sibling{};
  bool sibling_is_left{false};
};

struct MerkleProof {
  std::vector<ProofStep> path;  // leaf level first
  Digest leaf_hash{};
  EventId event_id{0};

  std::string to_json() const;
};

// Inverse of MerkleProof::to_json(). nullopt on any malformed field.
std::optional<MerkleProof> proof_from_value(const jsonlite::Value& v);

struct BatchProof {
  Digest batch_root{};
  std::vector<MerkleProof> proofs;
  uint64_t batch_id{0};
  uint64_t event_count{0};  // number of ids requested, not number resolved

  std::string to_json() const;
};

class MerkleIndex {
 public:
  explicit MerkleIndex(uint32_t depth = 16) : depth_(depth) {}

  // Stores or overwrites the leaf for id and recomputes the root. Never fails.
  void insert(EventId id, const Digest& content_hash);

  // Convenience for callers holding raw event bytes: hashes with the "evt:"
  // domain before inserting.
  void insert_data(EventId id, std::string_view event_bytes);

  std::optional<Digest> root() const;

  // nullopt if id is not indexed.
  std::optional<MerkleProof> generate_proof(EventId id) const;

  // Pure predicate. Never throws.
  static bool verify_proof(const Digest& root, const MerkleProof& proof);

  // nullopt if the tree is empty or none of ids resolves.
  std::optional<BatchProof> generate_batch_proof(const std::vector<EventId>& ids,
                                                 uint64_t batch_id) const;

  void clear();

  size_t event_count() const { return leaves_.size(); }
  bool empty() const { return leaves_.empty(); }
  uint32_t depth() const { return depth_; }
  const std::map<EventId, Digest>& leaves() const { return leaves_; }

 private:
  void recompute();

  uint32_t depth_;  // informational only
  std::map<EventId, Digest> leaves_;
  // levels_[0] is the padded leaf row; levels_.back() holds the root alone.
  std::vector<std::vector<Digest>> levels_;
};

}  // namespace pine

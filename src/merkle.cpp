#include "pine/merkle.hpp"

#include <bit>
#include <iterator>
#include <sstream>

namespace pine {

namespace {

std::string proof_body_json(const MerkleProof& p) {
  std::ostringstream o;
  o << "{\"event_id\":" << p.event_id
    << ",\"leaf_hash\":\"" << digest_to_hex(p.leaf_hash) << "\""
    << ",\"path\":[";
  for (size_t i = 0; i < p.path.size(); ++i) {
    if (i) o << ",";
    o << "{\"sibling\":\"" << digest_to_hex(p.path[i].sibling) << "\""
      << ",\"sibling_is_left\":" << (p.path[i].sibling_is_left ? "true" : "false") << "}";
  }
  o << "]}";
  return o.str();
}

}  // namespace

std::string MerkleProof::to_json() const { return proof_body_json(*this); }

std::optional<MerkleProof> proof_from_value(const jsonlite::Value& v) {
  const auto* o = std::get_if<jsonlite::Object>(&v.v);
  if (!o) return std::nullopt;
  MerkleProof p;
  p.event_id = jsonlite::get_u64(*o, "event_id", 0);
  auto leaf = digest_from_hex(jsonlite::get_string(*o, "leaf_hash"));
  if (!leaf) return std::nullopt;
  p.leaf_hash = *leaf;
  const jsonlite::Array* path = jsonlite::get_array(*o, "path");
  if (!path) return std::nullopt;
  for (const auto& step : *path) {
    const auto* so = std::get_if<jsonlite::Object>(&step.v);
    if (!so) return std::nullopt;
    auto sibling = digest_from_hex(jsonlite::get_string(*so, "sibling"));
    if (!sibling) return std::nullopt;
    p.path.push_back(ProofStep{*sibling, jsonlite::get_bool(*so, "sibling_is_left")});
  }
  return p;
}

std::string BatchProof::to_json() const {
  std::ostringstream o;
  o << "{\"batch_id\":" << batch_id
    << ",\"batch_root\":\"" << digest_to_hex(batch_root) << "\""
    << ",\"event_count\":" << event_count
    << ",\"proofs\":[";
  for (size_t i = 0; i < proofs.size(); ++i) {
    if (i) o << ",";
    o << proof_body_json(proofs[i]);
  }
  o << "]}";
  return o.str();
}

// ---------------------------------------------------------------------------
// MerkleIndex
// ---------------------------------------------------------------------------

void MerkleIndex::insert(EventId id, const Digest& content_hash) {
  leaves_[id] = content_hash;
  recompute();
}

void MerkleIndex::insert_data(EventId id, std::string_view event_bytes) {
  insert(id, event_content_hash(event_bytes));
}

void MerkleIndex::recompute() {
  levels_.clear();
  if (leaves_.empty()) return;

  std::vector<Digest> row;
  row.reserve(std::bit_ceil(leaves_.size()));
  for (const auto& [id, h] : leaves_) row.push_back(h);
  row.resize(std::bit_ceil(row.size()), zero_digest());

  levels_.push_back(std::move(row));
  while (levels_.back().size() > 1) {
    const auto& cur = levels_.back();
    std::vector<Digest> next;
    next.reserve(cur.size() / 2);
    for (size_t i = 0; i < cur.size(); i += 2) {
      next.push_back(node_hash(cur[i], cur[i + 1]));
    }
    levels_.push_back(std::move(next));
  }
}

std::optional<Digest> MerkleIndex::root() const {
  if (levels_.empty()) return std::nullopt;
  return levels_.back().front();
}

std::optional<MerkleProof> MerkleIndex::generate_proof(EventId id) const {
  auto it = leaves_.find(id);
  if (it == leaves_.end()) return std::nullopt;

  MerkleProof proof;
  proof.event_id = id;
  proof.leaf_hash = it->second;

  size_t index = static_cast<size_t>(std::distance(leaves_.begin(), it));
  // Every level except the root contributes one sibling.
  for (size_t level = 0; level + 1 < levels_.size(); ++level) {
    const auto& row = levels_[level];
    const bool odd = (index % 2) == 1;
    const size_t sibling = odd ? index - 1 : index + 1;
    proof.path.push_back(ProofStep{row[sibling], odd});
    index /= 2;
  }
  return proof;
}

bool MerkleIndex::verify_proof(const Digest& root, const MerkleProof& proof) {
  Digest current = proof.leaf_hash;
  for (const auto& step : proof.path) {
    current = step.sibling_is_left ? node_hash(step.sibling, current)
                                   : node_hash(current, step.sibling);
  }
  return current == root;
}

std::optional<BatchProof> MerkleIndex::generate_batch_proof(const std::vector<EventId>& ids,
                                                            uint64_t batch_id) const {
  const auto r = root();
  if (!r) return std::nullopt;

  BatchProof batch;
  batch.batch_root = *r;
  batch.batch_id = batch_id;
  batch.event_count = ids.size();
  for (EventId id : ids) {
    if (auto p = generate_proof(id)) batch.proofs.push_back(std::move(*p));
  }
  if (batch.proofs.empty()) return std::nullopt;
  return batch;
}

void MerkleIndex::clear() {
  leaves_.clear();
  levels_.clear();
}

}  // namespace pine

#pragma once

#include <glyphchain/schema/chain_head.hpp>
#include <glyphchain/schema/encoding/scale/encoder.hpp>
#include <glyphchain/schema/primitives.hpp>
#include <glyphchain/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_set>
#include <vector>

namespace glyphchain::registry {

class chain_head_registry;

struct registry_stats final {
  uint64_t authors{};
  uint64_t active_authors{};
  uint64_t total_units{};
};

using registry_stats_t = registry_stats;

/// Exclusive right to publish for one author, released on destruction.
class author_lease final {
 public:
  author_lease(const author_lease&) = delete;
  author_lease& operator=(const author_lease&) = delete;
  author_lease(author_lease&& other) noexcept;
  author_lease& operator=(author_lease&&) = delete;
  ~author_lease();

  const glyphchain::schema::author_id_t& author_id() const {
    return author_id_;
  }

 private:
  friend class chain_head_registry;
  author_lease(chain_head_registry& registry,
               glyphchain::schema::author_id_t author_id);

  chain_head_registry* registry_;
  glyphchain::schema::author_id_t author_id_;
};

/// Per-author chain heads, persisted in the key-value store, plus the
/// per-author publishing lock.
///
/// Heads only move forward through advance_head, which the publish
/// orchestrator calls once every chunk of a document is confirmed.
class chain_head_registry final {
 public:
  explicit chain_head_registry(
      glyphchain::storage::rocksdb_storage_t& storage);

  std::optional<glyphchain::schema::chain_head_t> get_head(
      const glyphchain::schema::author_id_t& author_id) const;

  /// Point the author's head at `new_unit_id` and bump the unit count in one
  /// step. Creates the head on the author's first publish. A head already at
  /// `new_unit_id` is returned unchanged.
  glyphchain::schema::chain_head_t advance_head(
      const glyphchain::schema::author_id_t& author_id,
      const glyphchain::schema::unit_id_t& new_unit_id);

  /// Record the author's genesis unit without touching latest_unit_id.
  void register_genesis(const glyphchain::schema::author_id_t& author_id,
                        const glyphchain::schema::unit_id_t& genesis_unit_id);

  /// Returns false when the author was not registered.
  bool remove(const glyphchain::schema::author_id_t& author_id);

  /// Heads with a latest unit, in author order.
  std::vector<glyphchain::schema::chain_head_t> list_active_authors() const;

  std::vector<glyphchain::schema::chain_head_t> list_all() const;

  void clear_all();

  registry_stats_t stats() const;

  /// Throws common::error (concurrent_publish_conflict) if another flow
  /// already holds the author.
  author_lease acquire_author(const glyphchain::schema::author_id_t& author_id);

  bool is_author_busy(const glyphchain::schema::author_id_t& author_id) const;

 private:
  friend class author_lease;
  void release_author(const glyphchain::schema::author_id_t& author_id);

  mutable std::mutex mutex_;
  mutable std::mutex lease_mutex_;
  glyphchain::schema::encoding::scale_encoder_t encoder_;
  glyphchain::storage::rocksdb_storage_t& storage_;
  std::unordered_set<glyphchain::schema::author_id_t> busy_authors_;
};

}  // namespace glyphchain::registry

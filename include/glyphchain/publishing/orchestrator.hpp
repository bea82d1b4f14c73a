#pragma once

#include <glyphchain/chunking/chunker.hpp>
#include <glyphchain/crypto/signer.hpp>
#include <glyphchain/integrity/verifier.hpp>
#include <glyphchain/ledger/ledger.hpp>
#include <glyphchain/registry/chain_head_registry.hpp>
#include <glyphchain/schema/chunk_status.hpp>
#include <glyphchain/schema/encoding/scale/encoder.hpp>
#include <glyphchain/schema/manifest.hpp>
#include <glyphchain/schema/primitives.hpp>
#include <glyphchain/schema/publish_operation.hpp>
#include <glyphchain/schema/publish_stage.hpp>
#include <glyphchain/storage/rocksdb/storage.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace glyphchain::publishing {

struct publish_config final {
  glyphchain::chunking::chunk_limits limits;
  glyphchain::ledger::retry_policy_t retry;
};

using publish_config_t = publish_config;

/// Point-in-time view of an operation.
struct publish_status final {
  glyphchain::schema::operation_id_t operation_id;
  glyphchain::schema::author_id_t author_id;
  glyphchain::schema::publish_stage_t stage{
      glyphchain::schema::publish_stage_t::preparing};
  uint32_t progress{};
  uint32_t total_chunks{};
  uint32_t confirmed{};
  uint32_t failed{};
  uint32_t pending{};
  std::vector<glyphchain::schema::chunk_status_t> chunk_statuses;
  std::string error;
};

using publish_status_t = publish_status;
using progress_callback_t = std::function<void(const publish_status_t&)>;

/// Progress reported while publishing: the first and last tenth are
/// reserved for preparation and finalization.
uint32_t publishing_progress(uint32_t confirmed, uint32_t total);

/// Drives documents onto the ledger chunk by chunk.
///
/// Chunks of one operation are submitted strictly in index order. Operations
/// for different authors run fully in parallel; operations for the same
/// author are serialized through the registry's author lease. Operations are
/// persisted after every chunk outcome so a partial publish can be resumed
/// after a restart, and the chain head only moves once every chunk of a
/// document is confirmed.
class orchestrator final {
 public:
  orchestrator(glyphchain::ledger::ledger& ledger,
               glyphchain::registry::chain_head_registry& registry,
               glyphchain::storage::rocksdb_storage_t& storage,
               const glyphchain::chunking::chunker& chunker,
               const glyphchain::integrity::verifier& verifier,
               publish_config_t config);

  /// Normalize and split `document` for `author`; nothing is submitted yet.
  ///
  /// Throws common::error: invalid_argument for an empty document or a
  /// title too long for one unit, concurrent_publish_conflict while the
  /// author still has an unfinished operation with confirmed chunks.
  glyphchain::schema::operation_id_t create_publish_operation(
      const glyphchain::crypto::signer_t& author,
      const std::string& title,
      std::string_view document);

  /// Submit every chunk of a freshly created operation. Returns the final
  /// status; chunk-level failures are reported there, not thrown. An
  /// exception escaping the ledger or `on_progress` leaves the operation
  /// partial (or error when nothing was confirmed) and is rethrown.
  publish_status_t publish(const glyphchain::schema::operation_id_t& id,
                           const glyphchain::crypto::signer_t& signer,
                           const progress_callback_t& on_progress = {});

  /// Retry the failed and pending chunks of a partial or failed operation.
  /// Published chunks are never submitted again.
  publish_status_t resume(const glyphchain::schema::operation_id_t& id,
                          const glyphchain::crypto::signer_t& signer,
                          const progress_callback_t& on_progress = {});

  /// Request cancellation of an operation that is publishing. Takes effect
  /// before the next chunk submission. False when not publishing; throws
  /// common::error (not_found) for an id this orchestrator never saw.
  bool cancel(const glyphchain::schema::operation_id_t& id);

  /// Drop a partial, failed or never-started operation without publishing
  /// the rest. Confirmed chunks stay orphaned on the ledger. False when there
  /// is no such operation to drop.
  bool discard(const glyphchain::schema::operation_id_t& id);

  /// Finished operations report a summary without per-chunk statuses.
  std::optional<publish_status_t> get_status(
      const glyphchain::schema::operation_id_t& id) const;

  /// Operations that have not reached a terminal stage.
  std::vector<publish_status_t> list_operations() const;

  std::optional<glyphchain::schema::manifest_t> get_manifest(
      const glyphchain::schema::operation_id_t& id) const;

 private:
  struct operation_slot final {
    mutable std::mutex mutex;
    glyphchain::schema::publish_operation_t operation;
    std::atomic<bool> cancel_requested{false};
  };

  using slot_ptr = std::shared_ptr<operation_slot>;

  publish_status_t run(const slot_ptr& slot,
                       const glyphchain::crypto::signer_t& signer,
                       const progress_callback_t& on_progress);

  /// Submit one chunk with retries. Returns false when the chunk ended up
  /// failed; `fatal` is set for non-retriable outcomes.
  bool submit_chunk(const slot_ptr& slot,
                    std::size_t index,
                    const std::optional<glyphchain::schema::unit_id_t>& previous,
                    const glyphchain::crypto::signer_t& signer,
                    glyphchain::ledger::freshness_token_t& token,
                    bool& fatal);

  void finalize(const slot_ptr& slot, bool fatal);

  /// Settle an operation whose run was cut short by an exception.
  void abandon(const slot_ptr& slot, std::string_view reason);

  /// Forget a finished operation's chunks; cancelled ones keep a summary.
  void retire(const slot_ptr& slot);

  std::optional<glyphchain::schema::unit_id_t> chain_link(
      const glyphchain::schema::author_id_t& author_id) const;

  bool has_unfinished_chain(const glyphchain::schema::author_id_t& author_id,
                            const glyphchain::schema::operation_id_t& except)
      const;

  glyphchain::schema::operation_id_t next_operation_id(
      const glyphchain::schema::author_id_t& author_id);

  slot_ptr find(const glyphchain::schema::operation_id_t& id) const;
  /// nullptr when the operation is not live.
  slot_ptr try_find(const glyphchain::schema::operation_id_t& id) const;
  /// Like find, but a finished operation is invalid_argument.
  slot_ptr find_live(const glyphchain::schema::operation_id_t& id) const;
  bool is_finished(const glyphchain::schema::operation_id_t& id) const;

  /// Caller holds slot->mutex.
  void persist_locked(const operation_slot& slot);
  static publish_status_t snapshot_locked(const operation_slot& slot);
  publish_status_t notify(const slot_ptr& slot,
                          const progress_callback_t& on_progress);

  void load_persisted();

  glyphchain::ledger::ledger& ledger_;
  glyphchain::registry::chain_head_registry& registry_;
  glyphchain::storage::rocksdb_storage_t& storage_;
  const glyphchain::chunking::chunker& chunker_;
  const glyphchain::integrity::verifier& verifier_;
  publish_config_t config_;
  glyphchain::schema::encoding::scale_encoder_t encoder_;
  mutable std::mutex mutex_;
  std::map<glyphchain::schema::operation_id_t, slot_ptr> operations_;
  std::map<glyphchain::schema::operation_id_t, publish_status_t> archived_;
  std::atomic<uint64_t> operation_counter_{0};
};

}  // namespace glyphchain::publishing

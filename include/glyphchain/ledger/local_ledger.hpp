#pragma once

#include <glyphchain/ledger/ledger.hpp>
#include <glyphchain/schema/encoding/scale/encoder.hpp>
#include <glyphchain/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <deque>
#include <mutex>

namespace glyphchain::ledger {

/// Append-only ledger persisted in the local RocksDB store.
///
/// Every confirmed unit advances a sequence number. The freshness token is
/// derived from the sequence and stays valid for `freshness_window`
/// confirmations, after which submissions carrying it are rejected.
/// Signatures are checked with ed25519; a signer whose signature does not
/// verify gets a fatal result. Units are confirmed synchronously inside
/// submit, so its timeout is never reached.
class local_ledger final : public ledger {
 public:
  local_ledger(glyphchain::storage::rocksdb_storage_t& storage,
               std::size_t max_unit_bytes,
               uint64_t freshness_window = 150);

  submit_result_t submit(const glyphchain::schema::bytes_view_t& payload,
                         const glyphchain::crypto::signer_t& signer,
                         const freshness_token_t& freshness_token,
                         std::chrono::milliseconds timeout) override;

  std::optional<glyphchain::schema::bytes_t> fetch(
      const glyphchain::schema::unit_id_t& unit_id) override;

  freshness_token_t current_freshness_token() override;

  uint64_t sequence() const;

 private:
  freshness_token_t token_for(uint64_t sequence) const;
  bool is_fresh(const freshness_token_t& token) const;

  mutable std::mutex mutex_;
  glyphchain::schema::encoding::scale_encoder_t encoder_;
  glyphchain::storage::rocksdb_storage_t& storage_;
  std::size_t max_unit_bytes_;
  uint64_t freshness_window_;
  uint64_t sequence_{};
  std::deque<freshness_token_t> recent_tokens_;
};

}  // namespace glyphchain::ledger

#pragma once

#include <glyphchain/common/capabilities.hpp>
#include <glyphchain/crypto/signer.hpp>
#include <glyphchain/ledger/ledger.hpp>
#include <glyphchain/registry/chain_head_registry.hpp>
#include <glyphchain/schema/encoding/scale/encoder.hpp>
#include <glyphchain/schema/genesis_record.hpp>
#include <glyphchain/schema/primitives.hpp>
#include <glyphchain/storage/rocksdb/storage.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace glyphchain::genesis {

inline constexpr auto kRootGenesisDomain = std::string_view{"GGEN"};
inline constexpr auto kAuthorGenesisDomain = std::string_view{"UGEN"};

glyphchain::schema::hash32_t derive_root_genesis_hash(
    const glyphchain::common::hasher_t& hasher,
    const glyphchain::schema::root_genesis_t& root);

/// Pure: the same inputs always give the same hash, and changing any of them
/// changes it.
glyphchain::schema::hash32_t derive_author_genesis_hash(
    const glyphchain::common::hasher_t& hasher,
    std::string_view author_public_identity,
    std::string_view root_id,
    std::string_view label);

bool verify(const glyphchain::common::hasher_t& hasher,
            const glyphchain::schema::genesis_record_t& record);

/// Publishes and reads back the genesis units that anchor every chain.
///
/// The platform root is published once per store and cached from then on.
/// Author genesis units bind an identity to that root and become the first
/// link of the author's chain.
class anchor final {
 public:
  anchor(glyphchain::ledger::ledger& ledger,
         glyphchain::registry::chain_head_registry& registry,
         glyphchain::storage::rocksdb_storage_t& storage,
         glyphchain::common::hasher_t hasher,
         glyphchain::ledger::retry_policy_t retry);

  /// Returns the existing root when there is one. Throws common::error
  /// (ledger_failed) when the submission is not confirmed.
  glyphchain::schema::root_record_t publish_root(
      const glyphchain::crypto::signer_t& deployer,
      const std::string& network);

  std::optional<glyphchain::schema::root_record_t> root() const;

  /// Throws common::error: not_found without a root, invalid_argument when
  /// the author already has a genesis unit, ledger_failed when the
  /// submission is not confirmed.
  glyphchain::schema::genesis_record_t publish_author_genesis(
      const glyphchain::crypto::signer_t& author,
      const std::string& label);

  /// Throws common::error: not_found for an unknown unit,
  /// genesis_validation_failed for anything that is not a valid author
  /// genesis record.
  glyphchain::schema::genesis_record_t read_author_genesis(
      const glyphchain::schema::unit_id_t& unit_id) const;

  const glyphchain::common::hasher_t& hasher() const { return hasher_; }

 private:
  std::optional<glyphchain::schema::root_record_t> load_root_locked() const;

  glyphchain::ledger::ledger& ledger_;
  glyphchain::registry::chain_head_registry& registry_;
  glyphchain::storage::rocksdb_storage_t& storage_;
  glyphchain::common::hasher_t hasher_;
  glyphchain::ledger::retry_policy_t retry_;
  glyphchain::schema::encoding::scale_encoder_t encoder_;
  mutable std::mutex mutex_;
  mutable std::optional<glyphchain::schema::root_record_t> root_;
};

}  // namespace glyphchain::genesis

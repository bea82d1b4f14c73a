#include <glyphchain/common/error.hpp>
#include <glyphchain/genesis/anchor.hpp>
#include <glyphchain/ledger/unit_codec.hpp>
#include <glyphchain/schema/key/builder.hpp>
#include <glyphchain/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

#include <utility>
#include <variant>

namespace glyphchain::genesis {

namespace {

using glyphchain::common::error;
using glyphchain::common::error_code;

error invalid_genesis(const glyphchain::schema::unit_id_t& unit_id,
                      const std::string& detail) {
  return error{error_code::genesis_validation_failed,
               "author genesis " + unit_id + ": " + detail};
}

glyphchain::schema::unit_id_t submit_once(
    glyphchain::ledger::ledger& ledger,
    const glyphchain::schema::bytes_t& payload,
    const glyphchain::crypto::signer_t& signer,
    const glyphchain::ledger::retry_policy_t& retry,
    std::string_view what) {
  auto result = glyphchain::ledger::submit_with_retries(
      ledger, glyphchain::schema::make_bytes_view(payload), signer, retry);
  if (result.status != glyphchain::ledger::submit_status_t::confirmed ||
      !result.unit_id) {
    throw error{error_code::ledger_failed,
                std::string{what} + " not confirmed (" +
                    std::string{glyphchain::ledger::to_string(result.status)} +
                    "): " + result.log};
  }
  return *result.unit_id;
}

}  // namespace

glyphchain::schema::hash32_t derive_root_genesis_hash(
    const glyphchain::common::hasher_t& hasher,
    const glyphchain::schema::root_genesis_t& root) {
  auto preimage = glyphchain::schema::key::builder{}
                      .write(kRootGenesisDomain)
                      .write_field(root.protocol)
                      .write_field(root.network)
                      .write_field(root.deployer_identity)
                      .write(root.timestamp);
  return hasher(glyphchain::schema::make_bytes_view(preimage.data));
}

glyphchain::schema::hash32_t derive_author_genesis_hash(
    const glyphchain::common::hasher_t& hasher,
    const std::string_view author_public_identity,
    const std::string_view root_id,
    const std::string_view label) {
  auto preimage = glyphchain::schema::key::builder{}
                      .write(kAuthorGenesisDomain)
                      .write_field(author_public_identity)
                      .write_field(root_id)
                      .write_field(label);
  return hasher(glyphchain::schema::make_bytes_view(preimage.data));
}

bool verify(const glyphchain::common::hasher_t& hasher,
            const glyphchain::schema::genesis_record_t& record) {
  return derive_author_genesis_hash(hasher, record.author_public_identity,
                                    record.root_id, record.label) ==
         record.derived_hash;
}

anchor::anchor(glyphchain::ledger::ledger& ledger,
               glyphchain::registry::chain_head_registry& registry,
               glyphchain::storage::rocksdb_storage_t& storage,
               glyphchain::common::hasher_t hasher,
               glyphchain::ledger::retry_policy_t retry)
    : ledger_{ledger},
      registry_{registry},
      storage_{storage},
      hasher_{std::move(hasher)},
      retry_{retry} {}

std::optional<glyphchain::schema::root_record_t> anchor::load_root_locked()
    const {
  if (!root_) {
    root_ = storage_.get<glyphchain::schema::root_record_t>(
        encoder_, glyphchain::schema::make_bytes_view(
                      glyphchain::schema::key::kRootGenesisKey));
  }
  return root_;
}

std::optional<glyphchain::schema::root_record_t> anchor::root() const {
  auto lock = std::scoped_lock{mutex_};
  return load_root_locked();
}

glyphchain::schema::root_record_t anchor::publish_root(
    const glyphchain::crypto::signer_t& deployer,
    const std::string& network) {
  auto lock = std::scoped_lock{mutex_};
  if (auto existing = load_root_locked()) {
    spdlog::info("root genesis already published as {}", existing->unit_id);
    return *existing;
  }

  auto genesis = glyphchain::schema::root_genesis_t{};
  genesis.network = network;
  genesis.timestamp = glyphchain::schema::now_milliseconds();
  genesis.deployer_identity = deployer.public_identity;
  genesis.genesis_hash = derive_root_genesis_hash(hasher_, genesis);

  auto unit_id = submit_once(ledger_, glyphchain::ledger::encode_unit(genesis),
                             deployer, retry_, "root genesis");
  auto record = glyphchain::schema::root_record_t{.unit_id = unit_id,
                                                  .genesis = genesis};
  storage_.put(encoder_,
               glyphchain::schema::make_bytes_view(
                   glyphchain::schema::key::kRootGenesisKey),
               record);
  root_ = record;
  spdlog::info("published root genesis {} on {} ({})", unit_id, network,
               glyphchain::schema::to_hex(genesis.genesis_hash));
  return record;
}

glyphchain::schema::genesis_record_t anchor::publish_author_genesis(
    const glyphchain::crypto::signer_t& author,
    const std::string& label) {
  auto root_record = root();
  if (!root_record) {
    throw error{error_code::not_found,
                "no root genesis; publish the root first"};
  }
  if (author.public_identity.empty()) {
    throw error{error_code::invalid_argument, "author has no public identity"};
  }
  if (auto head = registry_.get_head(author.public_identity);
      head && head->genesis_unit_id) {
    throw error{error_code::invalid_argument,
                "author " + author.public_identity +
                    " already has genesis unit " + *head->genesis_unit_id};
  }

  auto genesis = glyphchain::schema::author_genesis_t{};
  genesis.label = label;
  genesis.public_identity = author.public_identity;
  genesis.root_id = glyphchain::schema::to_hex(root_record->genesis.genesis_hash);
  genesis.timestamp = glyphchain::schema::now_milliseconds();
  genesis.author_genesis_hash = derive_author_genesis_hash(
      hasher_, genesis.public_identity, genesis.root_id, genesis.label);

  auto unit_id = submit_once(ledger_, glyphchain::ledger::encode_unit(genesis),
                             author, retry_, "author genesis");
  registry_.register_genesis(author.public_identity, unit_id);
  spdlog::info("published author genesis {} for {} ({})", unit_id,
               author.public_identity, label);

  return glyphchain::schema::genesis_record_t{
      .root_id = genesis.root_id,
      .author_genesis_id = unit_id,
      .author_public_identity = genesis.public_identity,
      .label = genesis.label,
      .derived_hash = genesis.author_genesis_hash};
}

glyphchain::schema::genesis_record_t anchor::read_author_genesis(
    const glyphchain::schema::unit_id_t& unit_id) const {
  auto payload = ledger_.fetch(unit_id);
  if (!payload) {
    throw error{error_code::not_found, "unit " + unit_id + " not found"};
  }
  auto decoded = glyphchain::ledger::try_decode_unit(
      glyphchain::schema::make_bytes_view(*payload));
  if (!decoded) {
    throw invalid_genesis(unit_id, "undecodable payload");
  }
  const auto* genesis =
      std::get_if<glyphchain::schema::author_genesis_t>(&*decoded);
  if (genesis == nullptr) {
    throw invalid_genesis(unit_id, "not an author genesis unit");
  }
  if (genesis->kind != glyphchain::schema::kAuthorGenesisKind) {
    throw invalid_genesis(unit_id, "unexpected kind '" + genesis->kind + "'");
  }
  if (genesis->public_identity.empty() || genesis->root_id.empty()) {
    throw invalid_genesis(unit_id, "missing identity or root");
  }
  if (genesis->version != 1) {
    spdlog::warn("author genesis {} has unexpected version {}", unit_id,
                 genesis->version);
  }
  if (auto root_record = root()) {
    if (root_record->genesis.protocol !=
        glyphchain::schema::kRootGenesisProtocol) {
      spdlog::warn("root genesis has unexpected protocol {}",
                   root_record->genesis.protocol);
    }
    if (glyphchain::schema::to_hex(root_record->genesis.genesis_hash) !=
        genesis->root_id) {
      spdlog::warn("author genesis {} anchors to a different root {}",
                   unit_id, genesis->root_id);
    }
  }

  auto record = glyphchain::schema::genesis_record_t{
      .root_id = genesis->root_id,
      .author_genesis_id = unit_id,
      .author_public_identity = genesis->public_identity,
      .label = genesis->label,
      .derived_hash = genesis->author_genesis_hash};
  if (!verify(hasher_, record)) {
    throw invalid_genesis(unit_id, "derived hash mismatch");
  }
  return record;
}

}  // namespace glyphchain::genesis

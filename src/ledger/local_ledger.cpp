#include <glyphchain/blake3/hash.hpp>
#include <glyphchain/crypto/verify.hpp>
#include <glyphchain/ledger/local_ledger.hpp>
#include <glyphchain/schema/key/builder.hpp>
#include <glyphchain/schema/key/keys.hpp>
#include <glyphchain/schema/ledger_unit.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace glyphchain::ledger {

namespace {

constexpr auto kFreshnessDomain = std::string_view{"FRSH"};
constexpr auto kUnitIdDomain = std::string_view{"UNIT"};

}  // namespace

local_ledger::local_ledger(glyphchain::storage::rocksdb_storage_t& storage,
                           const std::size_t max_unit_bytes,
                           const uint64_t freshness_window)
    : storage_{storage},
      max_unit_bytes_{max_unit_bytes},
      freshness_window_{std::max<uint64_t>(freshness_window, 1)} {
  auto lock = std::scoped_lock{mutex_};
  auto stored = storage_.get<uint64_t>(
      encoder_,
      glyphchain::schema::make_bytes_view(glyphchain::schema::key::kLedgerSequenceKey));
  sequence_ = stored.value_or(0);
  auto first = sequence_ >= freshness_window_ ? sequence_ - freshness_window_ + 1
                                              : uint64_t{0};
  for (auto s = first; s <= sequence_; ++s) {
    recent_tokens_.push_back(token_for(s));
  }
  spdlog::info("local ledger opened at sequence {}", sequence_);
}

freshness_token_t local_ledger::token_for(const uint64_t sequence) const {
  auto preimage =
      glyphchain::schema::key::builder{}.write(kFreshnessDomain).write(sequence);
  return glyphchain::schema::to_hex(glyphchain::blake3::hash(
      glyphchain::schema::make_bytes_view(preimage.data)));
}

bool local_ledger::is_fresh(const freshness_token_t& token) const {
  return std::ranges::find(recent_tokens_, token) != std::end(recent_tokens_);
}

submit_result_t local_ledger::submit(
    const glyphchain::schema::bytes_view_t& payload,
    const glyphchain::crypto::signer_t& signer,
    const freshness_token_t& freshness_token,
    const std::chrono::milliseconds) {
  if (payload.size() > max_unit_bytes_) {
    return {.status = submit_status_t::fatal,
            .unit_id = std::nullopt,
            .log = "payload of " + std::to_string(payload.size()) +
                   " bytes exceeds unit limit " +
                   std::to_string(max_unit_bytes_)};
  }
  if (!signer.sign) {
    return {.status = submit_status_t::fatal,
            .unit_id = std::nullopt,
            .log = "signer has no signing capability"};
  }
  auto signature = signer.sign(payload);
  if (!glyphchain::crypto::verify_signature(
          payload, signer.public_identity,
          glyphchain::schema::make_bytes_view(signature))) {
    return {.status = submit_status_t::fatal,
            .unit_id = std::nullopt,
            .log = "invalid signer"};
  }

  auto lock = std::scoped_lock{mutex_};
  if (!is_fresh(freshness_token)) {
    return {.status = submit_status_t::rejected,
            .unit_id = std::nullopt,
            .log = "stale freshness token"};
  }

  auto sequence = sequence_ + 1;
  auto preimage = glyphchain::schema::key::builder{}
                      .write(kUnitIdDomain)
                      .write(sequence)
                      .write(freshness_token)
                      .write(payload);
  auto unit_id = glyphchain::schema::to_hex(glyphchain::blake3::hash(
      glyphchain::schema::make_bytes_view(preimage.data)));

  auto record = glyphchain::schema::ledger_unit_t{
      .version = 1,
      .sequence = sequence,
      .confirmed_at = glyphchain::schema::now_milliseconds(),
      .signer_identity = signer.public_identity,
      .signature = std::move(signature),
      .payload = glyphchain::schema::make_bytes(payload)};
  storage_.put(encoder_,
               glyphchain::schema::make_bytes_view(
                   glyphchain::schema::key::make_ledger_unit_key(unit_id)),
               record);
  storage_.put(encoder_,
               glyphchain::schema::make_bytes_view(
                   glyphchain::schema::key::kLedgerSequenceKey),
               sequence);

  sequence_ = sequence;
  recent_tokens_.push_back(token_for(sequence_));
  while (recent_tokens_.size() > freshness_window_) {
    recent_tokens_.pop_front();
  }
  spdlog::debug("unit {} confirmed at sequence {}", unit_id, sequence_);
  return {.status = submit_status_t::confirmed,
          .unit_id = std::move(unit_id),
          .log = {}};
}

std::optional<glyphchain::schema::bytes_t> local_ledger::fetch(
    const glyphchain::schema::unit_id_t& unit_id) {
  auto record = storage_.get<glyphchain::schema::ledger_unit_t>(
      encoder_, glyphchain::schema::make_bytes_view(
                    glyphchain::schema::key::make_ledger_unit_key(unit_id)));
  if (!record) {
    return std::nullopt;
  }
  return std::move(record->payload);
}

freshness_token_t local_ledger::current_freshness_token() {
  auto lock = std::scoped_lock{mutex_};
  return recent_tokens_.back();
}

uint64_t local_ledger::sequence() const {
  auto lock = std::scoped_lock{mutex_};
  return sequence_;
}

}  // namespace glyphchain::ledger

#pragma once

#include <glyphchain/ledger/ledger.hpp>
#include <glyphchain/schema/primitives.hpp>

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace glyphchain::testing {

/// In-memory ledger with scripted failures.
///
/// Submission attempts are numbered from 1 across the whole ledger; an
/// attempt listed in the script gets the scripted outcome instead of being
/// confirmed. Signatures are not checked.
class scripted_ledger final : public glyphchain::ledger::ledger {
 public:
  glyphchain::ledger::submit_result_t submit(
      const glyphchain::schema::bytes_view_t& payload,
      const glyphchain::crypto::signer_t& signer,
      const glyphchain::ledger::freshness_token_t& freshness_token,
      std::chrono::milliseconds) override {
    auto latency = std::chrono::milliseconds{};
    {
      auto lock = std::scoped_lock{mutex_};
      latency = latency_;
    }
    if (latency.count() > 0) {
      std::this_thread::sleep_for(latency);
    }

    auto lock = std::scoped_lock{mutex_};
    auto attempt = ++attempts_;
    tokens_seen_.push_back(freshness_token);
    auto scripted = script_.find(attempt);
    auto outcome = scripted != script_.end()
                       ? std::optional{scripted->second}
                       : (fail_from_ && attempt >= *fail_from_ ? fail_status_
                                                               : std::nullopt);
    if (outcome) {
      return {.status = *outcome,
              .unit_id = std::nullopt,
              .log = "scripted failure on attempt " + std::to_string(attempt)};
    }
    auto unit_id = append_locked(glyphchain::schema::make_bytes(payload));
    signers_[unit_id] = signer.public_identity;
    return {.status = glyphchain::ledger::submit_status_t::confirmed,
            .unit_id = unit_id,
            .log = {}};
  }

  std::optional<glyphchain::schema::bytes_t> fetch(
      const glyphchain::schema::unit_id_t& unit_id) override {
    auto lock = std::scoped_lock{mutex_};
    ++fetches_;
    auto found = units_.find(unit_id);
    if (found == units_.end()) {
      return std::nullopt;
    }
    return found->second;
  }

  glyphchain::ledger::freshness_token_t current_freshness_token() override {
    auto lock = std::scoped_lock{mutex_};
    ++token_requests_;
    if (token_unavailable_) {
      throw std::runtime_error{"freshness token unavailable"};
    }
    return "token-" + std::to_string(token_requests_);
  }

  /// Outcome of attempt number `attempt`.
  void fail_attempt(const std::size_t attempt,
                    const glyphchain::ledger::submit_status_t status) {
    auto lock = std::scoped_lock{mutex_};
    script_[attempt] = status;
  }

  /// Every attempt from `attempt` on gets `status`.
  void fail_from(const std::size_t attempt,
                 const glyphchain::ledger::submit_status_t status) {
    auto lock = std::scoped_lock{mutex_};
    fail_from_ = attempt;
    fail_status_ = status;
  }

  void clear_failures() {
    auto lock = std::scoped_lock{mutex_};
    script_.clear();
    fail_from_.reset();
    fail_status_.reset();
  }

  /// While set, current_freshness_token() throws.
  void set_token_unavailable(const bool unavailable) {
    auto lock = std::scoped_lock{mutex_};
    token_unavailable_ = unavailable;
  }

  void set_latency(const std::chrono::milliseconds latency) {
    auto lock = std::scoped_lock{mutex_};
    latency_ = latency;
  }

  /// Store a payload directly, outside the submission path.
  glyphchain::schema::unit_id_t append(
      const glyphchain::schema::bytes_t& payload) {
    auto lock = std::scoped_lock{mutex_};
    return append_locked(payload);
  }

  void replace(const glyphchain::schema::unit_id_t& unit_id,
               const glyphchain::schema::bytes_t& payload) {
    auto lock = std::scoped_lock{mutex_};
    units_[unit_id] = payload;
  }

  void erase(const glyphchain::schema::unit_id_t& unit_id) {
    auto lock = std::scoped_lock{mutex_};
    units_.erase(unit_id);
  }

  std::size_t attempts() const {
    auto lock = std::scoped_lock{mutex_};
    return attempts_;
  }

  /// Units confirmed through submit().
  std::size_t confirmed() const {
    auto lock = std::scoped_lock{mutex_};
    return signers_.size();
  }

  std::size_t fetches() const {
    auto lock = std::scoped_lock{mutex_};
    return fetches_;
  }

  std::size_t token_requests() const {
    auto lock = std::scoped_lock{mutex_};
    return token_requests_;
  }

  std::vector<glyphchain::ledger::freshness_token_t> tokens_seen() const {
    auto lock = std::scoped_lock{mutex_};
    return tokens_seen_;
  }

 private:
  glyphchain::schema::unit_id_t append_locked(
      glyphchain::schema::bytes_t payload) {
    char id[16];
    std::snprintf(id, sizeof(id), "unit-%06zu", ++next_unit_);
    units_.emplace(id, std::move(payload));
    return id;
  }

  mutable std::mutex mutex_;
  std::map<glyphchain::schema::unit_id_t, glyphchain::schema::bytes_t> units_;
  std::map<glyphchain::schema::unit_id_t, std::string> signers_;
  std::map<std::size_t, glyphchain::ledger::submit_status_t> script_;
  std::optional<std::size_t> fail_from_;
  std::optional<glyphchain::ledger::submit_status_t> fail_status_;
  std::vector<glyphchain::ledger::freshness_token_t> tokens_seen_;
  std::chrono::milliseconds latency_{0};
  std::size_t attempts_{};
  std::size_t fetches_{};
  std::size_t next_unit_{};
  std::size_t token_requests_{};
  bool token_unavailable_{false};
};

}  // namespace glyphchain::testing

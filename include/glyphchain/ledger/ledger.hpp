#pragma once

#include <glyphchain/crypto/signer.hpp>
#include <glyphchain/schema/enum_string.hpp>
#include <glyphchain/schema/primitives.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace glyphchain::ledger {

enum class submit_status_t : uint8_t {
  confirmed = 0,
  /// Refused by the ledger, typically a stale freshness token.
  rejected = 1,
  timeout = 2,
  transient = 3,
  /// Will never succeed as submitted (bad signer, payload too large).
  fatal = 4
};

inline constexpr auto kSubmitStatusMappings = std::array{
    std::pair<std::string_view, submit_status_t>{"confirmed",
                                                 submit_status_t::confirmed},
    std::pair<std::string_view, submit_status_t>{"rejected",
                                                 submit_status_t::rejected},
    std::pair<std::string_view, submit_status_t>{"timeout",
                                                 submit_status_t::timeout},
    std::pair<std::string_view, submit_status_t>{"transient",
                                                 submit_status_t::transient},
    std::pair<std::string_view, submit_status_t>{"fatal",
                                                 submit_status_t::fatal}};

inline constexpr std::string_view to_string(const submit_status_t value) {
  return glyphchain::schema::name_of(value, kSubmitStatusMappings);
}

inline constexpr bool is_retriable(const submit_status_t value) {
  return value == submit_status_t::rejected ||
         value == submit_status_t::timeout ||
         value == submit_status_t::transient;
}

struct submit_result final {
  submit_status_t status{submit_status_t::transient};
  std::optional<glyphchain::schema::unit_id_t> unit_id;
  std::string log;
};

using submit_result_t = submit_result;
using freshness_token_t = std::string;

/// Append-only store of opaque, size-bounded units. Implementations must be
/// safe to call from several threads at once.
class ledger {
 public:
  virtual ~ledger() = default;

  /// Submit one payload signed by `signer` and wait up to `timeout` for
  /// confirmation. Implementations own the timeout: a call that cannot be
  /// confirmed in time returns submit_status_t::timeout rather than blocking
  /// past it. Callers do not enforce it for them.
  virtual submit_result_t submit(
      const glyphchain::schema::bytes_view_t& payload,
      const glyphchain::crypto::signer_t& signer,
      const freshness_token_t& freshness_token,
      std::chrono::milliseconds timeout) = 0;

  /// Payload of a confirmed unit, or std::nullopt when unknown.
  virtual std::optional<glyphchain::schema::bytes_t> fetch(
      const glyphchain::schema::unit_id_t& unit_id) = 0;

  /// Token a submission must carry to be accepted right now.
  virtual freshness_token_t current_freshness_token() = 0;
};

struct retry_policy final {
  uint32_t max_attempts{3};
  std::chrono::milliseconds retry_delay{2000};
  std::chrono::milliseconds submit_timeout{30000};
};

using retry_policy_t = retry_policy;

/// One attempt; an exception escaping the ledger is reported as transient.
submit_result_t try_submit(ledger& target,
                           const glyphchain::schema::bytes_view_t& payload,
                           const glyphchain::crypto::signer_t& signer,
                           const freshness_token_t& freshness_token,
                           std::chrono::milliseconds timeout);

/// Submit with the standard retry rules: retriable outcomes are retried up to
/// `policy.max_attempts` with a fixed delay, and a rejection refreshes the
/// freshness token first. Returns the last outcome.
submit_result_t submit_with_retries(
    ledger& target,
    const glyphchain::schema::bytes_view_t& payload,
    const glyphchain::crypto::signer_t& signer,
    const retry_policy_t& policy);

}  // namespace glyphchain::ledger

#include <glyphchain/ledger/ledger.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <thread>

namespace glyphchain::ledger {

submit_result_t try_submit(ledger& target,
                           const glyphchain::schema::bytes_view_t& payload,
                           const glyphchain::crypto::signer_t& signer,
                           const freshness_token_t& freshness_token,
                           const std::chrono::milliseconds timeout) {
  try {
    return target.submit(payload, signer, freshness_token, timeout);
  } catch (const std::exception& e) {
    return submit_result_t{.status = submit_status_t::transient,
                           .unit_id = std::nullopt,
                           .log = e.what()};
  }
}

submit_result_t submit_with_retries(
    ledger& target,
    const glyphchain::schema::bytes_view_t& payload,
    const glyphchain::crypto::signer_t& signer,
    const retry_policy_t& policy) {
  auto token = target.current_freshness_token();
  auto result = submit_result_t{};
  for (auto attempt = uint32_t{1}; attempt <= policy.max_attempts; ++attempt) {
    result = try_submit(target, payload, signer, token, policy.submit_timeout);
    if (result.status == submit_status_t::confirmed ||
        !is_retriable(result.status)) {
      return result;
    }
    spdlog::warn("submission attempt {}/{} {}: {}", attempt,
                 policy.max_attempts, to_string(result.status), result.log);
    if (attempt == policy.max_attempts) {
      break;
    }
    if (result.status == submit_status_t::rejected) {
      token = target.current_freshness_token();
    }
    std::this_thread::sleep_for(policy.retry_delay);
  }
  return result;
}

}  // namespace glyphchain::ledger

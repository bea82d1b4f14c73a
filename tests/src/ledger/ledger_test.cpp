#include <gtest/gtest.h>
#include <glyphchain/ledger/ledger.hpp>
#include <glyphchain/testing/common.hpp>
#include <glyphchain/testing/scripted_ledger.hpp>

#include <stdexcept>
#include <string>

namespace {

using glyphchain::ledger::submit_status_t;

glyphchain::ledger::retry_policy_t fast_policy(const uint32_t attempts = 3) {
  return {.max_attempts = attempts,
          .retry_delay = std::chrono::milliseconds{0},
          .submit_timeout = std::chrono::milliseconds{10}};
}

class throwing_ledger final : public glyphchain::ledger::ledger {
 public:
  glyphchain::ledger::submit_result_t submit(
      const glyphchain::schema::bytes_view_t&,
      const glyphchain::crypto::signer_t&,
      const glyphchain::ledger::freshness_token_t&,
      std::chrono::milliseconds) override {
    throw std::runtime_error{"connection reset"};
  }

  std::optional<glyphchain::schema::bytes_t> fetch(
      const glyphchain::schema::unit_id_t&) override {
    return std::nullopt;
  }

  glyphchain::ledger::freshness_token_t current_freshness_token() override {
    return "token";
  }
};

const auto kPayload = std::string{"payload"};

}  // namespace

TEST(ledger, status_names_and_retriability) {
  EXPECT_EQ(glyphchain::ledger::to_string(submit_status_t::rejected), "rejected");
  EXPECT_TRUE(glyphchain::ledger::is_retriable(submit_status_t::rejected));
  EXPECT_TRUE(glyphchain::ledger::is_retriable(submit_status_t::timeout));
  EXPECT_TRUE(glyphchain::ledger::is_retriable(submit_status_t::transient));
  EXPECT_FALSE(glyphchain::ledger::is_retriable(submit_status_t::fatal));
  EXPECT_FALSE(glyphchain::ledger::is_retriable(submit_status_t::confirmed));
}

TEST(ledger, try_submit_reports_exceptions_as_transient) {
  auto ledger = throwing_ledger{};
  auto result = glyphchain::ledger::try_submit(
      ledger, glyphchain::schema::make_bytes_view(kPayload),
      glyphchain::testing::make_signer(1), "token", std::chrono::milliseconds{1});
  EXPECT_EQ(result.status, submit_status_t::transient);
  EXPECT_EQ(result.log, "connection reset");
  EXPECT_FALSE(result.unit_id.has_value());
}

TEST(ledger, retries_transient_failures) {
  auto ledger = glyphchain::testing::scripted_ledger{};
  ledger.fail_attempt(1, submit_status_t::transient);
  ledger.fail_attempt(2, submit_status_t::timeout);
  auto result = glyphchain::ledger::submit_with_retries(
      ledger, glyphchain::schema::make_bytes_view(kPayload),
      glyphchain::testing::make_signer(1), fast_policy());
  EXPECT_EQ(result.status, submit_status_t::confirmed);
  ASSERT_TRUE(result.unit_id.has_value());
  EXPECT_EQ(ledger.attempts(), 3u);
  EXPECT_EQ(ledger.confirmed(), 1u);
  EXPECT_EQ(glyphchain::schema::make_string(*ledger.fetch(*result.unit_id)),
            kPayload);
}

TEST(ledger, rejection_refreshes_the_freshness_token) {
  auto ledger = glyphchain::testing::scripted_ledger{};
  ledger.fail_attempt(1, submit_status_t::rejected);
  auto result = glyphchain::ledger::submit_with_retries(
      ledger, glyphchain::schema::make_bytes_view(kPayload),
      glyphchain::testing::make_signer(1), fast_policy());
  EXPECT_EQ(result.status, submit_status_t::confirmed);
  auto tokens = ledger.tokens_seen();
  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_NE(tokens[0], tokens[1]);
}

TEST(ledger, fatal_outcomes_are_not_retried) {
  auto ledger = glyphchain::testing::scripted_ledger{};
  ledger.fail_attempt(1, submit_status_t::fatal);
  auto result = glyphchain::ledger::submit_with_retries(
      ledger, glyphchain::schema::make_bytes_view(kPayload),
      glyphchain::testing::make_signer(1), fast_policy());
  EXPECT_EQ(result.status, submit_status_t::fatal);
  EXPECT_EQ(ledger.attempts(), 1u);
}

TEST(ledger, gives_up_after_the_attempt_budget) {
  auto ledger = glyphchain::testing::scripted_ledger{};
  ledger.fail_from(1, submit_status_t::timeout);
  auto result = glyphchain::ledger::submit_with_retries(
      ledger, glyphchain::schema::make_bytes_view(kPayload),
      glyphchain::testing::make_signer(1), fast_policy(4));
  EXPECT_EQ(result.status, submit_status_t::timeout);
  EXPECT_EQ(ledger.attempts(), 4u);
  EXPECT_EQ(ledger.confirmed(), 0u);
}

#include <gtest/gtest.h>
#include <glyphchain/ledger/local_ledger.hpp>
#include <glyphchain/storage/rocksdb/storage.hpp>
#include <glyphchain/testing/common.hpp>

#include <string>

namespace {

using glyphchain::ledger::submit_status_t;

constexpr auto kTimeout = std::chrono::milliseconds{100};

class local_ledger_fixture final {
 public:
  explicit local_ledger_fixture(const uint64_t window = 150)
      : path_{glyphchain::testing::make_db_path("glyphchain_local_ledger")},
        storage_{glyphchain::storage::make_storage<
            glyphchain::storage::rocksdb_storage_tag>(path_)},
        ledger_{storage_, 1200, window} {}

  ~local_ledger_fixture() {
    storage_.database.reset();
    glyphchain::testing::remove_path(path_);
  }

  glyphchain::storage::rocksdb_storage_t& storage() { return storage_; }
  glyphchain::ledger::local_ledger& ledger() { return ledger_; }

  glyphchain::ledger::submit_result_t submit(
      const std::string& payload,
      const glyphchain::crypto::signer_t& signer) {
    return ledger_.submit(glyphchain::schema::make_bytes_view(payload), signer,
                          ledger_.current_freshness_token(), kTimeout);
  }

 private:
  std::string path_;
  glyphchain::storage::rocksdb_storage_t storage_;
  glyphchain::ledger::local_ledger ledger_;
};

}  // namespace

TEST(ledger_local, confirms_and_fetches_units) {
  auto fixture = local_ledger_fixture{};
  auto signer = glyphchain::testing::make_signer(1);
  auto first = fixture.submit("first", signer);
  auto second = fixture.submit("second", signer);
  ASSERT_EQ(first.status, submit_status_t::confirmed);
  ASSERT_EQ(second.status, submit_status_t::confirmed);
  EXPECT_EQ(first.unit_id->size(), 64u);
  EXPECT_NE(first.unit_id, second.unit_id);
  EXPECT_EQ(fixture.ledger().sequence(), 2u);
  EXPECT_EQ(glyphchain::schema::make_string(*fixture.ledger().fetch(*first.unit_id)),
            "first");
  EXPECT_FALSE(fixture.ledger().fetch(std::string(64, '0')).has_value());
}

TEST(ledger_local, freshness_token_moves_with_each_unit) {
  auto fixture = local_ledger_fixture{};
  auto before = fixture.ledger().current_freshness_token();
  ASSERT_EQ(fixture.submit("x", glyphchain::testing::make_signer(1)).status,
            submit_status_t::confirmed);
  EXPECT_NE(fixture.ledger().current_freshness_token(), before);
}

TEST(ledger_local, stale_tokens_are_rejected) {
  auto fixture = local_ledger_fixture{2};
  auto signer = glyphchain::testing::make_signer(1);
  auto stale = fixture.ledger().current_freshness_token();
  ASSERT_EQ(fixture.submit("a", signer).status, submit_status_t::confirmed);
  ASSERT_EQ(fixture.submit("b", signer).status, submit_status_t::confirmed);

  auto payload = std::string{"c"};
  auto result = fixture.ledger().submit(glyphchain::schema::make_bytes_view(payload),
                                        signer, stale, kTimeout);
  EXPECT_EQ(result.status, submit_status_t::rejected);
  EXPECT_FALSE(result.unit_id.has_value());
  EXPECT_EQ(fixture.ledger().sequence(), 2u);
}

TEST(ledger_local, signer_that_does_not_own_its_identity_is_fatal) {
  auto fixture = local_ledger_fixture{};
  auto impostor = glyphchain::testing::make_signer(1);
  impostor.public_identity = glyphchain::testing::make_signer(2).public_identity;
  auto result = fixture.submit("forged", impostor);
  EXPECT_EQ(result.status, submit_status_t::fatal);
  EXPECT_EQ(result.log, "invalid signer");
}

TEST(ledger_local, oversized_payload_is_fatal) {
  auto fixture = local_ledger_fixture{};
  auto result = fixture.submit(std::string(1201, 'x'),
                               glyphchain::testing::make_signer(1));
  EXPECT_EQ(result.status, submit_status_t::fatal);
}

TEST(ledger_local, sequence_and_units_survive_reopen) {
  auto fixture = local_ledger_fixture{};
  auto signer = glyphchain::testing::make_signer(1);
  auto confirmed = fixture.submit("kept", signer);
  ASSERT_EQ(confirmed.status, submit_status_t::confirmed);
  auto token = fixture.ledger().current_freshness_token();

  auto reopened = glyphchain::ledger::local_ledger{fixture.storage(), 1200};
  EXPECT_EQ(reopened.sequence(), 1u);
  EXPECT_EQ(reopened.current_freshness_token(), token);
  EXPECT_EQ(glyphchain::schema::make_string(*reopened.fetch(*confirmed.unit_id)),
            "kept");
}

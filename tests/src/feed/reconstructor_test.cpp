#include <gtest/gtest.h>
#include <glyphchain/feed/reconstructor.hpp>
#include <glyphchain/testing/chain_builder.hpp>
#include <glyphchain/testing/engine_fixture.hpp>

#include <string>
#include <vector>

namespace {

constexpr auto kAlice = "a11ce";
constexpr auto kBob = "b0b";

std::vector<glyphchain::schema::timestamp_milliseconds_t> timestamps(
    const std::vector<glyphchain::schema::feed_entry_t>& entries) {
  auto out = std::vector<glyphchain::schema::timestamp_milliseconds_t>{};
  for (const auto& entry : entries) {
    out.push_back(entry.timestamp);
  }
  return out;
}

glyphchain::feed::feed_options_t uncached(const std::size_t limit_per_author,
                                          const std::size_t max_total) {
  return {.limit_per_author = limit_per_author,
          .max_total = max_total,
          .use_cache = false,
          .cache_ttl = std::chrono::milliseconds{30000}};
}

/// Alice at 90 and 100, Bob at 85 and 95.
class feed_reconstructor_test : public ::testing::Test {
 protected:
  feed_reconstructor_test()
      : fixture{"glyphchain_feed"},
        builder{fixture.ledger(), fixture.registry(), fixture.chunker()} {
    builder.append_document(kAlice, 90, "a1", "Alice, older.");
    builder.append_document(kBob, 85, "b1", "Bob, older.");
    builder.append_document(kAlice, 100, "a2", "Alice, newer.");
    builder.append_document(kBob, 95, "b2", "Bob, newer.");
  }

  glyphchain::testing::engine_fixture fixture;
  glyphchain::testing::chain_builder builder;
};

}  // namespace

TEST_F(feed_reconstructor_test, merges_authors_newest_first) {
  auto feed = fixture.reconstructor().build_feed(uncached(3, 20));
  ASSERT_EQ(feed.size(), 4u);
  EXPECT_EQ(timestamps(feed),
            (std::vector<glyphchain::schema::timestamp_milliseconds_t>{
                100, 95, 90, 85}));
  EXPECT_EQ(feed[0].author_id, kAlice);
  EXPECT_EQ(feed[0].body, "Alice, newer.");
  EXPECT_EQ(feed[1].author_id, kBob);
  EXPECT_EQ(feed[3].title, "b1");
}

TEST_F(feed_reconstructor_test, honours_both_limits) {
  EXPECT_EQ(timestamps(fixture.reconstructor().build_feed(uncached(1, 20))),
            (std::vector<glyphchain::schema::timestamp_milliseconds_t>{100, 95}));
  EXPECT_EQ(timestamps(fixture.reconstructor().build_feed(uncached(3, 3))),
            (std::vector<glyphchain::schema::timestamp_milliseconds_t>{100, 95,
                                                                       90}));
  EXPECT_TRUE(fixture.reconstructor().build_feed(uncached(3, 0)).empty());
}

TEST(feed_reconstructor, per_author_limit_drops_older_documents) {
  auto fixture = glyphchain::testing::engine_fixture{"glyphchain_feed_limit"};
  auto builder = glyphchain::testing::chain_builder{
      fixture.ledger(), fixture.registry(), fixture.chunker()};
  builder.append_document(kAlice, 80, "a80", "Alice at 80.");
  builder.append_document(kAlice, 90, "a90", "Alice at 90.");
  builder.append_document(kAlice, 100, "a100", "Alice at 100.");
  builder.append_document(kBob, 85, "b85", "Bob at 85.");
  builder.append_document(kBob, 95, "b95", "Bob at 95.");

  auto feed = fixture.reconstructor().build_feed(uncached(2, 10));
  EXPECT_EQ(timestamps(feed),
            (std::vector<glyphchain::schema::timestamp_milliseconds_t>{
                100, 95, 90, 85}));
  ASSERT_EQ(feed.size(), 4u);
  EXPECT_EQ(feed[0].author_id, kAlice);
  EXPECT_EQ(feed[1].author_id, kBob);
  EXPECT_EQ(feed[2].author_id, kAlice);
  EXPECT_EQ(feed[3].author_id, kBob);
  EXPECT_EQ(feed[2].body, "Alice at 90.");
}

TEST_F(feed_reconstructor_test, equal_timestamps_order_by_author) {
  builder.append_document(kBob, 500, "tie", "Bob at 500.");
  builder.append_document(kAlice, 500, "tie", "Alice at 500.");
  auto feed = fixture.reconstructor().build_feed(uncached(3, 2));
  ASSERT_EQ(feed.size(), 2u);
  EXPECT_EQ(feed[0].author_id, kAlice);
  EXPECT_EQ(feed[1].author_id, kBob);
}

TEST_F(feed_reconstructor_test, caches_until_refresh) {
  auto options = glyphchain::feed::feed_options_t{};
  auto before = fixture.reconstructor().build_feed(options);
  ASSERT_EQ(before.size(), 4u);
  const auto fetches = fixture.ledger().fetches();

  builder.append_document(kAlice, 200, "a3", "Alice, newest.");
  auto cached = fixture.reconstructor().build_feed(options);
  EXPECT_EQ(cached.size(), 4u);
  EXPECT_EQ(fixture.ledger().fetches(), fetches);

  auto bypassed = fixture.reconstructor().build_feed(uncached(3, 20));
  EXPECT_EQ(bypassed.front().timestamp, 200u);

  fixture.reconstructor().refresh();
  auto refreshed = fixture.reconstructor().build_feed(options);
  ASSERT_EQ(refreshed.size(), 5u);
  EXPECT_EQ(refreshed.front().body, "Alice, newest.");
}

TEST_F(feed_reconstructor_test, expired_cache_is_rebuilt) {
  auto options = glyphchain::feed::feed_options_t{};
  options.cache_ttl = std::chrono::milliseconds{0};
  fixture.reconstructor().build_feed(options);
  builder.append_document(kBob, 300, "b3", "Bob, newest.");
  EXPECT_EQ(fixture.reconstructor().build_feed(options).front().timestamp,
            300u);
}

TEST_F(feed_reconstructor_test, broken_author_does_not_hide_the_others) {
  auto head = fixture.registry().get_head(kBob);
  ASSERT_TRUE(head.has_value());
  fixture.ledger().erase(*head->latest_unit_id);

  auto feed = fixture.reconstructor().build_feed(uncached(3, 20));
  EXPECT_EQ(timestamps(feed),
            (std::vector<glyphchain::schema::timestamp_milliseconds_t>{100, 90}));
}

TEST_F(feed_reconstructor_test, author_view_reports_broken_chains) {
  auto alice = fixture.reconstructor().get_units_for_author(kAlice, 1);
  ASSERT_EQ(alice.size(), 1u);
  EXPECT_EQ(alice[0].timestamp, 100u);
  EXPECT_EQ(fixture.reconstructor().get_units_for_author(kAlice, 10).size(),
            2u);
  EXPECT_TRUE(
      fixture.reconstructor().get_units_for_author("stranger", 5).empty());

  auto head = fixture.registry().get_head(kBob);
  fixture.ledger().erase(*head->latest_unit_id);
  try {
    fixture.reconstructor().get_units_for_author(kBob, 5);
    FAIL() << "expected a missing chunk";
  } catch (const glyphchain::common::error& e) {
    EXPECT_EQ(e.code(), glyphchain::common::error_code::missing_chunk);
  }
}

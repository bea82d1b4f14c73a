#include <gtest/gtest.h>
#include <glyphchain/common/error.hpp>
#include <glyphchain/registry/chain_head_registry.hpp>
#include <glyphchain/storage/rocksdb/storage.hpp>
#include <glyphchain/testing/common.hpp>

#include <optional>
#include <string>

namespace {

class registry_fixture final {
 public:
  registry_fixture()
      : path_{glyphchain::testing::make_db_path("glyphchain_registry")},
        storage_{glyphchain::storage::make_storage<
            glyphchain::storage::rocksdb_storage_tag>(path_)},
        registry_{storage_} {}

  ~registry_fixture() {
    storage_.database.reset();
    glyphchain::testing::remove_path(path_);
  }

  glyphchain::storage::rocksdb_storage_t& storage() { return storage_; }
  glyphchain::registry::chain_head_registry& registry() { return registry_; }

 private:
  std::string path_;
  glyphchain::storage::rocksdb_storage_t storage_;
  glyphchain::registry::chain_head_registry registry_;
};

}  // namespace

TEST(registry, unknown_author_has_no_head) {
  auto fixture = registry_fixture{};
  EXPECT_FALSE(fixture.registry().get_head("nobody").has_value());
  EXPECT_FALSE(fixture.registry().remove("nobody"));
}

TEST(registry, advance_head_moves_forward_and_counts) {
  auto fixture = registry_fixture{};
  auto& registry = fixture.registry();
  auto first = registry.advance_head("alice", "unit-1");
  EXPECT_EQ(first.author_id, "alice");
  EXPECT_EQ(first.unit_count, 1u);

  registry.advance_head("alice", "unit-2");
  auto head = registry.get_head("alice");
  ASSERT_TRUE(head.has_value());
  EXPECT_EQ(head->latest_unit_id, "unit-2");
  EXPECT_EQ(head->unit_count, 2u);
  EXPECT_GT(head->last_updated_at, 0u);
}

TEST(registry, advancing_to_the_current_head_is_a_no_op) {
  auto fixture = registry_fixture{};
  auto& registry = fixture.registry();
  registry.advance_head("alice", "unit-1");
  auto again = registry.advance_head("alice", "unit-1");
  EXPECT_EQ(again.unit_count, 1u);
  EXPECT_EQ(registry.get_head("alice")->unit_count, 1u);
  EXPECT_EQ(registry.stats().total_units, 1u);
}

TEST(registry, heads_persist_across_instances) {
  auto fixture = registry_fixture{};
  fixture.registry().advance_head("alice", "unit-1");
  auto reopened = glyphchain::registry::chain_head_registry{fixture.storage()};
  EXPECT_EQ(reopened.get_head("alice")->latest_unit_id, "unit-1");
}

TEST(registry, genesis_registration_keeps_the_author_inactive) {
  auto fixture = registry_fixture{};
  auto& registry = fixture.registry();
  registry.register_genesis("bob", "genesis-bob");
  registry.advance_head("alice", "unit-1");

  auto bob = registry.get_head("bob");
  ASSERT_TRUE(bob.has_value());
  EXPECT_EQ(bob->genesis_unit_id, "genesis-bob");
  EXPECT_FALSE(bob->latest_unit_id.has_value());

  EXPECT_EQ(registry.list_all().size(), 2u);
  auto active = registry.list_active_authors();
  ASSERT_EQ(active.size(), 1u);
  EXPECT_EQ(active[0].author_id, "alice");

  registry.advance_head("bob", "unit-2");
  EXPECT_EQ(registry.get_head("bob")->genesis_unit_id, "genesis-bob");
}

TEST(registry, stats_remove_and_clear) {
  auto fixture = registry_fixture{};
  auto& registry = fixture.registry();
  registry.advance_head("alice", "unit-1");
  registry.advance_head("alice", "unit-2");
  registry.advance_head("carol", "unit-3");
  registry.register_genesis("dave", "genesis-dave");

  auto stats = registry.stats();
  EXPECT_EQ(stats.authors, 3u);
  EXPECT_EQ(stats.active_authors, 2u);
  EXPECT_EQ(stats.total_units, 3u);

  EXPECT_TRUE(registry.remove("carol"));
  EXPECT_EQ(registry.stats().authors, 2u);

  registry.clear_all();
  EXPECT_TRUE(registry.list_all().empty());
}

TEST(registry, author_lease_is_exclusive_until_released) {
  auto fixture = registry_fixture{};
  auto& registry = fixture.registry();
  {
    auto lease = registry.acquire_author("alice");
    EXPECT_TRUE(registry.is_author_busy("alice"));
    EXPECT_FALSE(registry.is_author_busy("bob"));
    try {
      auto second = registry.acquire_author("alice");
      FAIL() << "second lease granted";
    } catch (const glyphchain::common::error& e) {
      EXPECT_EQ(e.code(),
                glyphchain::common::error_code::concurrent_publish_conflict);
    }
    auto other = registry.acquire_author("bob");
    EXPECT_TRUE(registry.is_author_busy("bob"));
  }
  EXPECT_FALSE(registry.is_author_busy("alice"));
  EXPECT_FALSE(registry.is_author_busy("bob"));
  auto again = registry.acquire_author("alice");
  EXPECT_EQ(again.author_id(), "alice");
}

#pragma once

#include <glyphchain/chunking/chunker.hpp>
#include <glyphchain/feed/chain_walker.hpp>
#include <glyphchain/ledger/ledger.hpp>
#include <glyphchain/registry/chain_head_registry.hpp>
#include <glyphchain/schema/chain_head.hpp>
#include <glyphchain/schema/feed_entry.hpp>
#include <glyphchain/schema/primitives.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace glyphchain::feed {

struct feed_options final {
  std::size_t limit_per_author{3};
  std::size_t max_total{20};
  bool use_cache{true};
  std::chrono::milliseconds cache_ttl{30000};
};

using feed_options_t = feed_options;

/// Builds the cross-author feed by walking every active chain backward from
/// its head. Results are cached for `cache_ttl`; refresh() drops the cache.
class reconstructor final {
 public:
  reconstructor(glyphchain::registry::chain_head_registry& registry,
                glyphchain::ledger::ledger& ledger,
                const glyphchain::chunking::chunker& chunker);

  /// Newest first. A broken chain contributes what was read before the break
  /// and is otherwise skipped.
  std::vector<glyphchain::schema::feed_entry_t> build_feed(
      const feed_options_t& options);

  /// Up to `limit` newest documents of one author. Unlike build_feed, a
  /// broken chain is reported by throwing the walker's common::error.
  std::vector<glyphchain::schema::feed_entry_t> get_units_for_author(
      const glyphchain::schema::author_id_t& author_id,
      std::size_t limit);

  chain_walker walk(const glyphchain::schema::author_id_t& author_id) const;

  void refresh();

 private:
  struct cached_feed final {
    std::vector<glyphchain::schema::feed_entry_t> entries;
    std::chrono::steady_clock::time_point built_at;
    std::size_t limit_per_author{};
    std::size_t max_total{};
  };

  std::vector<glyphchain::schema::feed_entry_t> collect(
      const glyphchain::schema::chain_head_t& head,
      std::size_t limit) const;

  glyphchain::registry::chain_head_registry& registry_;
  glyphchain::ledger::ledger& ledger_;
  const glyphchain::chunking::chunker& chunker_;
  mutable std::mutex mutex_;
  std::shared_ptr<const cached_feed> cache_;
};

}  // namespace glyphchain::feed

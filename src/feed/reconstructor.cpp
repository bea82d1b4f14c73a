#include <glyphchain/feed/reconstructor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <future>
#include <iterator>
#include <tuple>

namespace glyphchain::feed {

reconstructor::reconstructor(
    glyphchain::registry::chain_head_registry& registry,
    glyphchain::ledger::ledger& ledger,
    const glyphchain::chunking::chunker& chunker)
    : registry_{registry}, ledger_{ledger}, chunker_{chunker} {}

chain_walker reconstructor::walk(
    const glyphchain::schema::author_id_t& author_id) const {
  auto head = registry_.get_head(author_id);
  return chain_walker{ledger_, chunker_, author_id,
                      head ? head->latest_unit_id : std::nullopt};
}

std::vector<glyphchain::schema::feed_entry_t> reconstructor::collect(
    const glyphchain::schema::chain_head_t& head,
    const std::size_t limit) const {
  auto walker =
      chain_walker{ledger_, chunker_, head.author_id, head.latest_unit_id};
  auto entries = std::vector<glyphchain::schema::feed_entry_t>{};
  while (entries.size() < limit) {
    auto entry = walker.next();
    if (!entry) {
      break;
    }
    entries.push_back(std::move(*entry));
  }
  return entries;
}

std::vector<glyphchain::schema::feed_entry_t> reconstructor::build_feed(
    const feed_options_t& options) {
  if (options.use_cache) {
    auto cached = std::shared_ptr<const cached_feed>{};
    {
      auto lock = std::scoped_lock{mutex_};
      cached = cache_;
    }
    if (cached && cached->limit_per_author == options.limit_per_author &&
        cached->max_total == options.max_total &&
        std::chrono::steady_clock::now() - cached->built_at <
            options.cache_ttl) {
      return cached->entries;
    }
  }

  auto heads = registry_.list_active_authors();
  auto pending = std::vector<
      std::future<std::vector<glyphchain::schema::feed_entry_t>>>{};
  pending.reserve(heads.size());
  for (const auto& head : heads) {
    pending.push_back(std::async(std::launch::async,
                                 [this, head, &options]() {
                                   return collect(head,
                                                  options.limit_per_author);
                                 }));
  }

  auto entries = std::vector<glyphchain::schema::feed_entry_t>{};
  for (auto i = std::size_t{0}; i < pending.size(); ++i) {
    try {
      auto author_entries = pending[i].get();
      std::move(author_entries.begin(), author_entries.end(),
                std::back_inserter(entries));
    } catch (const std::exception& e) {
      spdlog::warn("skipping feed for {}: {}", heads[i].author_id, e.what());
    }
  }

  std::sort(entries.begin(), entries.end(),
            [](const auto& lhs, const auto& rhs) {
              return std::tie(rhs.timestamp, lhs.author_id, lhs.unit_id) <
                     std::tie(lhs.timestamp, rhs.author_id, rhs.unit_id);
            });
  if (entries.size() > options.max_total) {
    entries.resize(options.max_total);
  }
  spdlog::debug("built feed of {} entries from {} authors", entries.size(),
                heads.size());

  auto built = std::make_shared<const cached_feed>(
      cached_feed{.entries = entries,
                  .built_at = std::chrono::steady_clock::now(),
                  .limit_per_author = options.limit_per_author,
                  .max_total = options.max_total});
  {
    auto lock = std::scoped_lock{mutex_};
    cache_ = std::move(built);
  }
  return entries;
}

std::vector<glyphchain::schema::feed_entry_t>
reconstructor::get_units_for_author(
    const glyphchain::schema::author_id_t& author_id,
    const std::size_t limit) {
  auto walker = walk(author_id);
  auto entries = std::vector<glyphchain::schema::feed_entry_t>{};
  while (entries.size() < limit) {
    auto entry = walker.next();
    if (!entry) {
      break;
    }
    entries.push_back(std::move(*entry));
  }
  if (walker.error()) {
    throw *walker.error();
  }
  return entries;
}

void reconstructor::refresh() {
  auto lock = std::scoped_lock{mutex_};
  cache_.reset();
}

}  // namespace glyphchain::feed

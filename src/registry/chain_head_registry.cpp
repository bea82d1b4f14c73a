#include <glyphchain/common/error.hpp>
#include <glyphchain/registry/chain_head_registry.hpp>
#include <glyphchain/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace glyphchain::registry {

namespace {

glyphchain::schema::bytes_t head_key(
    const glyphchain::schema::author_id_t& author_id) {
  return glyphchain::schema::key::make_chain_head_key(author_id);
}

}  // namespace

author_lease::author_lease(chain_head_registry& registry,
                           glyphchain::schema::author_id_t author_id)
    : registry_{&registry}, author_id_{std::move(author_id)} {}

author_lease::author_lease(author_lease&& other) noexcept
    : registry_{std::exchange(other.registry_, nullptr)},
      author_id_{std::move(other.author_id_)} {}

author_lease::~author_lease() {
  if (registry_ != nullptr) {
    registry_->release_author(author_id_);
  }
}

chain_head_registry::chain_head_registry(
    glyphchain::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

std::optional<glyphchain::schema::chain_head_t> chain_head_registry::get_head(
    const glyphchain::schema::author_id_t& author_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = encoder_;
  return storage_.get<glyphchain::schema::chain_head_t>(
      encoder, glyphchain::schema::make_bytes_view(head_key(author_id)));
}

glyphchain::schema::chain_head_t chain_head_registry::advance_head(
    const glyphchain::schema::author_id_t& author_id,
    const glyphchain::schema::unit_id_t& new_unit_id) {
  auto lock = std::scoped_lock{mutex_};
  auto key = head_key(author_id);
  auto head = storage_
                  .get<glyphchain::schema::chain_head_t>(
                      encoder_, glyphchain::schema::make_bytes_view(key))
                  .value_or(glyphchain::schema::chain_head_t{
                      .author_id = author_id});
  if (head.latest_unit_id == new_unit_id) {
    spdlog::debug("chain head for {} already at {}", author_id, new_unit_id);
    return head;
  }
  head.latest_unit_id = new_unit_id;
  ++head.unit_count;
  head.last_updated_at = glyphchain::schema::now_milliseconds();
  storage_.put(encoder_, glyphchain::schema::make_bytes_view(key), head);
  spdlog::info("chain head for {} advanced to {} ({} units)", author_id,
               new_unit_id, head.unit_count);
  return head;
}

void chain_head_registry::register_genesis(
    const glyphchain::schema::author_id_t& author_id,
    const glyphchain::schema::unit_id_t& genesis_unit_id) {
  auto lock = std::scoped_lock{mutex_};
  auto key = head_key(author_id);
  auto head = storage_
                  .get<glyphchain::schema::chain_head_t>(
                      encoder_, glyphchain::schema::make_bytes_view(key))
                  .value_or(glyphchain::schema::chain_head_t{
                      .author_id = author_id});
  head.genesis_unit_id = genesis_unit_id;
  head.last_updated_at = glyphchain::schema::now_milliseconds();
  storage_.put(encoder_, glyphchain::schema::make_bytes_view(key), head);
}

bool chain_head_registry::remove(
    const glyphchain::schema::author_id_t& author_id) {
  auto lock = std::scoped_lock{mutex_};
  auto key = head_key(author_id);
  auto existing = storage_.get<glyphchain::schema::chain_head_t>(
      encoder_, glyphchain::schema::make_bytes_view(key));
  if (!existing) {
    return false;
  }
  storage_.remove(glyphchain::schema::make_bytes_view(key));
  spdlog::info("removed chain head for {}", author_id);
  return true;
}

std::vector<glyphchain::schema::chain_head_t> chain_head_registry::list_all()
    const {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = encoder_;
  auto heads = std::vector<glyphchain::schema::chain_head_t>{};
  for (const auto& [key, value] : storage_.list_by_prefix(
           glyphchain::schema::make_bytes_view(
               glyphchain::schema::key::kChainHeadPrefix))) {
    heads.push_back(encoder.decode<glyphchain::schema::chain_head_t>(
        glyphchain::schema::make_bytes_view(value)));
  }
  return heads;
}

std::vector<glyphchain::schema::chain_head_t>
chain_head_registry::list_active_authors() const {
  auto heads = list_all();
  std::erase_if(heads, [](const auto& head) {
    return !head.latest_unit_id.has_value();
  });
  return heads;
}

void chain_head_registry::clear_all() {
  auto lock = std::scoped_lock{mutex_};
  storage_.remove_by_prefix(glyphchain::schema::make_bytes_view(
      glyphchain::schema::key::kChainHeadPrefix));
  spdlog::info("cleared all chain heads");
}

registry_stats_t chain_head_registry::stats() const {
  auto stats = registry_stats_t{};
  for (const auto& head : list_all()) {
    ++stats.authors;
    if (head.latest_unit_id) {
      ++stats.active_authors;
    }
    stats.total_units += head.unit_count;
  }
  return stats;
}

author_lease chain_head_registry::acquire_author(
    const glyphchain::schema::author_id_t& author_id) {
  auto lock = std::scoped_lock{lease_mutex_};
  if (!busy_authors_.insert(author_id).second) {
    throw glyphchain::common::error{
        glyphchain::common::error_code::concurrent_publish_conflict,
        "a publish for author " + author_id + " is already in flight"};
  }
  return author_lease{*this, author_id};
}

bool chain_head_registry::is_author_busy(
    const glyphchain::schema::author_id_t& author_id) const {
  auto lock = std::scoped_lock{lease_mutex_};
  return busy_authors_.contains(author_id);
}

void chain_head_registry::release_author(
    const glyphchain::schema::author_id_t& author_id) {
  auto lock = std::scoped_lock{lease_mutex_};
  busy_authors_.erase(author_id);
}

}  // namespace glyphchain::registry

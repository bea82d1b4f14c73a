#include <glyphchain/common/error.hpp>
#include <glyphchain/chunking/text.hpp>
#include <glyphchain/ledger/unit_codec.hpp>
#include <glyphchain/publishing/orchestrator.hpp>
#include <glyphchain/schema/chunk_unit.hpp>
#include <glyphchain/schema/key/builder.hpp>
#include <glyphchain/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <iterator>
#include <thread>
#include <utility>

namespace glyphchain::publishing {

namespace {

using glyphchain::schema::chunk_state_t;
using glyphchain::schema::publish_stage_t;

constexpr auto kOperationIdBytes = std::size_t{16};

glyphchain::common::error invalid(const std::string& message) {
  return glyphchain::common::error{
      glyphchain::common::error_code::invalid_argument, message};
}

}  // namespace

uint32_t publishing_progress(const uint32_t confirmed, const uint32_t total) {
  if (total == 0) {
    return 10;
  }
  return static_cast<uint32_t>((uint64_t{confirmed} * 80) / total) + 10;
}

orchestrator::orchestrator(glyphchain::ledger::ledger& ledger,
                           glyphchain::registry::chain_head_registry& registry,
                           glyphchain::storage::rocksdb_storage_t& storage,
                           const glyphchain::chunking::chunker& chunker,
                           const glyphchain::integrity::verifier& verifier,
                           publish_config_t config)
    : ledger_{ledger},
      registry_{registry},
      storage_{storage},
      chunker_{chunker},
      verifier_{verifier},
      config_{std::move(config)} {
  load_persisted();
}

void orchestrator::load_persisted() {
  auto lock = std::scoped_lock{mutex_};
  for (const auto& [key, value] :
       storage_.list_by_prefix(glyphchain::schema::make_bytes_view(
           glyphchain::schema::key::kOperationPrefix))) {
    auto slot = std::make_shared<operation_slot>();
    slot->operation = encoder_.decode<glyphchain::schema::publish_operation_t>(
        glyphchain::schema::make_bytes_view(value));
    auto& operation = slot->operation;
    if (get_manifest(operation.operation_id)) {
      // The manifest is written after the head moves, so only the record's
      // removal was lost.
      storage_.remove(glyphchain::schema::make_bytes_view(key));
      spdlog::info("operation {} had already completed; dropped its record",
                   operation.operation_id);
      continue;
    }
    if (operation.stage == publish_stage_t::publishing) {
      // Interrupted mid-flight; whatever was in flight is unknown.
      auto any_published = std::ranges::any_of(
          operation.chunk_statuses,
          [](const auto& s) { return s.state == chunk_state_t::published; });
      operation.stage =
          any_published ? publish_stage_t::partial : publish_stage_t::error;
      operation.error = "interrupted while publishing";
    }
    spdlog::info("loaded operation {} ({})", operation.operation_id,
                 glyphchain::schema::to_string(operation.stage));
    operations_.emplace(operation.operation_id, std::move(slot));
  }
}

glyphchain::schema::operation_id_t orchestrator::next_operation_id(
    const glyphchain::schema::author_id_t& author_id) {
  auto preimage = glyphchain::schema::key::builder{}
                      .write_field(author_id)
                      .write(glyphchain::schema::now_milliseconds())
                      .write(operation_counter_.fetch_add(1))
                      .write(std::hash<std::thread::id>{}(
                          std::this_thread::get_id()));
  auto hash =
      chunker_.hasher()(glyphchain::schema::make_bytes_view(preimage.data));
  return glyphchain::schema::to_hex(
      glyphchain::schema::bytes_view_t{hash.data(), kOperationIdBytes});
}

glyphchain::schema::operation_id_t orchestrator::create_publish_operation(
    const glyphchain::crypto::signer_t& author,
    const std::string& title,
    std::string_view document) {
  if (author.public_identity.empty()) {
    throw invalid("author has no public identity");
  }
  if (glyphchain::chunking::normalize(document).empty()) {
    throw invalid("document is empty after normalization");
  }
  if (has_unfinished_chain(author.public_identity, {})) {
    throw glyphchain::common::error{
        glyphchain::common::error_code::concurrent_publish_conflict,
        "author " + author.public_identity +
            " has an unfinished operation; resume or discard it first"};
  }

  auto operation = glyphchain::schema::publish_operation_t{};
  operation.operation_id = next_operation_id(author.public_identity);
  operation.author_id = author.public_identity;
  operation.title = title;
  operation.stage = publish_stage_t::preparing;
  operation.created_at = glyphchain::schema::now_milliseconds();

  auto limits = config_.limits;
  limits.envelope_overhead = glyphchain::ledger::chunk_unit_overhead(
      operation.author_id, operation.operation_id, operation.title);
  if (!glyphchain::chunking::fits_unit(1, limits)) {
    throw invalid("title and identity leave no room for content in a " +
                  std::to_string(limits.max_unit_bytes) + " byte unit");
  }

  operation.chunks = chunker_.split(document, limits);
  operation.chunk_statuses.resize(operation.chunks.size());

  auto slot = std::make_shared<operation_slot>();
  slot->operation = std::move(operation);
  {
    auto slot_lock = std::scoped_lock{slot->mutex};
    persist_locked(*slot);
  }
  const auto id = slot->operation.operation_id;
  spdlog::info("created operation {} for {} with {} chunks", id,
               slot->operation.author_id, slot->operation.chunks.size());

  auto lock = std::scoped_lock{mutex_};
  operations_.emplace(id, std::move(slot));
  return id;
}

publish_status_t orchestrator::publish(
    const glyphchain::schema::operation_id_t& id,
    const glyphchain::crypto::signer_t& signer,
    const progress_callback_t& on_progress) {
  auto slot = find_live(id);
  {
    auto slot_lock = std::scoped_lock{slot->mutex};
    if (slot->operation.stage != publish_stage_t::preparing) {
      throw invalid("operation " + id + " is " +
                    std::string{glyphchain::schema::to_string(
                        slot->operation.stage)} +
                    "; use resume");
    }
  }
  return run(slot, signer, on_progress);
}

publish_status_t orchestrator::resume(
    const glyphchain::schema::operation_id_t& id,
    const glyphchain::crypto::signer_t& signer,
    const progress_callback_t& on_progress) {
  auto slot = find_live(id);
  {
    auto slot_lock = std::scoped_lock{slot->mutex};
    auto stage = slot->operation.stage;
    if (stage != publish_stage_t::partial && stage != publish_stage_t::error) {
      throw invalid("operation " + id + " cannot be resumed while " +
                    std::string{glyphchain::schema::to_string(stage)});
    }
  }
  spdlog::info("resuming operation {}", id);
  return run(slot, signer, on_progress);
}

publish_status_t orchestrator::run(const slot_ptr& slot,
                                   const glyphchain::crypto::signer_t& signer,
                                   const progress_callback_t& on_progress) {
  auto& operation = slot->operation;
  if (signer.public_identity != operation.author_id) {
    throw invalid("signer does not match the operation's author");
  }
  auto lease = registry_.acquire_author(operation.author_id);
  if (has_unfinished_chain(operation.author_id, operation.operation_id)) {
    throw glyphchain::common::error{
        glyphchain::common::error_code::concurrent_publish_conflict,
        "author " + operation.author_id +
            " has another unfinished operation with confirmed chunks"};
  }

  {
    auto slot_lock = std::scoped_lock{slot->mutex};
    if (glyphchain::schema::is_terminal(operation.stage)) {
      throw invalid("operation " + operation.operation_id +
                    " already finished");
    }
    slot->cancel_requested = false;
    operation.stage = publish_stage_t::publishing;
    operation.error.clear();
    persist_locked(*slot);
  }
  auto fatal = false;
  try {
    notify(slot, on_progress);
    auto token = ledger_.current_freshness_token();
    auto previous = std::optional<glyphchain::schema::unit_id_t>{};
    for (std::size_t i = 0; i < operation.chunks.size(); ++i) {
      if (operation.chunk_statuses[i].state == chunk_state_t::published) {
        previous = operation.chunk_statuses[i].unit_id;
        continue;
      }
      if (slot->cancel_requested) {
        auto slot_lock = std::scoped_lock{slot->mutex};
        operation.stage = publish_stage_t::cancelled;
        storage_.remove(glyphchain::schema::make_bytes_view(
            glyphchain::schema::key::make_operation_key(
                operation.operation_id)));
        spdlog::info("operation {} cancelled before chunk {}",
                     operation.operation_id, i);
        break;
      }
      if (i == 0) {
        previous = chain_link(operation.author_id);
      }
      auto ok = submit_chunk(slot, i, previous, signer, token, fatal);
      notify(slot, on_progress);
      if (!ok) {
        break;
      }
      previous = operation.chunk_statuses[i].unit_id;
    }
  } catch (const std::exception& e) {
    abandon(slot, e.what());
    throw;
  }

  if (operation.stage == publish_stage_t::cancelled) {
    retire(slot);
  } else {
    finalize(slot, fatal);
  }
  return notify(slot, on_progress);
}

bool orchestrator::submit_chunk(
    const slot_ptr& slot,
    const std::size_t index,
    const std::optional<glyphchain::schema::unit_id_t>& previous,
    const glyphchain::crypto::signer_t& signer,
    glyphchain::ledger::freshness_token_t& token,
    bool& fatal) {
  auto& operation = slot->operation;
  const auto& chunk = operation.chunks[index];
  auto& status = operation.chunk_statuses[index];

  auto unit = glyphchain::schema::chunk_unit_t{
      .version = 1,
      .operation_id = operation.operation_id,
      .author_id = operation.author_id,
      .index = chunk.index,
      .total_chunks = chunk.total_chunks,
      .previous_unit_id = previous,
      .timestamp = operation.created_at,
      .hash = chunk.hash,
      .payload = chunk.payload,
      .title = index == 0 ? std::optional<std::string>{operation.title}
                          : std::nullopt};
  auto payload = glyphchain::ledger::encode_unit(unit);

  auto fail = [&](const std::string& reason) {
    auto slot_lock = std::scoped_lock{slot->mutex};
    status.state = chunk_state_t::failed;
    status.reason = reason;
    persist_locked(*slot);
    return false;
  };

  if (payload.size() > config_.limits.max_unit_bytes) {
    fatal = true;
    return fail(std::string{glyphchain::common::to_string(
                    glyphchain::common::error_code::oversized_chunk)} +
                ": unit is " + std::to_string(payload.size()) + " bytes");
  }
  if (!verifier_.verify_chunk(chunk)) {
    fatal = true;
    return fail(std::string{glyphchain::common::to_string(
                    glyphchain::common::error_code::corrupt_chunk)} +
                ": payload does not match its hash");
  }

  const auto& retry = config_.retry;
  for (auto attempt = uint32_t{1}; attempt <= retry.max_attempts; ++attempt) {
    auto result = glyphchain::ledger::try_submit(
        ledger_, glyphchain::schema::make_bytes_view(payload), signer, token,
        retry.submit_timeout);
    {
      auto slot_lock = std::scoped_lock{slot->mutex};
      ++status.attempts;
    }

    if (result.status == glyphchain::ledger::submit_status_t::confirmed &&
        result.unit_id) {
      auto slot_lock = std::scoped_lock{slot->mutex};
      status.state = chunk_state_t::published;
      status.unit_id = result.unit_id;
      status.reason.clear();
      persist_locked(*slot);
      spdlog::debug("operation {} chunk {}/{} confirmed as {}",
                    operation.operation_id, index + 1,
                    operation.chunks.size(), *result.unit_id);
      return true;
    }

    if (!glyphchain::ledger::is_retriable(result.status)) {
      spdlog::error("operation {} chunk {} failed permanently: {}",
                    operation.operation_id, index, result.log);
      fatal = true;
      return fail(std::string{glyphchain::common::to_string(
                      glyphchain::common::error_code::ledger_failed)} +
                  ": " + result.log);
    }

    spdlog::warn("operation {} chunk {} attempt {}/{} {}: {}",
                 operation.operation_id, index, attempt, retry.max_attempts,
                 glyphchain::ledger::to_string(result.status), result.log);
    if (attempt == retry.max_attempts) {
      return fail(std::string{glyphchain::common::to_string(
                      glyphchain::common::error_code::ledger_failed)} +
                  ": retries exhausted, last " +
                  std::string{glyphchain::ledger::to_string(result.status)} +
                  ": " + result.log);
    }
    if (result.status == glyphchain::ledger::submit_status_t::rejected) {
      token = ledger_.current_freshness_token();
      spdlog::info("refreshed freshness token after rejection");
    }
    std::this_thread::sleep_for(retry.retry_delay);
  }
  return fail(std::string{glyphchain::common::to_string(
      glyphchain::common::error_code::ledger_failed)} + ": no attempts allowed");
}

void orchestrator::finalize(const slot_ptr& slot, const bool fatal) {
  auto& operation = slot->operation;
  auto published = std::ranges::count_if(
      operation.chunk_statuses,
      [](const auto& s) { return s.state == chunk_state_t::published; });
  auto all_published =
      static_cast<std::size_t>(published) == operation.chunks.size();

  if (!all_published) {
    auto slot_lock = std::scoped_lock{slot->mutex};
    operation.stage = (published > 0 && !fatal) ? publish_stage_t::partial
                                                : publish_stage_t::error;
    auto failed = std::ranges::find_if(
        operation.chunk_statuses,
        [](const auto& s) { return s.state == chunk_state_t::failed; });
    if (failed != std::end(operation.chunk_statuses)) {
      operation.error = "chunk " +
                        std::to_string(std::distance(
                            std::begin(operation.chunk_statuses), failed)) +
                        " " + failed->reason;
    }
    persist_locked(*slot);
    spdlog::warn("operation {} ended {}: {}", operation.operation_id,
                 glyphchain::schema::to_string(operation.stage),
                 operation.error);
    return;
  }

  auto manifest = glyphchain::schema::manifest_t{};
  manifest.operation_id = operation.operation_id;
  manifest.author_id = operation.author_id;
  manifest.title = operation.title;
  manifest.total_chunks = static_cast<uint32_t>(operation.chunks.size());
  manifest.timestamp = operation.created_at;
  for (std::size_t i = 0; i < operation.chunks.size(); ++i) {
    manifest.unit_ids.push_back(*operation.chunk_statuses[i].unit_id);
    manifest.chunk_hashes.push_back(operation.chunks[i].hash);
  }
  manifest.manifest_root = verifier_.manifest_root(manifest.chunk_hashes);

  registry_.advance_head(operation.author_id, manifest.unit_ids.back());
  storage_.put(encoder_,
               glyphchain::schema::make_bytes_view(
                   glyphchain::schema::key::make_manifest_key(
                       operation.operation_id)),
               manifest);

  {
    auto slot_lock = std::scoped_lock{slot->mutex};
    operation.stage = publish_stage_t::completed;
    storage_.remove(glyphchain::schema::make_bytes_view(
        glyphchain::schema::key::make_operation_key(operation.operation_id)));
    spdlog::info("operation {} completed with {} chunks",
                 operation.operation_id, operation.chunks.size());
  }
  retire(slot);
}

void orchestrator::abandon(const slot_ptr& slot, const std::string_view reason) {
  auto slot_lock = std::scoped_lock{slot->mutex};
  auto& operation = slot->operation;
  if (operation.stage != publish_stage_t::publishing) {
    return;
  }
  auto any_published = std::ranges::any_of(
      operation.chunk_statuses,
      [](const auto& s) { return s.state == chunk_state_t::published; });
  operation.stage =
      any_published ? publish_stage_t::partial : publish_stage_t::error;
  operation.error = "interrupted: " + std::string{reason};
  persist_locked(*slot);
  spdlog::error("operation {} interrupted, now {}: {}", operation.operation_id,
                glyphchain::schema::to_string(operation.stage), reason);
}

void orchestrator::retire(const slot_ptr& slot) {
  auto summary = std::optional<publish_status_t>{};
  auto id = glyphchain::schema::operation_id_t{};
  {
    auto slot_lock = std::scoped_lock{slot->mutex};
    id = slot->operation.operation_id;
    if (slot->operation.stage != publish_stage_t::completed) {
      summary = snapshot_locked(*slot);
      summary->chunk_statuses.clear();
    }
  }
  auto lock = std::scoped_lock{mutex_};
  operations_.erase(id);
  if (summary) {
    archived_.insert_or_assign(id, std::move(*summary));
  }
}

bool orchestrator::cancel(const glyphchain::schema::operation_id_t& id) {
  auto slot = try_find(id);
  if (!slot) {
    if (!is_finished(id)) {
      throw glyphchain::common::error{glyphchain::common::error_code::not_found,
                                      "unknown operation " + id};
    }
    spdlog::warn("cancel ignored for finished operation {}", id);
    return false;
  }
  auto slot_lock = std::scoped_lock{slot->mutex};
  if (slot->operation.stage != publish_stage_t::publishing) {
    spdlog::warn("cancel ignored for operation {} in stage {}", id,
                 glyphchain::schema::to_string(slot->operation.stage));
    return false;
  }
  slot->cancel_requested = true;
  return true;
}

bool orchestrator::discard(const glyphchain::schema::operation_id_t& id) {
  auto slot = try_find(id);
  if (!slot) {
    return false;
  }
  {
    auto slot_lock = std::scoped_lock{slot->mutex};
    auto stage = slot->operation.stage;
    if (stage != publish_stage_t::preparing &&
        stage != publish_stage_t::partial && stage != publish_stage_t::error) {
      return false;
    }
    slot->operation.stage = publish_stage_t::cancelled;
    storage_.remove(glyphchain::schema::make_bytes_view(
        glyphchain::schema::key::make_operation_key(id)));
    spdlog::info("operation {} discarded", id);
  }
  retire(slot);
  return true;
}

std::optional<publish_status_t> orchestrator::get_status(
    const glyphchain::schema::operation_id_t& id) const {
  {
    auto lock = std::scoped_lock{mutex_};
    if (auto found = operations_.find(id); found != std::end(operations_)) {
      auto slot_lock = std::scoped_lock{found->second->mutex};
      return snapshot_locked(*found->second);
    }
    if (auto found = archived_.find(id); found != std::end(archived_)) {
      return found->second;
    }
  }
  // Completed in an earlier run; only the manifest is left.
  if (auto manifest = get_manifest(id)) {
    return publish_status_t{
        .operation_id = manifest->operation_id,
        .author_id = manifest->author_id,
        .stage = publish_stage_t::completed,
        .progress = 100,
        .total_chunks = manifest->total_chunks,
        .confirmed = manifest->total_chunks,
        .failed = 0,
        .pending = 0,
        .chunk_statuses = {},
        .error = {}};
  }
  return std::nullopt;
}

std::vector<publish_status_t> orchestrator::list_operations() const {
  auto lock = std::scoped_lock{mutex_};
  auto statuses = std::vector<publish_status_t>{};
  for (const auto& [id, slot] : operations_) {
    auto slot_lock = std::scoped_lock{slot->mutex};
    if (!glyphchain::schema::is_terminal(slot->operation.stage)) {
      statuses.push_back(snapshot_locked(*slot));
    }
  }
  return statuses;
}

std::optional<glyphchain::schema::manifest_t> orchestrator::get_manifest(
    const glyphchain::schema::operation_id_t& id) const {
  auto encoder = encoder_;
  return storage_.get<glyphchain::schema::manifest_t>(
      encoder, glyphchain::schema::make_bytes_view(
                   glyphchain::schema::key::make_manifest_key(id)));
}

std::optional<glyphchain::schema::unit_id_t> orchestrator::chain_link(
    const glyphchain::schema::author_id_t& author_id) const {
  auto head = registry_.get_head(author_id);
  if (!head) {
    return std::nullopt;
  }
  if (head->latest_unit_id) {
    return head->latest_unit_id;
  }
  return head->genesis_unit_id;
}

bool orchestrator::has_unfinished_chain(
    const glyphchain::schema::author_id_t& author_id,
    const glyphchain::schema::operation_id_t& except) const {
  auto lock = std::scoped_lock{mutex_};
  for (const auto& [id, slot] : operations_) {
    if (id == except) {
      continue;
    }
    auto slot_lock = std::scoped_lock{slot->mutex};
    const auto& operation = slot->operation;
    if (operation.author_id != author_id ||
        glyphchain::schema::is_terminal(operation.stage)) {
      continue;
    }
    if (std::ranges::any_of(operation.chunk_statuses, [](const auto& s) {
          return s.state == chunk_state_t::published;
        })) {
      return true;
    }
  }
  return false;
}

orchestrator::slot_ptr orchestrator::find(
    const glyphchain::schema::operation_id_t& id) const {
  auto slot = try_find(id);
  if (!slot) {
    throw glyphchain::common::error{glyphchain::common::error_code::not_found,
                                    "unknown operation " + id};
  }
  return slot;
}

orchestrator::slot_ptr orchestrator::try_find(
    const glyphchain::schema::operation_id_t& id) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = operations_.find(id);
  return found == std::end(operations_) ? nullptr : found->second;
}

orchestrator::slot_ptr orchestrator::find_live(
    const glyphchain::schema::operation_id_t& id) const {
  if (auto slot = try_find(id)) {
    return slot;
  }
  if (is_finished(id)) {
    throw invalid("operation " + id + " already finished");
  }
  return find(id);
}

bool orchestrator::is_finished(
    const glyphchain::schema::operation_id_t& id) const {
  {
    auto lock = std::scoped_lock{mutex_};
    if (archived_.contains(id)) {
      return true;
    }
  }
  return get_manifest(id).has_value();
}

void orchestrator::persist_locked(const operation_slot& slot) {
  storage_.put(encoder_,
               glyphchain::schema::make_bytes_view(
                   glyphchain::schema::key::make_operation_key(
                       slot.operation.operation_id)),
               slot.operation);
}

publish_status_t orchestrator::snapshot_locked(const operation_slot& slot) {
  const auto& operation = slot.operation;
  auto status = publish_status_t{};
  status.operation_id = operation.operation_id;
  status.author_id = operation.author_id;
  status.stage = operation.stage;
  status.total_chunks = static_cast<uint32_t>(operation.chunks.size());
  status.chunk_statuses = operation.chunk_statuses;
  status.error = operation.error;
  for (const auto& chunk_status : operation.chunk_statuses) {
    switch (chunk_status.state) {
      case chunk_state_t::published:
        ++status.confirmed;
        break;
      case chunk_state_t::failed:
        ++status.failed;
        break;
      case chunk_state_t::pending:
        ++status.pending;
        break;
    }
  }
  switch (operation.stage) {
    case publish_stage_t::preparing:
      status.progress = 0;
      break;
    case publish_stage_t::completed:
      status.progress = 100;
      break;
    default:
      status.progress =
          publishing_progress(status.confirmed, status.total_chunks);
      break;
  }
  return status;
}

publish_status_t orchestrator::notify(const slot_ptr& slot,
                                      const progress_callback_t& on_progress) {
  auto status = publish_status_t{};
  {
    auto slot_lock = std::scoped_lock{slot->mutex};
    status = snapshot_locked(*slot);
  }
  if (on_progress) {
    on_progress(status);
  }
  return status;
}

}  // namespace glyphchain::publishing

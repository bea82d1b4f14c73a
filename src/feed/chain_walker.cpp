#include <glyphchain/feed/chain_walker.hpp>
#include <glyphchain/ledger/unit_codec.hpp>
#include <glyphchain/schema/chunk_unit.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>
#include <vector>

namespace glyphchain::feed {

namespace {

using glyphchain::common::error_code;

glyphchain::common::error broken(const error_code code,
                                 const glyphchain::schema::unit_id_t& unit_id,
                                 const std::string& detail) {
  return glyphchain::common::error{code, "unit " + unit_id + ": " + detail};
}

}  // namespace

chain_walker::chain_walker(glyphchain::ledger::ledger& ledger,
                           const glyphchain::chunking::chunker& chunker,
                           glyphchain::schema::author_id_t author_id,
                           std::optional<glyphchain::schema::unit_id_t> head)
    : ledger_{ledger},
      chunker_{chunker},
      author_id_{std::move(author_id)},
      head_{std::move(head)},
      cursor_{head_} {}

void chain_walker::reset() {
  cursor_ = head_;
  visited_.clear();
  error_.reset();
  done_ = false;
}

std::optional<glyphchain::schema::feed_entry_t> chain_walker::next() {
  if (done_) {
    return std::nullopt;
  }
  if (!cursor_) {
    done_ = true;
    return std::nullopt;
  }
  try {
    auto entry = read_document(*cursor_);
    if (!entry) {
      done_ = true;
      return std::nullopt;
    }
    cursor_ = entry->previous_unit_id;
    return entry;
  } catch (const glyphchain::common::error& e) {
    error_ = e;
  } catch (const std::exception& e) {
    error_ = glyphchain::common::error{error_code::ledger_failed, e.what()};
  }
  spdlog::warn("chain walk for {} stopped: {}", author_id_, error_->what());
  done_ = true;
  return std::nullopt;
}

std::optional<glyphchain::schema::feed_entry_t> chain_walker::read_document(
    const glyphchain::schema::unit_id_t& start) {
  auto units = std::vector<glyphchain::schema::chunk_unit_t>{};
  auto unit_id = start;
  while (true) {
    if (!visited_.insert(unit_id).second) {
      throw broken(error_code::corrupt_chunk, unit_id, "chain loops back");
    }
    auto payload = ledger_.fetch(unit_id);
    if (!payload) {
      throw broken(error_code::missing_chunk, unit_id, "not on the ledger");
    }
    auto decoded = glyphchain::ledger::try_decode_unit(
        glyphchain::schema::make_bytes_view(*payload));
    if (!decoded) {
      throw broken(error_code::corrupt_chunk, unit_id, "undecodable payload");
    }
    auto* unit = std::get_if<glyphchain::schema::chunk_unit_t>(&*decoded);
    if (unit == nullptr) {
      if (!units.empty()) {
        throw broken(error_code::corrupt_chunk, unit_id,
                     "genesis unit inside a document");
      }
      return std::nullopt;
    }
    if (unit->author_id != author_id_) {
      throw broken(error_code::corrupt_chunk, unit_id,
                   "belongs to another author");
    }
    if (!units.empty() &&
        (unit->operation_id != units.front().operation_id ||
         unit->total_chunks != units.front().total_chunks)) {
      throw broken(error_code::missing_chunk, unit_id,
                   "document " + units.front().operation_id +
                       " is missing chunks");
    }
    units.push_back(std::move(*unit));
    if (units.back().index == 0) {
      break;
    }
    if (!units.back().previous_unit_id) {
      throw broken(error_code::missing_chunk, unit_id,
                   "chunk " + std::to_string(units.back().index) +
                       " has no predecessor");
    }
    unit_id = *units.back().previous_unit_id;
  }

  auto chunks = std::vector<glyphchain::schema::chunk_t>{};
  chunks.reserve(units.size());
  for (const auto& unit : units) {
    chunks.push_back(glyphchain::schema::chunk_t{.version = 1,
                                                 .index = unit.index,
                                                 .total_chunks = unit.total_chunks,
                                                 .payload = unit.payload,
                                                 .hash = unit.hash,
                                                 .source_span = std::nullopt});
  }
  auto body = chunker_.reassemble(chunks);

  const auto& first = units.back();
  return glyphchain::schema::feed_entry_t{
      .unit_id = start,
      .author_id = author_id_,
      .timestamp = first.timestamp,
      .body = std::move(body),
      .previous_unit_id = first.previous_unit_id,
      .title = first.title.value_or(std::string{}),
      .operation_id = first.operation_id};
}

}  // namespace glyphchain::feed

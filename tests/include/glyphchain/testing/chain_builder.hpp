#pragma once

#include <glyphchain/chunking/chunker.hpp>
#include <glyphchain/ledger/unit_codec.hpp>
#include <glyphchain/registry/chain_head_registry.hpp>
#include <glyphchain/schema/chunk_unit.hpp>
#include <glyphchain/schema/primitives.hpp>
#include <glyphchain/testing/scripted_ledger.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace glyphchain::testing {

/// Writes chunk units straight onto a scripted ledger, with timestamps and
/// links under the test's control, and moves the author's head like a
/// completed publish would.
class chain_builder final {
 public:
  chain_builder(scripted_ledger& ledger,
                glyphchain::registry::chain_head_registry& registry,
                const glyphchain::chunking::chunker& chunker)
      : ledger_{ledger}, registry_{registry}, chunker_{chunker} {}

  /// Unit ids of the document's chunks, in index order.
  std::vector<glyphchain::schema::unit_id_t> append_document(
      const glyphchain::schema::author_id_t& author_id,
      const glyphchain::schema::timestamp_milliseconds_t timestamp,
      const std::string& title,
      const std::string_view text) {
    auto operation_id =
        "op-" + std::to_string(timestamp) + "-" + std::to_string(++count_);
    auto limits = glyphchain::chunking::chunk_limits{};
    limits.envelope_overhead =
        glyphchain::ledger::chunk_unit_overhead(author_id, operation_id, title);
    auto chunks = chunker_.split(text, limits);

    auto head = registry_.get_head(author_id);
    auto previous = std::optional<glyphchain::schema::unit_id_t>{};
    if (head) {
      previous = head->latest_unit_id ? head->latest_unit_id
                                      : head->genesis_unit_id;
    }

    auto unit_ids = std::vector<glyphchain::schema::unit_id_t>{};
    for (const auto& chunk : chunks) {
      auto unit = glyphchain::schema::chunk_unit_t{};
      unit.operation_id = operation_id;
      unit.author_id = author_id;
      unit.index = chunk.index;
      unit.total_chunks = chunk.total_chunks;
      unit.previous_unit_id = previous;
      unit.timestamp = timestamp;
      unit.hash = chunk.hash;
      unit.payload = chunk.payload;
      if (chunk.index == 0) {
        unit.title = title;
      }
      previous = ledger_.append(glyphchain::ledger::encode_unit(unit));
      unit_ids.push_back(*previous);
    }
    registry_.advance_head(author_id, unit_ids.back());
    return unit_ids;
  }

 private:
  scripted_ledger& ledger_;
  glyphchain::registry::chain_head_registry& registry_;
  const glyphchain::chunking::chunker& chunker_;
  std::size_t count_{};
};

}  // namespace glyphchain::testing

#pragma once

#include <glyphchain/chunking/chunker.hpp>
#include <glyphchain/common/error.hpp>
#include <glyphchain/ledger/ledger.hpp>
#include <glyphchain/schema/feed_entry.hpp>
#include <glyphchain/schema/primitives.hpp>

#include <optional>
#include <unordered_set>

namespace glyphchain::feed {

/// Lazy backward walk over one author's chain, one document per step.
///
/// Each step follows previous_unit_id links from the current unit down to
/// the document's first chunk, then reassembles and verifies the document.
/// The walk ends at a unit without a previous link, at a genesis unit, or at
/// the first error, which is kept for inspection rather than thrown.
class chain_walker final {
 public:
  chain_walker(glyphchain::ledger::ledger& ledger,
               const glyphchain::chunking::chunker& chunker,
               glyphchain::schema::author_id_t author_id,
               std::optional<glyphchain::schema::unit_id_t> head);

  std::optional<glyphchain::schema::feed_entry_t> next();

  /// Start again from the head the walker was created with.
  void reset();

  bool done() const { return done_; }

  const std::optional<glyphchain::common::error>& error() const {
    return error_;
  }

 private:
  /// std::nullopt when `start` is a genesis unit.
  std::optional<glyphchain::schema::feed_entry_t> read_document(
      const glyphchain::schema::unit_id_t& start);

  glyphchain::ledger::ledger& ledger_;
  const glyphchain::chunking::chunker& chunker_;
  glyphchain::schema::author_id_t author_id_;
  std::optional<glyphchain::schema::unit_id_t> head_;
  std::optional<glyphchain::schema::unit_id_t> cursor_;
  std::unordered_set<glyphchain::schema::unit_id_t> visited_;
  std::optional<glyphchain::common::error> error_;
  bool done_{false};
};

}  // namespace glyphchain::feed

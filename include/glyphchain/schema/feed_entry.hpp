#pragma once

#include <glyphchain/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: feed entry.
// One reconstructed document. Derived from the ledger, never persisted.
namespace glyphchain::schema {

struct feed_entry final {
  unit_id_t unit_id;
  author_id_t author_id;
  timestamp_milliseconds_t timestamp{};
  std::string body;
  std::optional<unit_id_t> previous_unit_id;
  std::string title;
  operation_id_t operation_id;
};

using feed_entry_t = feed_entry;

}  // namespace glyphchain::schema

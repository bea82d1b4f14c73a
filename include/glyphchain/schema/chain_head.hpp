#pragma once

#include <glyphchain/schema/primitives.hpp>

#include <cstdint>
#include <optional>

// Schema type: chain head.
// Per-author pointer to the most recently confirmed unit.
namespace glyphchain::schema {

template <uint16_t Version>
struct chain_head;

template <>
struct chain_head<1> final {
  uint16_t version{1};
  author_id_t author_id;
  std::optional<unit_id_t> latest_unit_id;
  uint64_t unit_count{};
  timestamp_milliseconds_t last_updated_at{};
  std::optional<unit_id_t> genesis_unit_id;
};

using chain_head_t = chain_head<1>;

}  // namespace glyphchain::schema

#pragma once

#include <glyphchain/schema/enum_string.hpp>
#include <glyphchain/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: chunk unit.
// What a single chunk looks like on the ledger, including the backward link
// that threads an author's units into a chain.
namespace glyphchain::schema {

enum class unit_kind_t : uint8_t {
  chunk = 1,
  root_genesis = 2,
  author_genesis = 3
};

inline constexpr auto kUnitKindMappings = std::array{
    std::pair<std::string_view, unit_kind_t>{"chunk", unit_kind_t::chunk},
    std::pair<std::string_view, unit_kind_t>{"root_genesis",
                                             unit_kind_t::root_genesis},
    std::pair<std::string_view, unit_kind_t>{"author_genesis",
                                             unit_kind_t::author_genesis}};

template <>
inline std::optional<unit_kind_t> try_from_string<unit_kind_t>(
    const std::string_view value) {
  return from_string(value, kUnitKindMappings);
}

inline constexpr std::string_view to_string(const unit_kind_t value) {
  return name_of(value, kUnitKindMappings);
}

template <uint16_t Version>
struct chunk_unit;

template <>
struct chunk_unit<1> final {
  uint16_t version{1};
  operation_id_t operation_id;
  author_id_t author_id;
  uint32_t index{};
  uint32_t total_chunks{};
  std::optional<unit_id_t> previous_unit_id;
  timestamp_milliseconds_t timestamp{};
  hash32_t hash{};
  bytes_t payload;
  std::optional<std::string> title;
};

using chunk_unit_t = chunk_unit<1>;

}  // namespace glyphchain::schema

#pragma once

#include <glyphchain/schema/enum_string.hpp>
#include <glyphchain/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: chunk status.
// Per-chunk publishing state inside a publish operation.
namespace glyphchain::schema {

enum class chunk_state_t : uint8_t { pending = 0, published = 1, failed = 2 };

inline constexpr auto kChunkStateMappings = std::array{
    std::pair<std::string_view, chunk_state_t>{"pending",
                                               chunk_state_t::pending},
    std::pair<std::string_view, chunk_state_t>{"published",
                                               chunk_state_t::published},
    std::pair<std::string_view, chunk_state_t>{"failed",
                                               chunk_state_t::failed}};

template <>
inline std::optional<chunk_state_t> try_from_string<chunk_state_t>(
    const std::string_view value) {
  return from_string(value, kChunkStateMappings);
}

inline constexpr std::string_view to_string(const chunk_state_t value) {
  return name_of(value, kChunkStateMappings);
}

template <uint16_t Version>
struct chunk_status;

template <>
struct chunk_status<1> final {
  uint16_t version{1};
  chunk_state_t state{chunk_state_t::pending};
  std::optional<unit_id_t> unit_id;
  std::string reason;
  uint32_t attempts{};
};

using chunk_status_t = chunk_status<1>;

}  // namespace glyphchain::schema

#pragma once

#include <glyphchain/schema/chunk_unit.hpp>
#include <glyphchain/schema/genesis_record.hpp>
#include <glyphchain/schema/primitives.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <variant>

namespace glyphchain::ledger {

/// Longest unit id a ledger may hand back (hex of a 256-bit hash).
inline constexpr auto kMaxUnitIdSize = std::size_t{64};

using unit_t = std::variant<glyphchain::schema::chunk_unit_t,
                            glyphchain::schema::root_genesis_t,
                            glyphchain::schema::author_genesis_t>;

/// Ledger payload: base64 text of a kind byte followed by the SCALE record.
glyphchain::schema::bytes_t encode_unit(
    const glyphchain::schema::chunk_unit_t& unit);
glyphchain::schema::bytes_t encode_unit(
    const glyphchain::schema::root_genesis_t& unit);
glyphchain::schema::bytes_t encode_unit(
    const glyphchain::schema::author_genesis_t& unit);

/// std::nullopt for anything that is not a well-formed unit.
std::optional<unit_t> try_decode_unit(
    const glyphchain::schema::bytes_view_t& payload);

/// Upper bound on the bytes a chunk unit adds around its compressed payload,
/// before transport encoding.
std::size_t chunk_unit_overhead(std::string_view author_id,
                                std::string_view operation_id,
                                std::string_view title);

}  // namespace glyphchain::ledger

#pragma once
#include <glyphchain/common/capabilities.hpp>
#include <glyphchain/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace glyphchain::blake3 {

glyphchain::schema::hash32_t hash(const std::string_view& str);
glyphchain::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

/// BLAKE3 bound to the hash capability.
glyphchain::common::hasher_t make_hasher();

}  // namespace glyphchain::blake3

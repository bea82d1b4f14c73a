#pragma once
#include <glyphchain/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace glyphchain::schema::key {

/// Byte accumulator for store keys and hash preimages. Integers go in
/// little endian at their natural width.
struct builder final {
  glyphchain::schema::bytes_t data;

  builder& write(std::string_view text);
  builder& write(const glyphchain::schema::bytes_view_t& bytes);
  builder& write(const glyphchain::schema::hash32_t& hash);

  /// u32 length, then the text, so adjacent fields cannot run into each
  /// other.
  builder& write_field(std::string_view text);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(const T value) {
    using unsigned_t = std::make_unsigned_t<T>;
    auto bits = static_cast<unsigned_t>(value);
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>(bits & 0xFFu));
      bits = static_cast<unsigned_t>(bits >> 8u);
    }
    return *this;
  }
};

}  // namespace glyphchain::schema::key

#pragma once

#include <glyphchain/common/capabilities.hpp>
#include <glyphchain/schema/primitives.hpp>

namespace glyphchain::compression {

inline constexpr int kDefaultZlibLevel = 6;

/// zlib-wrapped deflate stream.
glyphchain::schema::bytes_t deflate(const glyphchain::schema::bytes_view_t& input,
                                    int level = kDefaultZlibLevel);

/// Inverse of deflate. Throws glyphchain::common::error (corrupt_chunk) on a
/// truncated or malformed stream.
glyphchain::schema::bytes_t inflate(
    const glyphchain::schema::bytes_view_t& input);

glyphchain::common::compressor_t make_zlib_compressor(
    int level = kDefaultZlibLevel);

}  // namespace glyphchain::compression

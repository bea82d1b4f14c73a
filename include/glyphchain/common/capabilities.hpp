#pragma once

#include <glyphchain/schema/primitives.hpp>
#include <functional>

namespace glyphchain::common {

/// Deterministic fixed-width hash.
using hasher_t = std::function<glyphchain::schema::hash32_t(
    const glyphchain::schema::bytes_view_t& bytes)>;

/// Deterministic, side-effect free compression pair. decompress throws
/// glyphchain::common::error on malformed input.
struct compressor final {
  std::function<glyphchain::schema::bytes_t(
      const glyphchain::schema::bytes_view_t& bytes)>
      compress;
  std::function<glyphchain::schema::bytes_t(
      const glyphchain::schema::bytes_view_t& bytes)>
      decompress;
};

using compressor_t = compressor;

}  // namespace glyphchain::common

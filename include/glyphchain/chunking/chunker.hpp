#pragma once

#include <glyphchain/common/capabilities.hpp>
#include <glyphchain/schema/chunk.hpp>
#include <glyphchain/schema/primitives.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace glyphchain::chunking {

/// Size bounds for one split.
struct chunk_limits final {
  /// Preferred window length, in bytes of normalized UTF-8 text.
  std::size_t target_chunk_chars{250};
  /// Upper bound on the transport-encoded (base64) size of a unit.
  std::size_t max_unit_bytes{1200};
  /// Bytes the unit record adds around the compressed payload.
  std::size_t envelope_overhead{};
  /// Below this length, halving stops looking for natural breaks.
  std::size_t min_chunk_chars{32};
  std::size_t lookback_chars{200};
};

/// Whether `payload_size` compressed bytes fit in one unit under `limits`.
bool fits_unit(std::size_t payload_size, const chunk_limits& limits);

/// Splits documents into compressed, hashed chunks and puts them back
/// together. Stateless apart from the injected capabilities.
class chunker final {
 public:
  chunker(glyphchain::common::hasher_t hasher,
          glyphchain::common::compressor_t compressor);

  /// Normalize `document` and cut it into chunks whose encoded size fits
  /// `limits.max_unit_bytes`. An empty document yields no chunks.
  ///
  /// Throws common::error with oversized_chunk when a single code point
  /// cannot fit, or invalid_argument for unusable limits.
  std::vector<glyphchain::schema::chunk_t> split(
      std::string_view document,
      const chunk_limits& limits) const;

  /// Inverse of split. Chunks may arrive in any order but must cover
  /// [0, total_chunks) exactly once.
  ///
  /// Throws common::error with missing_chunk for a gap or duplicate, and
  /// corrupt_chunk for a hash mismatch or undecodable payload.
  std::string reassemble(
      const std::vector<glyphchain::schema::chunk_t>& chunks) const;

  /// Build one chunk from raw text (index fields left zero).
  glyphchain::schema::chunk_t make_chunk(std::string_view text) const;

  const glyphchain::common::hasher_t& hasher() const { return hasher_; }

 private:
  void emit_fitting(std::string_view piece,
                    const chunk_limits& limits,
                    std::size_t depth,
                    std::vector<glyphchain::schema::chunk_t>& out) const;

  glyphchain::common::hasher_t hasher_;
  glyphchain::common::compressor_t compressor_;
};

}  // namespace glyphchain::chunking

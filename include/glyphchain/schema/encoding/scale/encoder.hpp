#pragma once
#include <glyphchain/common/critical.hpp>
#include <glyphchain/schema/encoding/encoder.hpp>
#include <iterator>
#include <optional>
#include <utility>
#include <scale/scale.hpp>

namespace glyphchain::schema::encoding {

struct scale_encoder_tag {};

/// SCALE codec. Schema records are plain aggregates, so the library encodes
/// them field by field in declaration order; a version field leads every
/// record.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  glyphchain::schema::bytes_t encode(const T& obj) {
    auto encoded = ::scale::impl::memory::encode(obj);
    if (!encoded) {
      glyphchain::common::critical("record is not SCALE encodable");
    }
    return std::move(encoded.value());
  }

  /// Append the encoding of `obj` to `out`.
  template <typename T>
  void encode(const T& obj, glyphchain::schema::bytes_t& out) {
    auto encoded = encode(obj);
    out.insert(std::end(out), std::begin(encoded), std::end(encoded));
  }

  /// For bytes this process wrote itself: failure means the store is
  /// corrupt and the process stops.
  template <typename T>
  T decode(const glyphchain::schema::bytes_view_t& bytes) {
    auto decoded = try_decode<T>(bytes);
    if (!decoded) {
      glyphchain::common::critical("{} stored bytes do not SCALE decode",
                                   bytes.size());
    }
    return std::move(*decoded);
  }

  /// For bytes of unknown provenance, such as ledger payloads.
  template <typename T>
  std::optional<T> try_decode(const glyphchain::schema::bytes_view_t& bytes) {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  }
};

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace glyphchain::schema::encoding

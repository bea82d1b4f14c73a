#pragma once
#include <glyphchain/schema/primitives.hpp>
#include <optional>
#include <span>

namespace glyphchain::schema::encoding {

/// Build-time selected codec. Persisted records and ledger unit bodies go
/// through one of these; the library is picked by tag.
template <typename Library>
struct encoder {
  template <typename T>
  glyphchain::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, glyphchain::schema::bytes_t& out);

  template <typename T>
  T decode(const glyphchain::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const glyphchain::schema::bytes_view_t& bytes);
};

}  // namespace glyphchain::schema::encoding

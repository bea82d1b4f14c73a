#pragma once

#include <glyphchain/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: chunk.
// One size-bounded, compressed, hash-verified slice of a document.
namespace glyphchain::schema {

template <uint16_t Version>
struct chunk;

template <>
struct chunk<1> final {
  uint16_t version{1};
  uint32_t index{};
  uint32_t total_chunks{};
  bytes_t payload;
  hash32_t hash{};
  std::optional<std::string> source_span;
};

using chunk_t = chunk<1>;

}  // namespace glyphchain::schema

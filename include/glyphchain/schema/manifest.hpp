#pragma once

#include <glyphchain/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: manifest.
// Record of a completed publish: which units hold which chunk hashes.
namespace glyphchain::schema {

inline constexpr auto kManifestProtocol = std::string_view{"glyphchain-v1"};

template <uint16_t Version>
struct manifest;

template <>
struct manifest<1> final {
  uint16_t version{1};
  std::string protocol{kManifestProtocol};
  operation_id_t operation_id;
  author_id_t author_id;
  std::string title;
  uint32_t total_chunks{};
  std::vector<unit_id_t> unit_ids;
  std::vector<hash32_t> chunk_hashes;
  hash32_t manifest_root{};
  timestamp_milliseconds_t timestamp{};
};

using manifest_t = manifest<1>;

}  // namespace glyphchain::schema

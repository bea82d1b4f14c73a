#pragma once

#include <glyphchain/common/capabilities.hpp>
#include <glyphchain/schema/chunk.hpp>
#include <glyphchain/schema/manifest.hpp>
#include <glyphchain/schema/primitives.hpp>

#include <string_view>
#include <vector>

namespace glyphchain::integrity {

/// Domain tag prefixed to the chunk hashes when computing a manifest root.
inline constexpr auto kManifestRootDomain = std::string_view{"CHUN"};

/// Recomputes hashes and compares them against what was recorded. Never
/// repairs anything; every mismatch is logged and reported as false.
class verifier final {
 public:
  explicit verifier(glyphchain::common::hasher_t hasher);

  /// hash(chunk.payload) == chunk.hash.
  bool verify_chunk(const glyphchain::schema::chunk_t& chunk) const;

  /// Count, per-index hash and payload checks of `actual` against the
  /// manifest recorded at publish time. `actual` may be in any order.
  bool verify_operation(
      const glyphchain::schema::manifest_t& expected,
      const std::vector<glyphchain::schema::chunk_t>& actual) const;

  /// Root over the ordered chunk hashes.
  glyphchain::schema::hash32_t manifest_root(
      const std::vector<glyphchain::schema::hash32_t>& chunk_hashes) const;

  bool verify_manifest(const glyphchain::schema::manifest_t& manifest) const;

 private:
  glyphchain::common::hasher_t hasher_;
};

}  // namespace glyphchain::integrity

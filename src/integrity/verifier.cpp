#include <glyphchain/integrity/verifier.hpp>
#include <glyphchain/schema/key/builder.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace glyphchain::integrity {

verifier::verifier(glyphchain::common::hasher_t hasher)
    : hasher_{std::move(hasher)} {}

bool verifier::verify_chunk(const glyphchain::schema::chunk_t& chunk) const {
  return hasher_(glyphchain::schema::make_bytes_view(chunk.payload)) ==
         chunk.hash;
}

bool verifier::verify_operation(
    const glyphchain::schema::manifest_t& expected,
    const std::vector<glyphchain::schema::chunk_t>& actual) const {
  if (actual.size() != expected.chunk_hashes.size() ||
      actual.size() != expected.total_chunks) {
    spdlog::warn("operation {}: expected {} chunks, found {}",
                 expected.operation_id, expected.chunk_hashes.size(),
                 actual.size());
    return false;
  }

  auto ordered = actual;
  std::ranges::sort(ordered, {}, &glyphchain::schema::chunk_t::index);

  auto ok = true;
  for (std::size_t i = 0; i < ordered.size(); ++i) {
    const auto& chunk = ordered[i];
    if (chunk.index != i) {
      spdlog::warn("operation {}: chunk {} missing", expected.operation_id, i);
      ok = false;
      continue;
    }
    if (chunk.hash != expected.chunk_hashes[i]) {
      spdlog::warn("operation {}: chunk {} hash differs from manifest",
                   expected.operation_id, i);
      ok = false;
    }
    if (!verify_chunk(chunk)) {
      spdlog::warn("operation {}: chunk {} payload does not match its hash",
                   expected.operation_id, i);
      ok = false;
    }
  }
  return ok;
}

glyphchain::schema::hash32_t verifier::manifest_root(
    const std::vector<glyphchain::schema::hash32_t>& chunk_hashes) const {
  auto preimage = glyphchain::schema::key::builder{};
  preimage.write(kManifestRootDomain);
  for (const auto& hash : chunk_hashes) {
    preimage.write(hash);
  }
  return hasher_(glyphchain::schema::make_bytes_view(preimage.data));
}

bool verifier::verify_manifest(
    const glyphchain::schema::manifest_t& manifest) const {
  if (manifest.chunk_hashes.size() != manifest.total_chunks ||
      manifest.unit_ids.size() != manifest.total_chunks) {
    spdlog::warn("manifest {}: inconsistent chunk counts",
                 manifest.operation_id);
    return false;
  }
  if (manifest_root(manifest.chunk_hashes) != manifest.manifest_root) {
    spdlog::warn("manifest {}: root mismatch", manifest.operation_id);
    return false;
  }
  return true;
}

}  // namespace glyphchain::integrity

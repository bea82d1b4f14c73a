#include <glyphchain/common/error.hpp>
#include <glyphchain/feed/document_reader.hpp>
#include <glyphchain/ledger/unit_codec.hpp>

#include <spdlog/spdlog.h>

#include <variant>
#include <vector>

namespace glyphchain::feed {

using glyphchain::common::error;
using glyphchain::common::error_code;

document_reader::document_reader(
    glyphchain::ledger::ledger& ledger,
    const glyphchain::chunking::chunker& chunker,
    const glyphchain::integrity::verifier& verifier)
    : ledger_{ledger}, chunker_{chunker}, verifier_{verifier} {}

std::string document_reader::read(
    const glyphchain::schema::manifest_t& manifest) const {
  if (!verifier_.verify_manifest(manifest)) {
    throw error{error_code::corrupt_chunk,
                "manifest of " + manifest.operation_id + " is inconsistent"};
  }

  auto chunks = std::vector<glyphchain::schema::chunk_t>{};
  chunks.reserve(manifest.unit_ids.size());
  for (const auto& unit_id : manifest.unit_ids) {
    auto payload = ledger_.fetch(unit_id);
    if (!payload) {
      throw error{error_code::missing_chunk,
                  "unit " + unit_id + " is not on the ledger"};
    }
    auto decoded = glyphchain::ledger::try_decode_unit(
        glyphchain::schema::make_bytes_view(*payload));
    const auto* unit = decoded
                           ? std::get_if<glyphchain::schema::chunk_unit_t>(
                                 &*decoded)
                           : nullptr;
    if (unit == nullptr || unit->operation_id != manifest.operation_id) {
      throw error{error_code::corrupt_chunk,
                  "unit " + unit_id + " is not a chunk of " +
                      manifest.operation_id};
    }
    chunks.push_back(glyphchain::schema::chunk_t{
        .version = 1,
        .index = unit->index,
        .total_chunks = unit->total_chunks,
        .payload = unit->payload,
        .hash = unit->hash,
        .source_span = std::nullopt});
  }

  if (!verifier_.verify_operation(manifest, chunks)) {
    throw error{error_code::corrupt_chunk,
                "chunks of " + manifest.operation_id +
                    " do not match the manifest"};
  }
  spdlog::debug("read {} chunks of {}", chunks.size(), manifest.operation_id);
  return chunker_.reassemble(chunks);
}

}  // namespace glyphchain::feed

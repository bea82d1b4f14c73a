#pragma once

#include <glyphchain/chunking/chunker.hpp>
#include <glyphchain/integrity/verifier.hpp>
#include <glyphchain/ledger/ledger.hpp>
#include <glyphchain/schema/manifest.hpp>

#include <string>

namespace glyphchain::feed {

/// Reads a published document back through its manifest, checking every
/// chunk against the hashes recorded at publish time.
class document_reader final {
 public:
  document_reader(glyphchain::ledger::ledger& ledger,
                  const glyphchain::chunking::chunker& chunker,
                  const glyphchain::integrity::verifier& verifier);

  /// Throws common::error: missing_chunk when a unit cannot be fetched,
  /// corrupt_chunk when anything disagrees with the manifest.
  std::string read(const glyphchain::schema::manifest_t& manifest) const;

 private:
  glyphchain::ledger::ledger& ledger_;
  const glyphchain::chunking::chunker& chunker_;
  const glyphchain::integrity::verifier& verifier_;
};

}  // namespace glyphchain::feed

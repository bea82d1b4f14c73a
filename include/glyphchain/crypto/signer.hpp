#pragma once

#include <glyphchain/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace glyphchain::crypto {

/// Identity plus signing capability. The core only reads the identity and
/// hands the signer to the ledger.
struct signer final {
  std::string public_identity;
  std::function<glyphchain::schema::bytes_t(
      const glyphchain::schema::bytes_view_t& message)>
      sign;
};

using signer_t = signer;
using ed25519_seed_t = std::array<uint8_t, 32>;

ed25519_seed_t generate_ed25519_seed();

/// ed25519 signer; identity is the hex public key. An empty signature is
/// returned if OpenSSL refuses to sign.
std::optional<signer_t> make_ed25519_signer(const ed25519_seed_t& seed);

/// Parse a 64 hex character seed.
std::optional<ed25519_seed_t> try_parse_seed(std::string_view hex);

}  // namespace glyphchain::crypto

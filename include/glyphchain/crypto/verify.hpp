#pragma once

#include <glyphchain/schema/primitives.hpp>

#include <string_view>

namespace glyphchain::crypto {

bool available();

/// ed25519 verification against a hex encoded public key.
bool verify_signature(const glyphchain::schema::bytes_view_t& message,
                      std::string_view public_identity,
                      const glyphchain::schema::bytes_view_t& signature);

}  // namespace glyphchain::crypto

#include <glyphchain/crypto/signer.hpp>

#include <glyphchain/common/critical.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>

namespace glyphchain::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

glyphchain::schema::bytes_t sign_with(
    EVP_PKEY* pkey,
    const glyphchain::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey) != 1) {
    spdlog::error("ed25519 signing context could not be initialised");
    return {};
  }
  auto size = std::size_t{0};
  if (EVP_DigestSign(ctx.get(), nullptr, &size, message.data(),
                     message.size()) != 1) {
    return {};
  }
  auto signature = glyphchain::schema::bytes_t(size);
  if (EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                     message.size()) != 1) {
    spdlog::error("ed25519 signing failed");
    return {};
  }
  signature.resize(size);
  return signature;
}

}  // namespace

ed25519_seed_t generate_ed25519_seed() {
  auto seed = ed25519_seed_t{};
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
    glyphchain::common::critical("OpenSSL could not produce {} random bytes",
                                 seed.size());
  }
  return seed;
}

std::optional<signer_t> make_ed25519_signer(const ed25519_seed_t& seed) {
  auto* raw = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                           seed.data(), seed.size());
  if (raw == nullptr) {
    return std::nullopt;
  }
  auto pkey = std::shared_ptr<EVP_PKEY>{raw, EVP_PKEY_free};

  auto public_key = std::array<uint8_t, 32>{};
  auto public_size = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.data(),
                                  &public_size) != 1 ||
      public_size != public_key.size()) {
    return std::nullopt;
  }

  return signer_t{
      .public_identity = glyphchain::schema::to_hex(
          glyphchain::schema::bytes_view_t{public_key.data(), public_size}),
      .sign = [pkey](const glyphchain::schema::bytes_view_t& message) {
        return sign_with(pkey.get(), message);
      }};
}

std::optional<ed25519_seed_t> try_parse_seed(const std::string_view hex) {
  auto bytes = glyphchain::schema::try_from_hex(hex);
  if (!bytes || bytes->size() != std::tuple_size_v<ed25519_seed_t>) {
    return std::nullopt;
  }
  auto seed = ed25519_seed_t{};
  std::copy(bytes->begin(), bytes->end(), seed.begin());
  return seed;
}

}  // namespace glyphchain::crypto

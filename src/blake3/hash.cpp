#include <blake3.h>
#include <glyphchain/blake3/hash.hpp>

namespace glyphchain::blake3 {

namespace {

glyphchain::schema::hash32_t digest(const void* data, const std::size_t size) {
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<glyphchain::schema::hash32_t>);
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = glyphchain::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

glyphchain::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

glyphchain::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return digest(bytes.data(), bytes.size());
}

glyphchain::common::hasher_t make_hasher() {
  return [](const glyphchain::schema::bytes_view_t& bytes) {
    return hash(bytes);
  };
}

}  // namespace glyphchain::blake3

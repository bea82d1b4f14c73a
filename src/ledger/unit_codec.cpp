#include <glyphchain/ledger/unit_codec.hpp>
#include <glyphchain/schema/encoding/scale/encoder.hpp>

namespace glyphchain::ledger {

namespace {

using encoder_t = glyphchain::schema::encoding::scale_encoder_t;

// SCALE compact lengths take at most four bytes for anything that fits a unit.
constexpr auto kCompactLength = std::size_t{4};

template <typename T>
glyphchain::schema::bytes_t encode_with_kind(
    const glyphchain::schema::unit_kind_t kind,
    const T& record) {
  auto encoder = encoder_t{};
  auto raw = glyphchain::schema::bytes_t{static_cast<uint8_t>(kind)};
  encoder.encode(record, raw);
  return glyphchain::schema::make_bytes(glyphchain::schema::to_base64(raw));
}

template <typename T>
std::optional<unit_t> decode_as(const glyphchain::schema::bytes_view_t& body) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<T>(body);
  if (!decoded) {
    return std::nullopt;
  }
  return unit_t{std::move(*decoded)};
}

}  // namespace

glyphchain::schema::bytes_t encode_unit(
    const glyphchain::schema::chunk_unit_t& unit) {
  return encode_with_kind(glyphchain::schema::unit_kind_t::chunk, unit);
}

glyphchain::schema::bytes_t encode_unit(
    const glyphchain::schema::root_genesis_t& unit) {
  return encode_with_kind(glyphchain::schema::unit_kind_t::root_genesis, unit);
}

glyphchain::schema::bytes_t encode_unit(
    const glyphchain::schema::author_genesis_t& unit) {
  return encode_with_kind(glyphchain::schema::unit_kind_t::author_genesis,
                          unit);
}

std::optional<unit_t> try_decode_unit(
    const glyphchain::schema::bytes_view_t& payload) {
  auto raw = glyphchain::schema::try_from_base64(
      glyphchain::schema::make_string_view(payload));
  if (!raw || raw->empty()) {
    return std::nullopt;
  }
  auto body = glyphchain::schema::bytes_view_t{*raw}.subspan(1);
  switch (static_cast<glyphchain::schema::unit_kind_t>(raw->front())) {
    case glyphchain::schema::unit_kind_t::chunk:
      return decode_as<glyphchain::schema::chunk_unit_t>(body);
    case glyphchain::schema::unit_kind_t::root_genesis:
      return decode_as<glyphchain::schema::root_genesis_t>(body);
    case glyphchain::schema::unit_kind_t::author_genesis:
      return decode_as<glyphchain::schema::author_genesis_t>(body);
  }
  return std::nullopt;
}

std::size_t chunk_unit_overhead(const std::string_view author_id,
                                const std::string_view operation_id,
                                const std::string_view title) {
  return 1                                      // kind
         + sizeof(uint16_t)                     // version
         + kCompactLength + operation_id.size()
         + kCompactLength + author_id.size()
         + sizeof(uint32_t) * 2                 // index, total_chunks
         + 1 + kCompactLength + kMaxUnitIdSize  // previous_unit_id
         + sizeof(uint64_t)                     // timestamp
         + std::tuple_size_v<glyphchain::schema::hash32_t>
         + kCompactLength                       // payload length
         + 1 + kCompactLength + title.size();
}

}  // namespace glyphchain::ledger

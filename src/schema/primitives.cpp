#include <glyphchain/common/critical.hpp>
#include <glyphchain/schema/primitives.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <iterator>
#include <string_view>

namespace glyphchain::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};
constexpr auto kInvalidSymbol = uint8_t{0xFF};

/// Reverse lookup: character to symbol value, kInvalidSymbol elsewhere.
constexpr std::array<uint8_t, 256> make_reverse_table(
    const std::string_view alphabet,
    const bool fold_case) {
  auto table = std::array<uint8_t, 256>{};
  table.fill(kInvalidSymbol);
  for (std::size_t i = 0; i < alphabet.size(); ++i) {
    auto c = static_cast<unsigned char>(alphabet[i]);
    table[c] = static_cast<uint8_t>(i);
    if (fold_case && c >= 'a' && c <= 'f') {
      table[c - 'a' + 'A'] = static_cast<uint8_t>(i);
    }
  }
  return table;
}

constexpr auto kHexValues = make_reverse_table(kHexDigits, true);
constexpr auto kBase64Values = make_reverse_table(kBase64Alphabet, false);

uint8_t symbol_value(const std::array<uint8_t, 256>& table, const char c) {
  return table[static_cast<unsigned char>(c)];
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_hash32(const bytes_view_t& bytes) {
  if (bytes.size() != 32) {
    glyphchain::common::critical("expected a 32 byte hash, got {} bytes",
                                 bytes.size());
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kHexDigits[byte >> 4u]);
    out.push_back(kHexDigits[byte & 0x0Fu]);
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t(hex.size() / 2);
  for (std::size_t i = 0; i < decoded.size(); ++i) {
    auto high = symbol_value(kHexValues, hex[2 * i]);
    auto low = symbol_value(kHexValues, hex[(2 * i) + 1]);
    if (high == kInvalidSymbol || low == kInvalidSymbol) {
      return std::nullopt;
    }
    decoded[i] = static_cast<uint8_t>((high << 4u) | low);
  }
  return decoded;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    glyphchain::common::critical("not hex: {}", hex);
  }
  return *decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(base64_encoded_size(bytes.size()));
  for (std::size_t i = 0; i < bytes.size(); i += 3) {
    auto group_size = std::min<std::size_t>(3, bytes.size() - i);
    auto group = uint32_t{0};
    for (std::size_t j = 0; j < 3; ++j) {
      group <<= 8u;
      if (j < group_size) {
        group |= bytes[i + j];
      }
    }
    // n input bytes produce n + 1 symbols; the rest of the quad is padding.
    for (std::size_t j = 0; j < 4; ++j) {
      out.push_back(j <= group_size
                        ? kBase64Alphabet[(group >> (18u - (6u * j))) & 0x3Fu]
                        : '=');
    }
  }
  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto symbols = std::string{};
  symbols.reserve(encoded.size());
  std::ranges::copy_if(encoded, std::back_inserter(symbols), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) == 0;
  });
  if ((symbols.size() % 4) != 0) {
    return std::nullopt;
  }

  auto padding = std::size_t{0};
  if (!symbols.empty() && symbols.back() == '=') {
    padding = symbols[symbols.size() - 2] == '=' ? 2 : 1;
  }

  auto out = bytes_t{};
  out.reserve((symbols.size() / 4) * 3);
  for (std::size_t i = 0; i < symbols.size(); i += 4) {
    auto last = (i + 4) == symbols.size();
    auto data_symbols = last ? 4 - padding : 4;
    auto group = uint32_t{0};
    for (std::size_t j = 0; j < 4; ++j) {
      auto value = uint8_t{0};
      if (j < data_symbols) {
        value = symbol_value(kBase64Values, symbols[i + j]);
        if (value == kInvalidSymbol) {
          return std::nullopt;
        }
      }
      group = (group << 6u) | value;
    }
    for (std::size_t j = 0; j + 1 < data_symbols; ++j) {
      out.push_back(static_cast<uint8_t>((group >> (16u - (8u * j))) & 0xFFu));
    }
  }
  return out;
}

bytes_t from_base64(const std::string_view encoded) {
  auto decoded = try_from_base64(encoded);
  if (!decoded.has_value()) {
    glyphchain::common::critical("not base64 ({} characters)", encoded.size());
  }
  return *decoded;
}

timestamp_milliseconds_t now_milliseconds() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace glyphchain::schema

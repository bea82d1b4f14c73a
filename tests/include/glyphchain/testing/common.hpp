#pragma once

#include <glyphchain/crypto/signer.hpp>
#include <glyphchain/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace glyphchain::testing {

inline glyphchain::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = glyphchain::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Deterministic ed25519 signer; the same seed always gives the same identity.
inline glyphchain::crypto::signer_t make_signer(const uint8_t seed) {
  auto key = glyphchain::crypto::ed25519_seed_t{};
  for (std::size_t i = 0; i < key.size(); ++i) {
    key[i] = static_cast<uint8_t>(seed * 31 + static_cast<uint8_t>(i));
  }
  auto signer = glyphchain::crypto::make_ed25519_signer(key);
  if (!signer) {
    throw std::runtime_error{"ed25519 is not available"};
  }
  return *signer;
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Text with no natural breaks, so every split lands on a window boundary.
inline std::string make_unbroken_text(const std::size_t size) {
  auto text = std::string{};
  text.reserve(size);
  for (std::size_t i = 0; i < size; ++i) {
    text.push_back(static_cast<char>('a' + (i * 7 + i / 26) % 26));
  }
  return text;
}

}  // namespace glyphchain::testing

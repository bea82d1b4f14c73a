#pragma once
#include <glyphchain/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace glyphchain::storage {

using key_value_entry_t =
    std::pair<glyphchain::schema::bytes_t, glyphchain::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const glyphchain::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const glyphchain::schema::bytes_view_t& key,
           const T& value) const;

  /// Delete key; deleting a missing key is not an error.
  void remove(const glyphchain::schema::bytes_view_t& key) const;

  /// Return every key that shares the provided prefix, in key order.
  std::vector<glyphchain::schema::bytes_t> list_keys(
      const glyphchain::schema::bytes_view_t& prefix) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const glyphchain::schema::bytes_view_t& prefix) const;

  /// Atomically delete every entry under prefix.
  void remove_by_prefix(const glyphchain::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace glyphchain::storage

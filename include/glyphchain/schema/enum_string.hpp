#pragma once

#include <algorithm>
#include <array>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>

// Stable text names for schema enums, used in logs, status output and the
// command line. Each enum header owns one constexpr name table.
namespace glyphchain::schema {

template <typename Enum>
using enum_name_t = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<enum_name_t<Enum>, N>& names) {
  auto found = std::ranges::find(names, value, &enum_name_t<Enum>::first);
  if (found == std::end(names)) {
    return std::nullopt;
  }
  return found->second;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<enum_name_t<Enum>, N>& names) {
  auto found = std::ranges::find(names, value, &enum_name_t<Enum>::second);
  if (found == std::end(names)) {
    return std::nullopt;
  }
  return found->first;
}

/// Name of `value`, or "unknown" for a value missing from `names` (an enum
/// decoded from newer data).
template <typename Enum, std::size_t N>
constexpr std::string_view name_of(
    const Enum value,
    const std::array<enum_name_t<Enum>, N>& names) {
  return to_string(value, names).value_or("unknown");
}

/// Specialized next to each enum's name table.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace glyphchain::schema

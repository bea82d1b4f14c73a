#pragma once

#include <glyphchain/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: publish stage.
// Lifecycle of a publish operation: preparing, publishing, then one of the
// terminal or retained stages.
namespace glyphchain::schema {

enum class publish_stage_t : uint8_t {
  preparing = 0,
  publishing = 1,
  completed = 2,
  partial = 3,
  error = 4,
  cancelled = 5
};

inline constexpr auto kPublishStageMappings =
    std::array{std::pair<std::string_view, publish_stage_t>{
                   "preparing", publish_stage_t::preparing},
               std::pair<std::string_view, publish_stage_t>{
                   "publishing", publish_stage_t::publishing},
               std::pair<std::string_view, publish_stage_t>{
                   "completed", publish_stage_t::completed},
               std::pair<std::string_view, publish_stage_t>{
                   "partial", publish_stage_t::partial},
               std::pair<std::string_view, publish_stage_t>{
                   "error", publish_stage_t::error},
               std::pair<std::string_view, publish_stage_t>{
                   "cancelled", publish_stage_t::cancelled}};

template <>
inline std::optional<publish_stage_t> try_from_string<publish_stage_t>(
    const std::string_view value) {
  return from_string(value, kPublishStageMappings);
}

inline constexpr std::string_view to_string(const publish_stage_t value) {
  return name_of(value, kPublishStageMappings);
}

/// Stages an operation never leaves.
inline constexpr bool is_terminal(const publish_stage_t value) {
  return value == publish_stage_t::completed ||
         value == publish_stage_t::cancelled;
}

}  // namespace glyphchain::schema

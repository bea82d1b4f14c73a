#pragma once

#include <glyphchain/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace glyphchain::common {

enum class error_code : uint8_t {
  missing_chunk = 0,
  corrupt_chunk = 1,
  oversized_chunk = 2,
  ledger_transient = 3,
  ledger_failed = 4,
  concurrent_publish_conflict = 5,
  genesis_validation_failed = 6,
  not_found = 7,
  invalid_argument = 8
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"missing_chunk",
                                            error_code::missing_chunk},
    std::pair<std::string_view, error_code>{"corrupt_chunk",
                                            error_code::corrupt_chunk},
    std::pair<std::string_view, error_code>{"oversized_chunk",
                                            error_code::oversized_chunk},
    std::pair<std::string_view, error_code>{"ledger_transient",
                                            error_code::ledger_transient},
    std::pair<std::string_view, error_code>{"ledger_failed",
                                            error_code::ledger_failed},
    std::pair<std::string_view, error_code>{
        "concurrent_publish_conflict",
        error_code::concurrent_publish_conflict},
    std::pair<std::string_view, error_code>{
        "genesis_validation_failed", error_code::genesis_validation_failed},
    std::pair<std::string_view, error_code>{"not_found",
                                            error_code::not_found},
    std::pair<std::string_view, error_code>{"invalid_argument",
                                            error_code::invalid_argument}};

inline constexpr std::string_view to_string(const error_code value) {
  return glyphchain::schema::name_of(value, kErrorCodeMappings);
}

/// Domain failure raised by the content engine. The code is the stable,
/// machine-readable part; what() carries the detail.
class error final : public std::runtime_error {
 public:
  error(const error_code code, const std::string& message)
      : std::runtime_error{std::string{to_string(code)} + ": " + message},
        code_{code} {}

  error_code code() const noexcept { return code_; }

 private:
  error_code code_;
};

}  // namespace glyphchain::common

namespace glyphchain::schema {

template <>
inline std::optional<glyphchain::common::error_code>
try_from_string<glyphchain::common::error_code>(const std::string_view value) {
  return from_string(value, glyphchain::common::kErrorCodeMappings);
}

}  // namespace glyphchain::schema

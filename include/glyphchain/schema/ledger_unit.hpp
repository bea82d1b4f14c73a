#pragma once

#include <glyphchain/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: ledger unit.
// A unit as stored by the local append-only ledger.
namespace glyphchain::schema {

template <uint16_t Version>
struct ledger_unit;

template <>
struct ledger_unit<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  timestamp_milliseconds_t confirmed_at{};
  std::string signer_identity;
  bytes_t signature;
  bytes_t payload;
};

using ledger_unit_t = ledger_unit<1>;

}  // namespace glyphchain::schema

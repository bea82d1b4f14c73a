#pragma once

#include <glyphchain/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <string_view>

// Schema type: genesis records.
// The platform root and the per-author anchors that seed every chain.
namespace glyphchain::schema {

inline constexpr auto kRootGenesisProtocol =
    std::string_view{"glyphchain-genesis-v1"};
inline constexpr auto kAuthorGenesisKind = std::string_view{"author_genesis"};

template <uint16_t Version>
struct root_genesis;

/// Platform root as written to the ledger.
template <>
struct root_genesis<1> final {
  uint16_t version{1};
  std::string protocol{kRootGenesisProtocol};
  std::string network;
  timestamp_milliseconds_t timestamp{};
  std::string deployer_identity;
  hash32_t genesis_hash{};
};

using root_genesis_t = root_genesis<1>;

template <uint16_t Version>
struct author_genesis;

/// Author anchor as written to the ledger.
template <>
struct author_genesis<1> final {
  uint16_t version{1};
  std::string kind{kAuthorGenesisKind};
  hash32_t author_genesis_hash{};
  std::string label;
  std::string public_identity;
  std::string root_id;
  timestamp_milliseconds_t timestamp{};
};

using author_genesis_t = author_genesis<1>;

/// Locally persisted root: the ledger record plus where it landed.
struct root_record final {
  unit_id_t unit_id;
  root_genesis_t genesis;
};

using root_record_t = root_record;

/// Binding of an author identity to the platform root.
struct genesis_record final {
  std::string root_id;
  unit_id_t author_genesis_id;
  std::string author_public_identity;
  std::string label;
  hash32_t derived_hash{};
};

using genesis_record_t = genesis_record;

}  // namespace glyphchain::schema

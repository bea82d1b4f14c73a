#pragma once

#include <glyphchain/schema/primitives.hpp>
#include <string_view>

// Schema key type: store keys.
// Canonical key prefixes for everything glyphchain persists locally.
namespace glyphchain::schema::key {

inline constexpr std::string_view kChainHeadPrefix{"SYS|HEAD|"};
inline constexpr std::string_view kOperationPrefix{"SYS|OP|"};
inline constexpr std::string_view kManifestPrefix{"SYS|MANIFEST|"};
inline constexpr std::string_view kRootGenesisKey{"SYS|GENESIS|ROOT"};
inline constexpr std::string_view kLedgerUnitPrefix{"LEDGER|UNIT|"};
inline constexpr std::string_view kLedgerSequenceKey{"LEDGER|SEQUENCE"};

glyphchain::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                              std::string_view id);

glyphchain::schema::bytes_t make_chain_head_key(
    const glyphchain::schema::author_id_t& author_id);
glyphchain::schema::bytes_t make_operation_key(
    const glyphchain::schema::operation_id_t& operation_id);
glyphchain::schema::bytes_t make_manifest_key(
    const glyphchain::schema::operation_id_t& operation_id);
glyphchain::schema::bytes_t make_ledger_unit_key(
    const glyphchain::schema::unit_id_t& unit_id);

/// Strip `prefix` from a stored key; empty when the key is not under it.
std::string_view key_suffix(std::string_view prefix,
                            const glyphchain::schema::bytes_t& key);

}  // namespace glyphchain::schema::key

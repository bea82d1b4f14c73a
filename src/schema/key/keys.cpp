#include <glyphchain/schema/key/builder.hpp>
#include <glyphchain/schema/key/keys.hpp>

namespace glyphchain::schema::key {

glyphchain::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                              std::string_view id) {
  return builder{}.write(prefix).write(id).data;
}

glyphchain::schema::bytes_t make_chain_head_key(
    const glyphchain::schema::author_id_t& author_id) {
  return make_prefixed_key(kChainHeadPrefix, author_id);
}

glyphchain::schema::bytes_t make_operation_key(
    const glyphchain::schema::operation_id_t& operation_id) {
  return make_prefixed_key(kOperationPrefix, operation_id);
}

glyphchain::schema::bytes_t make_manifest_key(
    const glyphchain::schema::operation_id_t& operation_id) {
  return make_prefixed_key(kManifestPrefix, operation_id);
}

glyphchain::schema::bytes_t make_ledger_unit_key(
    const glyphchain::schema::unit_id_t& unit_id) {
  return make_prefixed_key(kLedgerUnitPrefix, unit_id);
}

std::string_view key_suffix(std::string_view prefix,
                            const glyphchain::schema::bytes_t& key) {
  auto view = glyphchain::schema::make_string_view(key);
  if (!view.starts_with(prefix)) {
    return {};
  }
  view.remove_prefix(prefix.size());
  return view;
}

}  // namespace glyphchain::schema::key

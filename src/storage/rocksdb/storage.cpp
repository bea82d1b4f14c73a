#include <glyphchain/common/critical.hpp>
#include <glyphchain/storage/rocksdb/storage.hpp>

namespace glyphchain::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    glyphchain::common::critical("cannot open RocksDB at {}: {}", path,
                                 status.ToString());
  }
  spdlog::info("opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::remove(
    const glyphchain::schema::bytes_view_t& key) const {
  if (!database) {
    glyphchain::common::critical("store used before it was opened");
  }
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                 detail::to_slice(key));
  if (!status.ok()) {
    glyphchain::common::critical("cannot delete {} from RocksDB: {}",
                                 glyphchain::schema::make_string_view(key),
                                 status.ToString());
  }
}

std::vector<glyphchain::schema::bytes_t>
storage<rocksdb_storage_tag>::list_keys(
    const glyphchain::schema::bytes_view_t& prefix) const {
  auto keys = std::vector<glyphchain::schema::bytes_t>{};
  for_each_under(prefix, [&](const ROCKSDB_NAMESPACE::Iterator& iterator) {
    keys.push_back(detail::to_bytes(iterator.key()));
  });
  return keys;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const glyphchain::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  for_each_under(prefix, [&](const ROCKSDB_NAMESPACE::Iterator& iterator) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator.key()),
                                        detail::to_bytes(iterator.value())});
  });
  return entries;
}

void storage<rocksdb_storage_tag>::remove_by_prefix(
    const glyphchain::schema::bytes_view_t& prefix) const {
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for_each_under(prefix, [&](const ROCKSDB_NAMESPACE::Iterator& iterator) {
    auto delete_status = batch.Delete(iterator.key());
    if (!delete_status.ok()) {
      glyphchain::common::critical("cannot batch delete under {}: {}",
                                   glyphchain::schema::make_string_view(prefix),
                                   delete_status.ToString());
    }
  });

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    glyphchain::common::critical("cannot remove keys under {}: {}",
                                 glyphchain::schema::make_string_view(prefix),
                                 write_status.ToString());
  }
}

}  // namespace glyphchain::storage

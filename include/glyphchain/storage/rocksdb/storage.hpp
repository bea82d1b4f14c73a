#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <glyphchain/common/critical.hpp>
#include <glyphchain/schema/encoding/scale/encoder.hpp>
#include <glyphchain/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>

namespace glyphchain::storage {

namespace detail {

inline glyphchain::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const glyphchain::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const glyphchain::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const glyphchain::schema::bytes_view_t& key,
           const T& value) const;

  void remove(const glyphchain::schema::bytes_view_t& key) const;
  std::vector<glyphchain::schema::bytes_t> list_keys(
      const glyphchain::schema::bytes_view_t& prefix) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const glyphchain::schema::bytes_view_t& prefix) const;
  void remove_by_prefix(const glyphchain::schema::bytes_view_t& prefix) const;

 private:
  template <typename Visitor>
  void for_each_under(const glyphchain::schema::bytes_view_t& prefix,
                      Visitor&& visitor) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const glyphchain::schema::bytes_view_t& key) const {
  if (!database) {
    glyphchain::common::critical("store used before it was opened");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    glyphchain::common::critical("cannot read {} from RocksDB: {}",
                                 glyphchain::schema::make_string_view(key),
                                 status.ToString());
  }
  return {encoder.template decode<T>(glyphchain::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const glyphchain::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    glyphchain::common::critical("store used before it was opened");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key),
                              detail::to_slice(encoded_value));
  if (!status.ok()) {
    glyphchain::common::critical("cannot write {} to RocksDB: {}",
                                 glyphchain::schema::make_string_view(key),
                                 status.ToString());
  }
}

template <typename Visitor>
void storage<rocksdb_storage_tag>::for_each_under(
    const glyphchain::schema::bytes_view_t& prefix,
    Visitor&& visitor) const {
  if (!database) {
    glyphchain::common::critical("store used before it was opened");
  }
  auto prefix_view = glyphchain::schema::make_string_view(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(detail::to_slice(prefix));
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    visitor(*iterator);
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    glyphchain::common::critical("cannot scan {} in RocksDB: {}", prefix_view,
                                 iterator->status().ToString());
  }
}

}  // namespace glyphchain::storage

#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <gateway/common/critical.hpp>
#include <gateway/schema/encoding/scale/encoder.hpp>
#include <gateway/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>

namespace gateway::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const gateway::schema::bytes_view_t& bytes) {
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
                       const gateway::schema::bytes_view_t& key);

  std::optional<gateway::schema::bytes_t> get_raw(
      const gateway::schema::bytes_view_t& key) const;
  void commit(const std::vector<write_entry_t>& writes) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const gateway::schema::bytes_view_t& key) {
  auto raw = get_raw(key);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(gateway::schema::bytes_view_t{*raw})};
}

inline std::optional<gateway::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const gateway::schema::bytes_view_t& key) const {
  if (!database) {
    gateway::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    gateway::common::critical("Failed to get value from RocksDB");
  }
  return gateway::schema::bytes_t(std::begin(value), std::end(value));
}

inline void storage<rocksdb_storage_tag>::commit(
    const std::vector<write_entry_t>& writes) const {
  if (!database) {
    gateway::common::critical("RocksDB database is not initialized");
  }
  if (writes.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto key_slice = detail::to_slice(gateway::schema::bytes_view_t{key});
    auto status = value.has_value()
                      ? batch.Put(key_slice, detail::to_slice(
                                                 gateway::schema::bytes_view_t{
                                                     *value}))
                      : batch.Delete(key_slice);
    if (!status.ok()) {
      gateway::common::critical("failed staging key in write batch");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    gateway::common::critical("failed to commit write batch");
  }
}

}  // namespace gateway::storage

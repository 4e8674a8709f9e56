#pragma once

#include <gateway/schema/encoding/scale/encoder.hpp>
#include <gateway/schema/primitives.hpp>
#include <gateway/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <map>
#include <optional>

namespace gateway::state {

/// Write buffer over storage. Reads see buffered writes first. Nothing
/// reaches storage until commit(), which applies every buffered write in one
/// RocksDB WriteBatch; discard() drops them.
class overlay final {
 public:
  using encoder_t = gateway::schema::encoding::scale_encoder_t;
  using storage_t = gateway::storage::rocksdb_storage_t;

  overlay(encoder_t& encoder, storage_t& storage);

  template <typename T>
  std::optional<T> get(const gateway::schema::bytes_view_t& key) const {
    auto it = writes_.find(gateway::schema::make_bytes(key));
    if (it == writes_.end()) {
      return storage_.template get<T>(encoder_, key);
    }
    if (!it->second.has_value()) {
      return std::nullopt;
    }
    return encoder_.template decode<T>(
        gateway::schema::bytes_view_t{*it->second});
  }

  template <typename T>
  void put(const gateway::schema::bytes_view_t& key, const T& value) {
    writes_[gateway::schema::make_bytes(key)] = encoder_.encode(value);
  }

  std::optional<gateway::schema::bytes_t> get_raw(
      const gateway::schema::bytes_view_t& key) const;
  bool contains(const gateway::schema::bytes_view_t& key) const;
  void erase(const gateway::schema::bytes_view_t& key);

  void commit();
  void discard();
  std::size_t pending() const { return writes_.size(); }

 private:
  encoder_t& encoder_;
  storage_t& storage_;
  std::map<gateway::schema::bytes_t, std::optional<gateway::schema::bytes_t>>
      writes_;
};

}  // namespace gateway::state

#pragma once
#include <gateway/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace gateway::storage {

/// One buffered mutation: a value to write, or std::nullopt to delete.
using write_entry_t = std::pair<gateway::schema::bytes_t,
                                std::optional<gateway::schema::bytes_t>>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const gateway::schema::bytes_view_t& key);

  /// Raw value at key, or std::nullopt when missing.
  std::optional<gateway::schema::bytes_t> get_raw(
      const gateway::schema::bytes_view_t& key) const;

  /// Apply every write and delete in one atomic batch.
  void commit(const std::vector<write_entry_t>& writes) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace gateway::storage

#pragma once
#include <gateway/schema/primitives.hpp>
#include <optional>
#include <span>

namespace gateway::schema::encoding {

// The wire format of persisted values is a build time choice: callers are
// templated on the encoder, the library behind it is picked by tag.
template <typename Library>
struct encoder {
  template <typename T>
  gateway::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, gateway::schema::bytes_t& out);

  template <typename T>
  T decode(const gateway::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const gateway::schema::bytes_view_t& bytes);
};

}  // namespace gateway::schema::encoding

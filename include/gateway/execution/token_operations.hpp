#pragma once

#include <gateway/schema/primitives.hpp>
#include <functional>

namespace gateway::execution {

/// Token movements are performed by the host's token contracts; the engines
/// only decide them.
struct token_operations final {
  /// Move value of token from `from` into the wallet's custody.
  std::function<void(const gateway::schema::address_t& token,
                     const gateway::schema::address_t& from,
                     const gateway::schema::amount_t& value)>
      pull;
  /// Move value of token out of custody to `to`.
  std::function<void(const gateway::schema::address_t& token,
                     const gateway::schema::address_t& to,
                     const gateway::schema::amount_t& value)>
      push;
  /// Retire value of token held in custody.
  std::function<void(const gateway::schema::address_t& token,
                     const gateway::schema::amount_t& value)>
      burn;
  /// Create value of token for `to`.
  std::function<void(const gateway::schema::address_t& token,
                     const gateway::schema::address_t& to,
                     const gateway::schema::amount_t& value)>
      mint;
};

/// Token operations that only log what they would do.
token_operations make_logging_token_operations();

}  // namespace gateway::execution

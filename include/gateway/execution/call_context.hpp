#pragma once

#include <gateway/schema/primitives.hpp>

namespace gateway::execution {

/// Host facts for one call: the block it executes in and its caller.
struct call_context final {
  gateway::schema::block_height_t block_height{};
  gateway::schema::address_t sender{};
};

}  // namespace gateway::execution

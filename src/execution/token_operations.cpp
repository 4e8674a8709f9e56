#include <gateway/execution/token_operations.hpp>

#include <spdlog/spdlog.h>

namespace gateway::execution {

namespace {

std::string hex(const gateway::schema::address_t& address) {
  return "0x" + gateway::schema::to_hex(address);
}

}  // namespace

token_operations make_logging_token_operations() {
  return token_operations{
      .pull =
          [](const gateway::schema::address_t& token,
             const gateway::schema::address_t& from,
             const gateway::schema::amount_t& value) {
            spdlog::info("token {}: pull {} from {}", hex(token), value.str(),
                         hex(from));
          },
      .push =
          [](const gateway::schema::address_t& token,
             const gateway::schema::address_t& to,
             const gateway::schema::amount_t& value) {
            spdlog::info("token {}: push {} to {}", hex(token), value.str(),
                         hex(to));
          },
      .burn =
          [](const gateway::schema::address_t& token,
             const gateway::schema::amount_t& value) {
            spdlog::info("token {}: burn {}", hex(token), value.str());
          },
      .mint =
          [](const gateway::schema::address_t& token,
             const gateway::schema::address_t& to,
             const gateway::schema::amount_t& value) {
            spdlog::info("token {}: mint {} to {}", hex(token), value.str(),
                         hex(to));
          }};
}

}  // namespace gateway::execution

#include <gateway/schema/key/builder.hpp>
#include <gateway/state/keys.hpp>

namespace gateway::state::key {

gateway::schema::bytes_t make_balance_key(
    const gateway::schema::address_t& token,
    const gateway::schema::address_t& depositor) {
  auto out = gateway::schema::key::builder{};
  out.write(kBalanceKeyPrefix).write(token).write(depositor);
  return out.data;
}

gateway::schema::bytes_t make_delegate_key(
    const gateway::schema::address_t& token,
    const gateway::schema::address_t& depositor,
    const gateway::schema::address_t& delegate) {
  auto out = gateway::schema::key::builder{};
  out.write(kDelegateKeyPrefix).write(token).write(depositor).write(delegate);
  return out.data;
}

gateway::schema::bytes_t make_scoped_key(const std::string_view& scope,
                                         const std::string_view& part) {
  auto out = gateway::schema::key::builder{};
  out.write(kStatePrefix).write(scope).write(part);
  return out.data;
}

gateway::schema::bytes_t make_scoped_key(
    const std::string_view& scope,
    const std::string_view& part,
    const gateway::schema::hash32_t& word) {
  auto out = gateway::schema::key::builder{};
  out.write(kStatePrefix).write(scope).write(part).write(word);
  return out.data;
}

}  // namespace gateway::state::key

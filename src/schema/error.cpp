#include <gateway/schema/error.hpp>

#include <spdlog/fmt/fmt.h>

namespace gateway::schema {

namespace {

std::string make_message(const error_code code,
                         const std::optional<uint64_t>& index) {
  if (index.has_value()) {
    return fmt::format("{} (index {})", to_string(code), *index);
  }
  return std::string{to_string(code)};
}

}  // namespace

error::error(const error_code code,
             std::vector<transaction_event_attribute_t> details)
    : std::runtime_error{make_message(code, std::nullopt)},
      code_{code},
      details_{std::move(details)} {}

error::error(const error_code code,
             const uint64_t index,
             std::vector<transaction_event_attribute_t> details)
    : std::runtime_error{make_message(code, index)},
      code_{code},
      index_{index},
      details_{std::move(details)} {}

std::string error::info() const {
  auto out = std::string{};
  if (index_.has_value()) {
    out = fmt::format("index={}", *index_);
  }
  for (const auto& detail : details_) {
    if (!out.empty()) {
      out.push_back(';');
    }
    out += fmt::format("{}={}", detail.key, detail.value);
  }
  return out;
}

transaction_event_attribute_t make_detail(const std::string& key,
                                          const std::string& value) {
  return transaction_event_attribute_t{.key = key, .value = value};
}

}  // namespace gateway::schema

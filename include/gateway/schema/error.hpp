#pragma once

#include <gateway/schema/error_code.hpp>
#include <gateway/schema/transaction_event_attribute.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace gateway::schema {

/// Recoverable, caller-attributable failure. Thrown by the codec, the ledger
/// and the engines; caught at the engine boundary and turned into a
/// transaction_result_t.
class error final : public std::runtime_error {
 public:
  explicit error(error_code code,
                 std::vector<transaction_event_attribute_t> details = {});
  error(error_code code,
        uint64_t index,
        std::vector<transaction_event_attribute_t> details = {});

  error_code code() const noexcept { return code_; }
  std::optional<uint64_t> index() const noexcept { return index_; }
  const std::vector<transaction_event_attribute_t>& details() const noexcept {
    return details_;
  }

  /// "key=value;key=value", index first when present.
  std::string info() const;

 private:
  error_code code_;
  std::optional<uint64_t> index_;
  std::vector<transaction_event_attribute_t> details_;
};

transaction_event_attribute_t make_detail(const std::string& key,
                                          const std::string& value);

}  // namespace gateway::schema

#include <gateway/state/overlay.hpp>

#include <spdlog/spdlog.h>

#include <vector>

namespace gateway::state {

overlay::overlay(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<gateway::schema::bytes_t> overlay::get_raw(
    const gateway::schema::bytes_view_t& key) const {
  auto it = writes_.find(gateway::schema::make_bytes(key));
  if (it != writes_.end()) {
    return it->second;
  }
  return storage_.get_raw(key);
}

bool overlay::contains(const gateway::schema::bytes_view_t& key) const {
  return get_raw(key).has_value();
}

void overlay::erase(const gateway::schema::bytes_view_t& key) {
  writes_[gateway::schema::make_bytes(key)] = std::nullopt;
}

void overlay::commit() {
  auto batch = std::vector<gateway::storage::write_entry_t>{};
  batch.reserve(writes_.size());
  for (auto& [key, value] : writes_) {
    batch.emplace_back(key, value);
  }
  storage_.commit(batch);
  spdlog::debug("Committed {} state writes", batch.size());
  writes_.clear();
}

void overlay::discard() {
  if (!writes_.empty()) {
    spdlog::debug("Discarding {} buffered state writes", writes_.size());
  }
  writes_.clear();
}

}  // namespace gateway::state

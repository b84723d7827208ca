#include <ibc/host/transaction.hpp>

#include <iterator>
#include <utility>

namespace ibc::host {

transaction::transaction(const reader& base) : base_{base} {}

ibc::common::result_t<std::optional<ibc::schema::bytes_t>> transaction::get(
    const std::string_view path) const {
  auto it = changes_.find(std::string{path});
  if (it != std::end(changes_)) {
    return it->second;
  }
  return base_.get(path);
}

ibc::core::height_t transaction::host_height() const {
  return base_.host_height();
}

ibc::core::timestamp_t transaction::host_timestamp() const {
  return base_.host_timestamp();
}

const chain_info_t& transaction::chain_info() const {
  return base_.chain_info();
}

ibc::common::result_t<std::optional<host_block_t>> transaction::host_block(
    const uint64_t height) const {
  return base_.host_block(height);
}

void transaction::set(std::string path, ibc::schema::bytes_t value) {
  changes_.insert_or_assign(std::move(path), std::move(value));
}

void transaction::remove(std::string path) {
  changes_.insert_or_assign(std::move(path), std::nullopt);
}

void transaction::emit(ibc::core::event_t event) {
  events_.push_back(std::move(event));
}

const transaction::changes_t& transaction::changes() const {
  return changes_;
}

const std::vector<ibc::core::event_t>& transaction::events() const {
  return events_;
}

std::vector<ibc::core::event_t> transaction::take_events() {
  return std::exchange(events_, {});
}

}  // namespace ibc::host

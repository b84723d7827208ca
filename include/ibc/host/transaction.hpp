#pragma once

#include <ibc/host/context.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ibc::host {

/// Buffered writes over a reader. Nothing reaches the underlying store until
/// the owner applies `changes()`; dropping the transaction discards them.
class transaction final : public writer {
 public:
  using changes_t = std::map<std::string, std::optional<ibc::schema::bytes_t>>;

  explicit transaction(const reader& base);

  ibc::common::result_t<std::optional<ibc::schema::bytes_t>> get(
      std::string_view path) const override;
  ibc::core::height_t host_height() const override;
  ibc::core::timestamp_t host_timestamp() const override;
  const chain_info_t& chain_info() const override;
  ibc::common::result_t<std::optional<host_block_t>> host_block(
      uint64_t height) const override;

  void set(std::string path, ibc::schema::bytes_t value) override;
  void remove(std::string path) override;
  void emit(ibc::core::event_t event) override;

  const changes_t& changes() const;
  const std::vector<ibc::core::event_t>& events() const;
  std::vector<ibc::core::event_t> take_events();

 private:
  const reader& base_;
  changes_t changes_;
  std::vector<ibc::core::event_t> events_;
};

}  // namespace ibc::host

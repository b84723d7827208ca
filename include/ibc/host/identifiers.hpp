#pragma once

#include <ibc/common/error.hpp>

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace ibc::host {

inline constexpr auto kTendermintClientType = std::string_view{"07-tendermint"};
inline constexpr auto kConnectionPrefix = std::string_view{"connection"};
inline constexpr auto kChannelPrefix = std::string_view{"channel"};

struct client_id_t final {
  std::string value;

  auto operator<=>(const client_id_t&) const = default;
};

struct connection_id_t final {
  std::string value;

  auto operator<=>(const connection_id_t&) const = default;
};

struct channel_id_t final {
  std::string value;

  auto operator<=>(const channel_id_t&) const = default;
};

struct port_id_t final {
  std::string value;

  auto operator<=>(const port_id_t&) const = default;
};

ibc::common::status_t validate_identifier_chars(std::string_view id);
ibc::common::status_t validate_identifier_length(std::string_view id,
                                                 uint64_t min,
                                                 uint64_t max);

/// `{prefix}-{u64}` with no leading zeros.
ibc::common::status_t validate_named_index(std::string_view id,
                                           std::string_view prefix);

ibc::common::status_t validate(const client_id_t& id);
ibc::common::status_t validate(const connection_id_t& id);
ibc::common::status_t validate(const channel_id_t& id);
ibc::common::status_t validate(const port_id_t& id);

ibc::common::result_t<client_id_t> make_client_id(std::string value);
ibc::common::result_t<connection_id_t> make_connection_id(std::string value);
ibc::common::result_t<channel_id_t> make_channel_id(std::string value);
ibc::common::result_t<port_id_t> make_port_id(std::string value);

/// Identifiers allocated from the host's per-kind counters.
client_id_t format_client_id(std::string_view client_type, uint64_t counter);
connection_id_t format_connection_id(uint64_t counter);
channel_id_t format_channel_id(uint64_t counter);

}  // namespace ibc::host

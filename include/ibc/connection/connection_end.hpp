#pragma once

#include <ibc/connection/version.hpp>
#include <ibc/host/identifiers.hpp>
#include <ibc/schema/enum_string.hpp>
#include <ibc/schema/primitives.hpp>

#include <optional>
#include <scale/enum_traits.hpp>
#include <vector>

namespace ibc::connection {

enum class connection_state : uint8_t {
  uninitialized = 0,
  init = 1,
  try_open = 2,
  open = 3,
};

inline constexpr auto kConnectionStateMappings =
    ibc::schema::enum_mappings_t<connection_state, 4>{{
        {"STATE_UNINITIALIZED_UNSPECIFIED", connection_state::uninitialized},
        {"STATE_INIT", connection_state::init},
        {"STATE_TRYOPEN", connection_state::try_open},
        {"STATE_OPEN", connection_state::open},
    }};

inline std::string_view to_string(const connection_state state) {
  return ibc::schema::to_string(state, kConnectionStateMappings);
}

struct counterparty_t final {
  ibc::host::client_id_t client_id;
  std::optional<ibc::host::connection_id_t> connection_id;
  ibc::schema::bytes_t prefix;

  bool operator==(const counterparty_t&) const = default;
};

struct connection_end_t final {
  connection_state state{connection_state::uninitialized};
  ibc::host::client_id_t client_id;
  counterparty_t counterparty;
  std::vector<version_t> versions;
  ibc::schema::duration_nanoseconds_t delay_period{};

  bool operator==(const connection_end_t&) const = default;
};

}  // namespace ibc::connection

SCALE_DEFINE_ENUM_VALUE_RANGE(ibc::connection,
                              connection_state,
                              ibc::connection::connection_state::uninitialized,
                              ibc::connection::connection_state::open);

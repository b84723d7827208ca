#pragma once

#include <ibc/host/identifiers.hpp>
#include <ibc/schema/enum_string.hpp>

#include <optional>
#include <scale/enum_traits.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace ibc::channel {

enum class channel_state : uint8_t {
  uninitialized = 0,
  init = 1,
  try_open = 2,
  open = 3,
  closed = 4,
};

inline constexpr auto kChannelStateMappings =
    ibc::schema::enum_mappings_t<channel_state, 5>{{
        {"STATE_UNINITIALIZED_UNSPECIFIED", channel_state::uninitialized},
        {"STATE_INIT", channel_state::init},
        {"STATE_TRYOPEN", channel_state::try_open},
        {"STATE_OPEN", channel_state::open},
        {"STATE_CLOSED", channel_state::closed},
    }};

inline std::string_view to_string(const channel_state state) {
  return ibc::schema::to_string(state, kChannelStateMappings);
}

enum class ordering : uint8_t {
  none = 0,
  unordered = 1,
  ordered = 2,
};

/// The names double as connection version features.
inline constexpr auto kOrderingMappings =
    ibc::schema::enum_mappings_t<ordering, 3>{{
        {"ORDER_NONE_UNSPECIFIED", ordering::none},
        {"ORDER_UNORDERED", ordering::unordered},
        {"ORDER_ORDERED", ordering::ordered},
    }};

inline std::string_view to_string(const ordering order) {
  return ibc::schema::to_string(order, kOrderingMappings);
}

struct counterparty_t final {
  ibc::host::port_id_t port_id;
  std::optional<ibc::host::channel_id_t> channel_id;

  bool operator==(const counterparty_t&) const = default;
};

struct channel_end_t final {
  channel_state state{channel_state::uninitialized};
  ibc::channel::ordering ordering{ordering::none};
  counterparty_t counterparty;
  std::vector<ibc::host::connection_id_t> connection_hops;
  std::string version;

  bool operator==(const channel_end_t&) const = default;
};

}  // namespace ibc::channel

SCALE_DEFINE_ENUM_VALUE_RANGE(ibc::channel,
                              channel_state,
                              ibc::channel::channel_state::uninitialized,
                              ibc::channel::channel_state::closed);
SCALE_DEFINE_ENUM_VALUE_RANGE(ibc::channel,
                              ordering,
                              ibc::channel::ordering::none,
                              ibc::channel::ordering::ordered);

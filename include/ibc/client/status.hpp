#pragma once

#include <ibc/client/client_state.hpp>
#include <ibc/host/context.hpp>
#include <ibc/host/identifiers.hpp>
#include <ibc/schema/enum_string.hpp>

#include <string_view>

namespace ibc::client {

enum class client_status : uint8_t { active, frozen, expired };

inline constexpr auto kClientStatusMappings =
    ibc::schema::enum_mappings_t<client_status, 3>{{
        {"Active", client_status::active},
        {"Frozen", client_status::frozen},
        {"Expired", client_status::expired},
    }};

inline std::string_view to_string(const client_status status) {
  return ibc::schema::to_string(status, kClientStatusMappings);
}

/// Frozen if a frozen height is set, Expired if the consensus state at the
/// latest height is missing or older than the trusting period, else Active.
ibc::common::result_t<client_status> status(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const client_state_t& state);

/// `client_frozen`, `client_expired` or success.
ibc::common::status_t require_active(const ibc::host::reader& store,
                                     const ibc::host::client_id_t& client_id,
                                     const client_state_t& state);

/// A consensus state older than the trusting period at host time `now`.
bool is_expired(const client_state_t& state,
                const ibc::core::timestamp_t& consensus_time,
                const ibc::core::timestamp_t& now);

}  // namespace ibc::client

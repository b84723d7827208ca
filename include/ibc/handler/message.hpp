#pragma once

#include <ibc/channel/msgs.hpp>
#include <ibc/client/msgs.hpp>
#include <ibc/connection/msgs.hpp>

#include <string_view>
#include <variant>

namespace ibc::handler {

/// Closed set of messages accepted by the engine. The SCALE encoding of this
/// variant (index byte, then the message) is the inbound envelope.
using message_t = std::variant<ibc::client::msg_create_client,
                               ibc::client::msg_update_client,
                               ibc::client::msg_upgrade_client,
                               ibc::client::msg_submit_misbehaviour,
                               ibc::client::msg_recover_client,
                               ibc::connection::msg_conn_open_init,
                               ibc::connection::msg_conn_open_try,
                               ibc::connection::msg_conn_open_ack,
                               ibc::connection::msg_conn_open_confirm,
                               ibc::channel::msg_chan_open_init,
                               ibc::channel::msg_chan_open_try,
                               ibc::channel::msg_chan_open_ack,
                               ibc::channel::msg_chan_open_confirm,
                               ibc::channel::msg_chan_close_init,
                               ibc::channel::msg_chan_close_confirm,
                               ibc::channel::msg_recv_packet,
                               ibc::channel::msg_acknowledgement,
                               ibc::channel::msg_timeout,
                               ibc::channel::msg_timeout_on_close>;

/// Short name used in logs, e.g. "update_client".
std::string_view message_name(const message_t& message);

}  // namespace ibc::handler

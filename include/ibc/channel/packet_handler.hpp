#pragma once

#include <ibc/channel/msgs.hpp>
#include <ibc/host/context.hpp>
#include <ibc/router/router.hpp>

namespace ibc::channel {

/// Checks run before a local application commits an outbound packet.
ibc::common::status_t validate_send_packet(const ibc::host::reader& store,
                                           const packet_t& packet);
ibc::common::status_t execute_send_packet(ibc::host::writer& store,
                                          const packet_t& packet);

ibc::common::status_t validate_recv_packet(const ibc::host::reader& store,
                                           const ibc::router::router& modules,
                                           const msg_recv_packet& msg);
ibc::common::status_t execute_recv_packet(ibc::host::writer& store,
                                          ibc::router::router& modules,
                                          const msg_recv_packet& msg);

ibc::common::status_t validate_acknowledgement(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_acknowledgement& msg);
ibc::common::status_t execute_acknowledgement(
    ibc::host::writer& store,
    ibc::router::router& modules,
    const msg_acknowledgement& msg);

ibc::common::status_t validate_timeout(const ibc::host::reader& store,
                                       const ibc::router::router& modules,
                                       const msg_timeout& msg);
ibc::common::status_t execute_timeout(ibc::host::writer& store,
                                      ibc::router::router& modules,
                                      const msg_timeout& msg);

ibc::common::status_t validate_timeout_on_close(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_timeout_on_close& msg);
ibc::common::status_t execute_timeout_on_close(
    ibc::host::writer& store,
    ibc::router::router& modules,
    const msg_timeout_on_close& msg);

}  // namespace ibc::channel

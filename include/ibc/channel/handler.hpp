#pragma once

#include <ibc/channel/msgs.hpp>
#include <ibc/host/context.hpp>
#include <ibc/router/router.hpp>

// Channel handshake handlers. Every step consults the module bound to the
// local port: its validate callback in `validate_*`, its execute callback in
// `execute_*`.
namespace ibc::channel {

ibc::common::status_t validate_chan_open_init(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_chan_open_init& msg);
ibc::common::result_t<ibc::host::channel_id_t> execute_chan_open_init(
    ibc::host::writer& store,
    ibc::router::router& modules,
    const msg_chan_open_init& msg);

ibc::common::status_t validate_chan_open_try(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_chan_open_try& msg);
ibc::common::result_t<ibc::host::channel_id_t> execute_chan_open_try(
    ibc::host::writer& store,
    ibc::router::router& modules,
    const msg_chan_open_try& msg);

ibc::common::status_t validate_chan_open_ack(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_chan_open_ack& msg);
ibc::common::status_t execute_chan_open_ack(ibc::host::writer& store,
                                            ibc::router::router& modules,
                                            const msg_chan_open_ack& msg);

ibc::common::status_t validate_chan_open_confirm(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_chan_open_confirm& msg);
ibc::common::status_t execute_chan_open_confirm(
    ibc::host::writer& store,
    ibc::router::router& modules,
    const msg_chan_open_confirm& msg);

ibc::common::status_t validate_chan_close_init(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_chan_close_init& msg);
ibc::common::status_t execute_chan_close_init(ibc::host::writer& store,
                                              ibc::router::router& modules,
                                              const msg_chan_close_init& msg);

ibc::common::status_t validate_chan_close_confirm(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_chan_close_confirm& msg);
ibc::common::status_t execute_chan_close_confirm(
    ibc::host::writer& store,
    ibc::router::router& modules,
    const msg_chan_close_confirm& msg);

}  // namespace ibc::channel

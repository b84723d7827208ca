#pragma once

#include <ibc/connection/msgs.hpp>
#include <ibc/host/context.hpp>

namespace ibc::connection {

ibc::common::status_t validate_conn_open_init(const ibc::host::reader& store,
                                              const msg_conn_open_init& msg);
ibc::common::result_t<ibc::host::connection_id_t> execute_conn_open_init(
    ibc::host::writer& store,
    const msg_conn_open_init& msg);

ibc::common::status_t validate_conn_open_try(const ibc::host::reader& store,
                                             const msg_conn_open_try& msg);
ibc::common::result_t<ibc::host::connection_id_t> execute_conn_open_try(
    ibc::host::writer& store,
    const msg_conn_open_try& msg);

ibc::common::status_t validate_conn_open_ack(const ibc::host::reader& store,
                                             const msg_conn_open_ack& msg);
ibc::common::status_t execute_conn_open_ack(ibc::host::writer& store,
                                            const msg_conn_open_ack& msg);

ibc::common::status_t validate_conn_open_confirm(
    const ibc::host::reader& store,
    const msg_conn_open_confirm& msg);
ibc::common::status_t execute_conn_open_confirm(
    ibc::host::writer& store,
    const msg_conn_open_confirm& msg);

}  // namespace ibc::connection

#include <ibc/channel/handler.hpp>
#include <ibc/channel/packet_handler.hpp>
#include <ibc/client/handler.hpp>
#include <ibc/connection/handler.hpp>
#include <ibc/handler/dispatch.hpp>

namespace ibc::handler {

namespace {

template <typename T>
ibc::common::status_t discard_value(const ibc::common::result_t<T>& result) {
  if (!result) {
    return result.as_failure();
  }
  return outcome::success();
}

}  // namespace

std::string_view message_name(const message_t& message) {
  return std::visit(
      overloaded{
          [](const ibc::client::msg_create_client&) {
            return std::string_view{"create_client"};
          },
          [](const ibc::client::msg_update_client&) {
            return std::string_view{"update_client"};
          },
          [](const ibc::client::msg_upgrade_client&) {
            return std::string_view{"upgrade_client"};
          },
          [](const ibc::client::msg_submit_misbehaviour&) {
            return std::string_view{"submit_misbehaviour"};
          },
          [](const ibc::client::msg_recover_client&) {
            return std::string_view{"recover_client"};
          },
          [](const ibc::connection::msg_conn_open_init&) {
            return std::string_view{"conn_open_init"};
          },
          [](const ibc::connection::msg_conn_open_try&) {
            return std::string_view{"conn_open_try"};
          },
          [](const ibc::connection::msg_conn_open_ack&) {
            return std::string_view{"conn_open_ack"};
          },
          [](const ibc::connection::msg_conn_open_confirm&) {
            return std::string_view{"conn_open_confirm"};
          },
          [](const ibc::channel::msg_chan_open_init&) {
            return std::string_view{"chan_open_init"};
          },
          [](const ibc::channel::msg_chan_open_try&) {
            return std::string_view{"chan_open_try"};
          },
          [](const ibc::channel::msg_chan_open_ack&) {
            return std::string_view{"chan_open_ack"};
          },
          [](const ibc::channel::msg_chan_open_confirm&) {
            return std::string_view{"chan_open_confirm"};
          },
          [](const ibc::channel::msg_chan_close_init&) {
            return std::string_view{"chan_close_init"};
          },
          [](const ibc::channel::msg_chan_close_confirm&) {
            return std::string_view{"chan_close_confirm"};
          },
          [](const ibc::channel::msg_recv_packet&) {
            return std::string_view{"recv_packet"};
          },
          [](const ibc::channel::msg_acknowledgement&) {
            return std::string_view{"acknowledgement"};
          },
          [](const ibc::channel::msg_timeout&) {
            return std::string_view{"timeout"};
          },
          [](const ibc::channel::msg_timeout_on_close&) {
            return std::string_view{"timeout_on_close"};
          }},
      message);
}

ibc::common::status_t validate(const ibc::host::reader& store,
                               const ibc::router::router& modules,
                               const ibc::client::signature_verifier_t& verifier,
                               const message_t& message) {
  return std::visit(
      overloaded{
          [&](const ibc::client::msg_create_client& msg) {
            return ibc::client::validate_create_client(store, msg);
          },
          [&](const ibc::client::msg_update_client& msg) {
            return ibc::client::validate_update_client(store, msg, verifier);
          },
          [&](const ibc::client::msg_upgrade_client& msg) {
            return ibc::client::validate_upgrade_client(store, msg);
          },
          [&](const ibc::client::msg_submit_misbehaviour& msg) {
            return ibc::client::validate_submit_misbehaviour(store, msg,
                                                             verifier);
          },
          [&](const ibc::client::msg_recover_client& msg) {
            return ibc::client::validate_recover_client(store, msg);
          },
          [&](const ibc::connection::msg_conn_open_init& msg) {
            return ibc::connection::validate_conn_open_init(store, msg);
          },
          [&](const ibc::connection::msg_conn_open_try& msg) {
            return ibc::connection::validate_conn_open_try(store, msg);
          },
          [&](const ibc::connection::msg_conn_open_ack& msg) {
            return ibc::connection::validate_conn_open_ack(store, msg);
          },
          [&](const ibc::connection::msg_conn_open_confirm& msg) {
            return ibc::connection::validate_conn_open_confirm(store, msg);
          },
          [&](const ibc::channel::msg_chan_open_init& msg) {
            return ibc::channel::validate_chan_open_init(store, modules, msg);
          },
          [&](const ibc::channel::msg_chan_open_try& msg) {
            return ibc::channel::validate_chan_open_try(store, modules, msg);
          },
          [&](const ibc::channel::msg_chan_open_ack& msg) {
            return ibc::channel::validate_chan_open_ack(store, modules, msg);
          },
          [&](const ibc::channel::msg_chan_open_confirm& msg) {
            return ibc::channel::validate_chan_open_confirm(store, modules,
                                                            msg);
          },
          [&](const ibc::channel::msg_chan_close_init& msg) {
            return ibc::channel::validate_chan_close_init(store, modules, msg);
          },
          [&](const ibc::channel::msg_chan_close_confirm& msg) {
            return ibc::channel::validate_chan_close_confirm(store, modules,
                                                             msg);
          },
          [&](const ibc::channel::msg_recv_packet& msg) {
            return ibc::channel::validate_recv_packet(store, modules, msg);
          },
          [&](const ibc::channel::msg_acknowledgement& msg) {
            return ibc::channel::validate_acknowledgement(store, modules, msg);
          },
          [&](const ibc::channel::msg_timeout& msg) {
            return ibc::channel::validate_timeout(store, modules, msg);
          },
          [&](const ibc::channel::msg_timeout_on_close& msg) {
            return ibc::channel::validate_timeout_on_close(store, modules,
                                                           msg);
          }},
      message);
}

ibc::common::status_t execute(ibc::host::writer& store,
                              ibc::router::router& modules,
                              const message_t& message) {
  return std::visit(
      overloaded{
          [&](const ibc::client::msg_create_client& msg) {
            return discard_value(
                ibc::client::execute_create_client(store, msg));
          },
          [&](const ibc::client::msg_update_client& msg) {
            return ibc::client::execute_update_client(store, msg);
          },
          [&](const ibc::client::msg_upgrade_client& msg) {
            return ibc::client::execute_upgrade_client(store, msg);
          },
          [&](const ibc::client::msg_submit_misbehaviour& msg) {
            return ibc::client::execute_submit_misbehaviour(store, msg);
          },
          [&](const ibc::client::msg_recover_client& msg) {
            return ibc::client::execute_recover_client(store, msg);
          },
          [&](const ibc::connection::msg_conn_open_init& msg) {
            return discard_value(
                ibc::connection::execute_conn_open_init(store, msg));
          },
          [&](const ibc::connection::msg_conn_open_try& msg) {
            return discard_value(
                ibc::connection::execute_conn_open_try(store, msg));
          },
          [&](const ibc::connection::msg_conn_open_ack& msg) {
            return ibc::connection::execute_conn_open_ack(store, msg);
          },
          [&](const ibc::connection::msg_conn_open_confirm& msg) {
            return ibc::connection::execute_conn_open_confirm(store, msg);
          },
          [&](const ibc::channel::msg_chan_open_init& msg) {
            return discard_value(
                ibc::channel::execute_chan_open_init(store, modules, msg));
          },
          [&](const ibc::channel::msg_chan_open_try& msg) {
            return discard_value(
                ibc::channel::execute_chan_open_try(store, modules, msg));
          },
          [&](const ibc::channel::msg_chan_open_ack& msg) {
            return ibc::channel::execute_chan_open_ack(store, modules, msg);
          },
          [&](const ibc::channel::msg_chan_open_confirm& msg) {
            return ibc::channel::execute_chan_open_confirm(store, modules,
                                                           msg);
          },
          [&](const ibc::channel::msg_chan_close_init& msg) {
            return ibc::channel::execute_chan_close_init(store, modules, msg);
          },
          [&](const ibc::channel::msg_chan_close_confirm& msg) {
            return ibc::channel::execute_chan_close_confirm(store, modules,
                                                            msg);
          },
          [&](const ibc::channel::msg_recv_packet& msg) {
            return ibc::channel::execute_recv_packet(store, modules, msg);
          },
          [&](const ibc::channel::msg_acknowledgement& msg) {
            return ibc::channel::execute_acknowledgement(store, modules, msg);
          },
          [&](const ibc::channel::msg_timeout& msg) {
            return ibc::channel::execute_timeout(store, modules, msg);
          },
          [&](const ibc::channel::msg_timeout_on_close& msg) {
            return ibc::channel::execute_timeout_on_close(store, modules, msg);
          }},
      message);
}

}  // namespace ibc::handler

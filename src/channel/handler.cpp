#include <ibc/channel/handler.hpp>
#include <ibc/channel/store.hpp>
#include <ibc/channel/verify.hpp>
#include <ibc/client/status.hpp>
#include <ibc/client/store.hpp>
#include <ibc/connection/store.hpp>
#include <ibc/host/path.hpp>
#include <ibc/host/store.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace ibc::channel {

namespace {

using ibc::common::error_code;
using ibc::common::make_error;

ibc::core::event_t channel_event(std::string type,
                                 const ibc::host::port_id_t& port_id,
                                 const ibc::host::channel_id_t& channel_id,
                                 const channel_end_t& end) {
  auto counterparty_channel = end.counterparty.channel_id
                                  ? end.counterparty.channel_id->value
                                  : std::string{};
  auto connection_id = end.connection_hops.empty()
                           ? std::string{}
                           : end.connection_hops.front().value;
  return ibc::core::event_t{
      .type = std::move(type),
      .attributes = {{"port_id", port_id.value},
                     {"channel_id", channel_id.value},
                     {"counterparty_port_id", end.counterparty.port_id.value},
                     {"counterparty_channel_id",
                      std::move(counterparty_channel)},
                     {"connection_id", std::move(connection_id)},
                     {"version", end.version}}};
}

ibc::common::status_t require_state(const channel_end_t& end,
                                    const channel_state expected) {
  if (end.state != expected) {
    return make_error(error_code::invalid_channel_state,
                      fmt::format("channel is {}, expected {}",
                                  to_string(end.state), to_string(expected)));
  }
  return outcome::success();
}

ibc::common::status_t require_not_closed(const channel_end_t& end) {
  if (end.state == channel_state::closed) {
    return make_error(error_code::channel_closed, "channel is already closed");
  }
  return outcome::success();
}

ibc::common::status_t require_active_client(
    const ibc::host::reader& store,
    const ibc::connection::connection_end_t& connection) {
  auto state = ibc::client::get_client_state(store, connection.client_id);
  if (!state) {
    return state.as_failure();
  }
  return ibc::client::require_active(store, connection.client_id,
                                     state.value());
}

ibc::common::status_t callback_status(const ibc::common::status_t& status) {
  if (!status) {
    return ibc::router::callback_error(status.error());
  }
  return outcome::success();
}

ibc::common::result_t<std::string> callback_version(
    const ibc::common::result_t<std::string>& version) {
  if (!version) {
    return ibc::router::callback_error(version.error());
  }
  return version.value();
}

// Shared checks of both open-init passes.
ibc::common::result_t<ibc::connection::connection_end_t> open_init_connection(
    const ibc::host::reader& store,
    const msg_chan_open_init& msg) {
  BOOST_OUTCOME_TRYV(ibc::host::validate(msg.port_id));
  BOOST_OUTCOME_TRYV(ibc::host::validate(msg.counterparty_port_id));
  BOOST_OUTCOME_TRYV(validate_connection_hops(msg.connection_hops));
  auto connection =
      ibc::connection::get_connection(store, msg.connection_hops.front());
  if (!connection) {
    return connection.as_failure();
  }
  BOOST_OUTCOME_TRYV(verify_ordering_supported(connection.value(), msg.ordering));
  BOOST_OUTCOME_TRYV(require_active_client(store, connection.value()));
  return connection;
}

ibc::router::channel_open_t init_callback_args(
    const msg_chan_open_init& msg,
    ibc::host::channel_id_t channel_id) {
  return ibc::router::channel_open_t{
      .ordering = msg.ordering,
      .connection_hops = msg.connection_hops,
      .port_id = msg.port_id,
      .channel_id = std::move(channel_id),
      .counterparty = counterparty_t{.port_id = msg.counterparty_port_id,
                                     .channel_id = std::nullopt},
      .version = msg.version};
}

ibc::router::channel_open_t try_callback_args(
    const msg_chan_open_try& msg,
    ibc::host::channel_id_t channel_id) {
  return ibc::router::channel_open_t{
      .ordering = msg.ordering,
      .connection_hops = msg.connection_hops,
      .port_id = msg.port_id,
      .channel_id = std::move(channel_id),
      .counterparty = counterparty_t{.port_id = msg.counterparty_port_id,
                                     .channel_id = msg.counterparty_channel_id},
      .version = msg.counterparty_version};
}

// Identifier the next open-init/open-try will allocate.
ibc::common::result_t<ibc::host::channel_id_t> peek_channel_id(
    const ibc::host::reader& store) {
  auto next = ibc::host::get_u64(store, ibc::host::path::kNextChannelSequence);
  if (!next) {
    return next.as_failure();
  }
  return ibc::host::format_channel_id(next.value().value_or(0));
}

ibc::common::result_t<ibc::host::channel_id_t> store_new_channel(
    ibc::host::writer& store,
    const ibc::host::port_id_t& port_id,
    const channel_end_t& end) {
  auto sequence =
      ibc::host::allocate_sequence(store, ibc::host::path::kNextChannelSequence);
  if (!sequence) {
    return sequence.as_failure();
  }
  auto channel_id = ibc::host::format_channel_id(sequence.value());
  set_channel(store, port_id, channel_id, end);
  for (auto kind : {sequence_kind::send, sequence_kind::recv,
                    sequence_kind::ack}) {
    set_next_sequence(store, kind, port_id, channel_id, 1);
  }
  return channel_id;
}

ibc::common::result_t<ibc::connection::connection_end_t> open_connection_of(
    const ibc::host::reader& store,
    const channel_end_t& end) {
  auto connection = hop_connection(store, end);
  if (!connection) {
    return connection.as_failure();
  }
  BOOST_OUTCOME_TRYV(require_open_connection(connection.value()));
  return connection;
}

}  // namespace

ibc::common::status_t validate_chan_open_init(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_chan_open_init& msg) {
  auto connection = open_init_connection(store, msg);
  if (!connection) {
    return connection.as_failure();
  }
  auto app = modules.route(msg.port_id);
  if (!app) {
    return app.as_failure();
  }
  auto channel_id = peek_channel_id(store);
  if (!channel_id) {
    return channel_id.as_failure();
  }
  auto version = callback_version(app.value()->on_chan_open_init_validate(
      init_callback_args(msg, channel_id.value())));
  if (!version) {
    return version.as_failure();
  }
  return outcome::success();
}

ibc::common::result_t<ibc::host::channel_id_t> execute_chan_open_init(
    ibc::host::writer& store,
    ibc::router::router& modules,
    const msg_chan_open_init& msg) {
  auto app = modules.route(msg.port_id);
  if (!app) {
    return app.as_failure();
  }
  auto next = peek_channel_id(store);
  if (!next) {
    return next.as_failure();
  }
  auto version = callback_version(app.value()->on_chan_open_init_execute(
      init_callback_args(msg, next.value())));
  if (!version) {
    return version.as_failure();
  }
  auto end = channel_end_t{
      .state = channel_state::init,
      .ordering = msg.ordering,
      .counterparty = counterparty_t{.port_id = msg.counterparty_port_id,
                                     .channel_id = std::nullopt},
      .connection_hops = msg.connection_hops,
      .version = std::move(version.value())};
  auto channel_id = store_new_channel(store, msg.port_id, end);
  if (!channel_id) {
    return channel_id.as_failure();
  }
  store.emit(channel_event("channel_open_init", msg.port_id,
                           channel_id.value(), end));
  spdlog::info("Channel {}/{} Init on {}", msg.port_id.value,
               channel_id.value().value, msg.connection_hops.front().value);
  return channel_id;
}

ibc::common::status_t validate_chan_open_try(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_chan_open_try& msg) {
  BOOST_OUTCOME_TRYV(ibc::host::validate(msg.port_id));
  BOOST_OUTCOME_TRYV(ibc::host::validate(msg.counterparty_channel_id));
  BOOST_OUTCOME_TRYV(validate_connection_hops(msg.connection_hops));
  auto connection =
      ibc::connection::get_connection(store, msg.connection_hops.front());
  if (!connection) {
    return connection.as_failure();
  }
  const auto& conn = connection.value();
  BOOST_OUTCOME_TRYV(require_open_connection(conn));
  BOOST_OUTCOME_TRYV(verify_ordering_supported(conn, msg.ordering));
  if (!conn.counterparty.connection_id) {
    return make_error(error_code::missing_counterparty_connection_id,
                      "open connection has no counterparty connection id");
  }
  auto expected = channel_end_t{
      .state = channel_state::init,
      .ordering = msg.ordering,
      .counterparty =
          counterparty_t{.port_id = msg.port_id, .channel_id = std::nullopt},
      .connection_hops = {*conn.counterparty.connection_id},
      .version = msg.counterparty_version};
  BOOST_OUTCOME_TRYV(verify_channel_state(
      store, conn, msg.proof_height, msg.proof_init, msg.counterparty_port_id,
      msg.counterparty_channel_id, expected));

  auto app = modules.route(msg.port_id);
  if (!app) {
    return app.as_failure();
  }
  auto channel_id = peek_channel_id(store);
  if (!channel_id) {
    return channel_id.as_failure();
  }
  auto version = callback_version(app.value()->on_chan_open_try_validate(
      try_callback_args(msg, channel_id.value())));
  if (!version) {
    return version.as_failure();
  }
  return outcome::success();
}

ibc::common::result_t<ibc::host::channel_id_t> execute_chan_open_try(
    ibc::host::writer& store,
    ibc::router::router& modules,
    const msg_chan_open_try& msg) {
  auto app = modules.route(msg.port_id);
  if (!app) {
    return app.as_failure();
  }
  auto next = peek_channel_id(store);
  if (!next) {
    return next.as_failure();
  }
  auto version = callback_version(app.value()->on_chan_open_try_execute(
      try_callback_args(msg, next.value())));
  if (!version) {
    return version.as_failure();
  }
  auto end = channel_end_t{
      .state = channel_state::try_open,
      .ordering = msg.ordering,
      .counterparty = counterparty_t{.port_id = msg.counterparty_port_id,
                                     .channel_id = msg.counterparty_channel_id},
      .connection_hops = msg.connection_hops,
      .version = std::move(version.value())};
  auto channel_id = store_new_channel(store, msg.port_id, end);
  if (!channel_id) {
    return channel_id.as_failure();
  }
  store.emit(
      channel_event("channel_open_try", msg.port_id, channel_id.value(), end));
  spdlog::info("Channel {}/{} TryOpen on {}", msg.port_id.value,
               channel_id.value().value, msg.connection_hops.front().value);
  return channel_id;
}

ibc::common::status_t validate_chan_open_ack(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_chan_open_ack& msg) {
  BOOST_OUTCOME_TRYV(ibc::host::validate(msg.counterparty_channel_id));
  auto end = get_channel(store, msg.port_id, msg.channel_id);
  if (!end) {
    return end.as_failure();
  }
  const auto& channel = end.value();
  BOOST_OUTCOME_TRYV(require_state(channel, channel_state::init));
  auto connection = open_connection_of(store, channel);
  if (!connection) {
    return connection.as_failure();
  }
  const auto& conn = connection.value();
  if (!conn.counterparty.connection_id) {
    return make_error(error_code::missing_counterparty_connection_id,
                      "open connection has no counterparty connection id");
  }
  auto expected = channel_end_t{
      .state = channel_state::try_open,
      .ordering = channel.ordering,
      .counterparty = counterparty_t{.port_id = msg.port_id,
                                     .channel_id = msg.channel_id},
      .connection_hops = {*conn.counterparty.connection_id},
      .version = msg.counterparty_version};
  BOOST_OUTCOME_TRYV(verify_channel_state(
      store, conn, msg.proof_height, msg.proof_try,
      channel.counterparty.port_id, msg.counterparty_channel_id, expected));

  auto app = modules.route(msg.port_id);
  if (!app) {
    return app.as_failure();
  }
  return callback_status(app.value()->on_chan_open_ack_validate(
      msg.port_id, msg.channel_id, msg.counterparty_version));
}

ibc::common::status_t execute_chan_open_ack(ibc::host::writer& store,
                                            ibc::router::router& modules,
                                            const msg_chan_open_ack& msg) {
  auto app = modules.route(msg.port_id);
  if (!app) {
    return app.as_failure();
  }
  BOOST_OUTCOME_TRYV(callback_status(app.value()->on_chan_open_ack_execute(
      msg.port_id, msg.channel_id, msg.counterparty_version)));
  auto end = get_channel(store, msg.port_id, msg.channel_id);
  if (!end) {
    return end.as_failure();
  }
  auto& channel = end.value();
  channel.state = channel_state::open;
  channel.version = msg.counterparty_version;
  channel.counterparty.channel_id = msg.counterparty_channel_id;
  set_channel(store, msg.port_id, msg.channel_id, channel);
  store.emit(
      channel_event("channel_open_ack", msg.port_id, msg.channel_id, channel));
  spdlog::info("Channel {}/{} Open (ack)", msg.port_id.value,
               msg.channel_id.value);
  return outcome::success();
}

ibc::common::status_t validate_chan_open_confirm(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_chan_open_confirm& msg) {
  auto end = get_channel(store, msg.port_id, msg.channel_id);
  if (!end) {
    return end.as_failure();
  }
  const auto& channel = end.value();
  BOOST_OUTCOME_TRYV(require_state(channel, channel_state::try_open));
  auto connection = open_connection_of(store, channel);
  if (!connection) {
    return connection.as_failure();
  }
  const auto& conn = connection.value();
  if (!conn.counterparty.connection_id || !channel.counterparty.channel_id) {
    return make_error(error_code::invalid_counterparty,
                      "counterparty identifiers are not set");
  }
  auto expected = channel_end_t{
      .state = channel_state::open,
      .ordering = channel.ordering,
      .counterparty = counterparty_t{.port_id = msg.port_id,
                                     .channel_id = msg.channel_id},
      .connection_hops = {*conn.counterparty.connection_id},
      .version = channel.version};
  BOOST_OUTCOME_TRYV(verify_channel_state(
      store, conn, msg.proof_height, msg.proof_ack,
      channel.counterparty.port_id, *channel.counterparty.channel_id,
      expected));

  auto app = modules.route(msg.port_id);
  if (!app) {
    return app.as_failure();
  }
  return callback_status(app.value()->on_chan_open_confirm_validate(
      msg.port_id, msg.channel_id));
}

ibc::common::status_t execute_chan_open_confirm(
    ibc::host::writer& store,
    ibc::router::router& modules,
    const msg_chan_open_confirm& msg) {
  auto app = modules.route(msg.port_id);
  if (!app) {
    return app.as_failure();
  }
  BOOST_OUTCOME_TRYV(callback_status(
      app.value()->on_chan_open_confirm_execute(msg.port_id, msg.channel_id)));
  auto end = get_channel(store, msg.port_id, msg.channel_id);
  if (!end) {
    return end.as_failure();
  }
  auto& channel = end.value();
  channel.state = channel_state::open;
  set_channel(store, msg.port_id, msg.channel_id, channel);
  store.emit(channel_event("channel_open_confirm", msg.port_id,
                           msg.channel_id, channel));
  spdlog::info("Channel {}/{} Open (confirm)", msg.port_id.value,
               msg.channel_id.value);
  return outcome::success();
}

ibc::common::status_t validate_chan_close_init(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_chan_close_init& msg) {
  auto end = get_channel(store, msg.port_id, msg.channel_id);
  if (!end) {
    return end.as_failure();
  }
  BOOST_OUTCOME_TRYV(require_not_closed(end.value()));
  auto connection = open_connection_of(store, end.value());
  if (!connection) {
    return connection.as_failure();
  }
  BOOST_OUTCOME_TRYV(require_active_client(store, connection.value()));
  auto app = modules.route(msg.port_id);
  if (!app) {
    return app.as_failure();
  }
  return callback_status(
      app.value()->on_chan_close_init_validate(msg.port_id, msg.channel_id));
}

ibc::common::status_t execute_chan_close_init(ibc::host::writer& store,
                                              ibc::router::router& modules,
                                              const msg_chan_close_init& msg) {
  auto app = modules.route(msg.port_id);
  if (!app) {
    return app.as_failure();
  }
  BOOST_OUTCOME_TRYV(callback_status(
      app.value()->on_chan_close_init_execute(msg.port_id, msg.channel_id)));
  auto end = get_channel(store, msg.port_id, msg.channel_id);
  if (!end) {
    return end.as_failure();
  }
  auto& channel = end.value();
  channel.state = channel_state::closed;
  set_channel(store, msg.port_id, msg.channel_id, channel);
  store.emit(channel_event("channel_close_init", msg.port_id, msg.channel_id,
                           channel));
  spdlog::info("Channel {}/{} Closed (init)", msg.port_id.value,
               msg.channel_id.value);
  return outcome::success();
}

ibc::common::status_t validate_chan_close_confirm(
    const ibc::host::reader& store,
    const ibc::router::router& modules,
    const msg_chan_close_confirm& msg) {
  auto end = get_channel(store, msg.port_id, msg.channel_id);
  if (!end) {
    return end.as_failure();
  }
  const auto& channel = end.value();
  BOOST_OUTCOME_TRYV(require_not_closed(channel));
  auto connection = open_connection_of(store, channel);
  if (!connection) {
    return connection.as_failure();
  }
  const auto& conn = connection.value();
  if (!conn.counterparty.connection_id || !channel.counterparty.channel_id) {
    return make_error(error_code::invalid_counterparty,
                      "counterparty identifiers are not set");
  }
  auto expected = channel_end_t{
      .state = channel_state::closed,
      .ordering = channel.ordering,
      .counterparty = counterparty_t{.port_id = msg.port_id,
                                     .channel_id = msg.channel_id},
      .connection_hops = {*conn.counterparty.connection_id},
      .version = channel.version};
  BOOST_OUTCOME_TRYV(verify_channel_state(
      store, conn, msg.proof_height, msg.proof_init,
      channel.counterparty.port_id, *channel.counterparty.channel_id,
      expected));

  auto app = modules.route(msg.port_id);
  if (!app) {
    return app.as_failure();
  }
  return callback_status(app.value()->on_chan_close_confirm_validate(
      msg.port_id, msg.channel_id));
}

ibc::common::status_t execute_chan_close_confirm(
    ibc::host::writer& store,
    ibc::router::router& modules,
    const msg_chan_close_confirm& msg) {
  auto app = modules.route(msg.port_id);
  if (!app) {
    return app.as_failure();
  }
  BOOST_OUTCOME_TRYV(callback_status(app.value()->on_chan_close_confirm_execute(
      msg.port_id, msg.channel_id)));
  auto end = get_channel(store, msg.port_id, msg.channel_id);
  if (!end) {
    return end.as_failure();
  }
  auto& channel = end.value();
  channel.state = channel_state::closed;
  set_channel(store, msg.port_id, msg.channel_id, channel);
  store.emit(channel_event("channel_close_confirm", msg.port_id,
                           msg.channel_id, channel));
  spdlog::info("Channel {}/{} Closed (confirm)", msg.port_id.value,
               msg.channel_id.value);
  return outcome::success();
}

}  // namespace ibc::channel

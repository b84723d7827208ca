#pragma once

#include <ibc/channel/packet_handler.hpp>
#include <ibc/client/verifier.hpp>
#include <ibc/handler/dispatch.hpp>
#include <ibc/handler/message.hpp>
#include <ibc/host/chain_store.hpp>
#include <ibc/host/transaction.hpp>
#include <ibc/router/router.hpp>
#include <ibc/schema/encoding/scale/encoder.hpp>
#include <spdlog/spdlog.h>

#include <string_view>
#include <vector>

namespace ibc::handler {

using events_t = std::vector<ibc::core::event_t>;

/// Deterministic message engine over a host chain store.
///
/// Every message is validated against committed state, executed against a
/// transaction overlay, and written to storage only when both passes
/// succeed. A failed message leaves the store and the event log untouched.
/// Not thread-safe: the host serialises calls.
template <typename StorageTag>
class engine final {
 public:
  engine(ibc::host::chain_store<StorageTag>& store,
         ibc::router::router& modules,
         ibc::client::signature_verifier_t verifier =
             ibc::client::default_signature_verifier())
      : store_{store}, modules_{modules}, verifier_{std::move(verifier)} {}

  ibc::common::result_t<events_t> dispatch(const message_t& message) {
    auto name = message_name(message);
    auto validated = validate(store_, modules_, verifier_, message);
    if (!validated) {
      return reject(name, validated.error());
    }
    auto tx = ibc::host::transaction{store_};
    auto executed = execute(tx, modules_, message);
    if (!executed) {
      return reject(name, executed.error());
    }
    return apply(name, tx);
  }

  /// Decode a SCALE `message_t` envelope, then dispatch it.
  ibc::common::result_t<events_t> dispatch(
      const ibc::schema::bytes_view_t& envelope) {
    auto message = ibc::schema::encoding::decode_input<message_t>(
        envelope, "message envelope");
    if (!message) {
      return reject("decode", message.error());
    }
    return dispatch(message.value());
  }

  /// Commit an outbound packet on behalf of a local application.
  ibc::common::result_t<events_t> send_packet(
      const ibc::channel::packet_t& packet) {
    auto validated = ibc::channel::validate_send_packet(store_, packet);
    if (!validated) {
      return reject("send_packet", validated.error());
    }
    auto tx = ibc::host::transaction{store_};
    auto executed = ibc::channel::execute_send_packet(tx, packet);
    if (!executed) {
      return reject("send_packet", executed.error());
    }
    return apply("send_packet", tx);
  }

  void begin_block(const uint64_t height,
                   const ibc::core::timestamp_t timestamp,
                   const ibc::schema::hash32_t& next_validators_hash) {
    spdlog::debug("Begin block {} at {}", height,
                  ibc::core::to_string(timestamp));
    store_.begin_block(height, timestamp, next_validators_hash);
  }

  /// Commit the current block and return its state root.
  ibc::common::result_t<ibc::schema::bytes_t> commit() {
    auto root = store_.commit();
    if (!root) {
      spdlog::error("Commit failed: {}",
                    ibc::common::describe(root.error()));
      return root;
    }
    spdlog::info("Committed block {} root {}",
                 ibc::core::to_string(store_.host_height()),
                 ibc::schema::to_hex(root.value()));
    return root;
  }

  ibc::common::result_t<ibc::commitment::merkle_proof_t> prove(
      const std::string_view store,
      const std::string_view path) const {
    return store_.prove(store, path);
  }

  void set_signature_verifier(ibc::client::signature_verifier_t verifier) {
    verifier_ = std::move(verifier);
  }

  const ibc::host::chain_store<StorageTag>& store() const { return store_; }

 private:
  ibc::common::result_t<events_t> reject(const std::string_view name,
                                         const ibc::common::error_t& error) {
    spdlog::warn("Rejected {}: {}", name, ibc::common::describe(error));
    return error;
  }

  ibc::common::result_t<events_t> apply(const std::string_view name,
                                        ibc::host::transaction& tx) {
    auto applied = store_.apply(tx.changes());
    if (!applied) {
      return reject(name, applied.error());
    }
    auto events = tx.take_events();
    for (const auto& event : events) {
      spdlog::debug("Event {} ({} attributes)", event.type,
                    event.attributes.size());
    }
    spdlog::info("Executed {} with {} event(s)", name, events.size());
    return events;
  }

  ibc::host::chain_store<StorageTag>& store_;
  ibc::router::router& modules_;
  ibc::client::signature_verifier_t verifier_;
};

}  // namespace ibc::handler

#include <ibc/channel/store.hpp>
#include <ibc/host/path.hpp>
#include <ibc/host/store.hpp>
#include <spdlog/fmt/fmt.h>

namespace ibc::channel {

namespace {

inline constexpr auto kReceiptValue = uint8_t{0x01};

std::string sequence_path(const sequence_kind kind,
                          const ibc::host::port_id_t& port_id,
                          const ibc::host::channel_id_t& channel_id) {
  switch (kind) {
    case sequence_kind::send:
      return ibc::host::path::next_sequence_send(port_id, channel_id);
    case sequence_kind::recv:
      return ibc::host::path::next_sequence_recv(port_id, channel_id);
    case sequence_kind::ack:
      return ibc::host::path::next_sequence_ack(port_id, channel_id);
  }
  return ibc::host::path::next_sequence_ack(port_id, channel_id);
}

}  // namespace

ibc::common::result_t<channel_end_t> get_channel(
    const ibc::host::reader& store,
    const ibc::host::port_id_t& port_id,
    const ibc::host::channel_id_t& channel_id) {
  auto end = ibc::host::get_entity<channel_end_t>(
      store, ibc::host::path::channel_end(port_id, channel_id), "channel end");
  if (!end) {
    return end.as_failure();
  }
  if (!end.value()) {
    return ibc::common::make_error(
        ibc::common::error_code::channel_not_found,
        fmt::format("channel {}/{} not found", port_id.value,
                    channel_id.value));
  }
  return std::move(*end.value());
}

void set_channel(ibc::host::writer& store,
                 const ibc::host::port_id_t& port_id,
                 const ibc::host::channel_id_t& channel_id,
                 const channel_end_t& end) {
  ibc::host::put_entity(
      store, ibc::host::path::channel_end(port_id, channel_id), end);
}

ibc::common::result_t<uint64_t> get_next_sequence(
    const ibc::host::reader& store,
    const sequence_kind kind,
    const ibc::host::port_id_t& port_id,
    const ibc::host::channel_id_t& channel_id) {
  auto path = sequence_path(kind, port_id, channel_id);
  auto sequence = ibc::host::get_u64(store, path);
  if (!sequence) {
    return sequence.as_failure();
  }
  if (!sequence.value()) {
    return ibc::common::make_error(ibc::common::error_code::missing_sequence,
                                   fmt::format("{} is not set", path));
  }
  return *sequence.value();
}

void set_next_sequence(ibc::host::writer& store,
                       const sequence_kind kind,
                       const ibc::host::port_id_t& port_id,
                       const ibc::host::channel_id_t& channel_id,
                       const uint64_t sequence) {
  ibc::host::set_u64(store, sequence_path(kind, port_id, channel_id),
                     sequence);
}

ibc::common::result_t<std::optional<ibc::schema::bytes_t>>
get_packet_commitment(const ibc::host::reader& store,
                      const ibc::host::port_id_t& port_id,
                      const ibc::host::channel_id_t& channel_id,
                      const uint64_t sequence) {
  return store.get(ibc::host::path::commitment(port_id, channel_id, sequence));
}

void set_packet_commitment(ibc::host::writer& store,
                           const ibc::host::port_id_t& port_id,
                           const ibc::host::channel_id_t& channel_id,
                           const uint64_t sequence,
                           const ibc::schema::hash32_t& commitment) {
  store.set(ibc::host::path::commitment(port_id, channel_id, sequence),
            ibc::schema::make_bytes(commitment));
}

void delete_packet_commitment(ibc::host::writer& store,
                              const ibc::host::port_id_t& port_id,
                              const ibc::host::channel_id_t& channel_id,
                              const uint64_t sequence) {
  store.remove(ibc::host::path::commitment(port_id, channel_id, sequence));
}

ibc::common::result_t<bool> has_packet_receipt(
    const ibc::host::reader& store,
    const ibc::host::port_id_t& port_id,
    const ibc::host::channel_id_t& channel_id,
    const uint64_t sequence) {
  return ibc::host::exists(
      store, ibc::host::path::receipt(port_id, channel_id, sequence));
}

void set_packet_receipt(ibc::host::writer& store,
                        const ibc::host::port_id_t& port_id,
                        const ibc::host::channel_id_t& channel_id,
                        const uint64_t sequence) {
  store.set(ibc::host::path::receipt(port_id, channel_id, sequence),
            ibc::schema::bytes_t{kReceiptValue});
}

ibc::common::result_t<std::optional<ibc::schema::bytes_t>>
get_ack_commitment(const ibc::host::reader& store,
                   const ibc::host::port_id_t& port_id,
                   const ibc::host::channel_id_t& channel_id,
                   const uint64_t sequence) {
  return store.get(ibc::host::path::ack(port_id, channel_id, sequence));
}

void set_ack_commitment(ibc::host::writer& store,
                        const ibc::host::port_id_t& port_id,
                        const ibc::host::channel_id_t& channel_id,
                        const uint64_t sequence,
                        const ibc::schema::hash32_t& commitment) {
  store.set(ibc::host::path::ack(port_id, channel_id, sequence),
            ibc::schema::make_bytes(commitment));
}

}  // namespace ibc::channel

#include <ibc/common/error.hpp>
#include <spdlog/fmt/fmt.h>

#include <array>
#include <utility>

namespace ibc::common {

namespace {

inline constexpr auto kErrorNames = std::array{
    std::pair<error_code, std::string_view>{error_code::invalid_client_state,
                                            "invalid client state"},
    std::pair<error_code, std::string_view>{error_code::invalid_consensus_state,
                                            "invalid consensus state"},
    std::pair<error_code, std::string_view>{error_code::client_not_found,
                                            "client not found"},
    std::pair<error_code, std::string_view>{
        error_code::consensus_state_not_found, "consensus state not found"},
    std::pair<error_code, std::string_view>{error_code::client_frozen,
                                            "client frozen"},
    std::pair<error_code, std::string_view>{error_code::client_expired,
                                            "client expired"},
    std::pair<error_code, std::string_view>{error_code::client_not_active,
                                            "client not active"},
    std::pair<error_code, std::string_view>{error_code::invalid_header,
                                            "invalid header"},
    std::pair<error_code, std::string_view>{error_code::chain_id_mismatch,
                                            "chain id mismatch"},
    std::pair<error_code, std::string_view>{error_code::revision_mismatch,
                                            "revision mismatch"},
    std::pair<error_code, std::string_view>{
        error_code::header_not_within_trusting_period,
        "header not within trusting period"},
    std::pair<error_code, std::string_view>{error_code::header_from_future,
                                            "header from future"},
    std::pair<error_code, std::string_view>{error_code::header_not_monotonic,
                                            "header not monotonic"},
    std::pair<error_code, std::string_view>{error_code::validator_set_mismatch,
                                            "validator set mismatch"},
    std::pair<error_code, std::string_view>{
        error_code::insufficient_voting_power, "insufficient voting power"},
    std::pair<error_code, std::string_view>{error_code::invalid_commit,
                                            "invalid commit"},
    std::pair<error_code, std::string_view>{
        error_code::misbehaviour_not_detected, "misbehaviour not detected"},
    std::pair<error_code, std::string_view>{error_code::invalid_misbehaviour,
                                            "invalid misbehaviour"},
    std::pair<error_code, std::string_view>{error_code::invalid_proof_height,
                                            "invalid proof height"},
    std::pair<error_code, std::string_view>{error_code::invalid_upgrade_path,
                                            "invalid upgrade path"},
    std::pair<error_code, std::string_view>{error_code::low_upgrade_height,
                                            "low upgrade height"},
    std::pair<error_code, std::string_view>{
        error_code::upgrade_verification_failed, "upgrade verification failed"},
    std::pair<error_code, std::string_view>{error_code::invalid_recovery,
                                            "invalid recovery"},
    std::pair<error_code, std::string_view>{error_code::update_not_allowed,
                                            "update not allowed"},
    std::pair<error_code, std::string_view>{error_code::invalid_trust_level,
                                            "invalid trust level"},
    std::pair<error_code, std::string_view>{error_code::invalid_height,
                                            "invalid height"},
    std::pair<error_code, std::string_view>{
        error_code::client_verification_failed, "client verification failed"},
    std::pair<error_code, std::string_view>{error_code::connection_not_found,
                                            "connection not found"},
    std::pair<error_code, std::string_view>{
        error_code::invalid_connection_state, "invalid connection state"},
    std::pair<error_code, std::string_view>{error_code::no_common_version,
                                            "no common version"},
    std::pair<error_code, std::string_view>{error_code::version_not_supported,
                                            "version not supported"},
    std::pair<error_code, std::string_view>{error_code::invalid_version,
                                            "invalid version"},
    std::pair<error_code, std::string_view>{
        error_code::connection_verification_failed,
        "connection verification failed"},
    std::pair<error_code, std::string_view>{
        error_code::invalid_consensus_height, "invalid consensus height"},
    std::pair<error_code, std::string_view>{
        error_code::invalid_self_client_state, "invalid self client state"},
    std::pair<error_code, std::string_view>{
        error_code::missing_counterparty_connection_id,
        "missing counterparty connection id"},
    std::pair<error_code, std::string_view>{error_code::not_enough_time_elapsed,
                                            "not enough time elapsed"},
    std::pair<error_code, std::string_view>{
        error_code::not_enough_blocks_elapsed, "not enough blocks elapsed"},
    std::pair<error_code, std::string_view>{error_code::missing_update_metadata,
                                            "missing update metadata"},
    std::pair<error_code, std::string_view>{error_code::channel_not_found,
                                            "channel not found"},
    std::pair<error_code, std::string_view>{error_code::invalid_channel_state,
                                            "invalid channel state"},
    std::pair<error_code, std::string_view>{error_code::channel_closed,
                                            "channel closed"},
    std::pair<error_code, std::string_view>{error_code::invalid_connection_hops,
                                            "invalid connection hops"},
    std::pair<error_code, std::string_view>{error_code::ordering_not_supported,
                                            "ordering not supported"},
    std::pair<error_code, std::string_view>{error_code::invalid_counterparty,
                                            "invalid counterparty"},
    std::pair<error_code, std::string_view>{
        error_code::channel_verification_failed, "channel verification failed"},
    std::pair<error_code, std::string_view>{error_code::invalid_packet_sequence,
                                            "invalid packet sequence"},
    std::pair<error_code, std::string_view>{
        error_code::packet_commitment_not_found, "packet commitment not found"},
    std::pair<error_code, std::string_view>{
        error_code::incorrect_packet_commitment, "incorrect packet commitment"},
    std::pair<error_code, std::string_view>{error_code::packet_already_received,
                                            "packet already received"},
    std::pair<error_code, std::string_view>{error_code::acknowledgement_exists,
                                            "acknowledgement exists"},
    std::pair<error_code, std::string_view>{
        error_code::packet_timeout_height_elapsed,
        "packet timeout height elapsed"},
    std::pair<error_code, std::string_view>{
        error_code::packet_timeout_timestamp_elapsed,
        "packet timeout timestamp elapsed"},
    std::pair<error_code, std::string_view>{error_code::timeout_not_reached,
                                            "timeout not reached"},
    std::pair<error_code, std::string_view>{error_code::missing_timeout,
                                            "missing timeout"},
    std::pair<error_code, std::string_view>{error_code::packet_expired,
                                            "packet expired"},
    std::pair<error_code, std::string_view>{error_code::invalid_acknowledgement,
                                            "invalid acknowledgement"},
    std::pair<error_code, std::string_view>{error_code::missing_sequence,
                                            "missing sequence"},
    std::pair<error_code, std::string_view>{error_code::invalid_packet,
                                            "invalid packet"},
    std::pair<error_code, std::string_view>{error_code::empty_proof,
                                            "empty proof"},
    std::pair<error_code, std::string_view>{error_code::empty_root,
                                            "empty root"},
    std::pair<error_code, std::string_view>{
        error_code::mismatched_number_of_proofs, "mismatched number of proofs"},
    std::pair<error_code, std::string_view>{error_code::empty_value,
                                            "empty value"},
    std::pair<error_code, std::string_view>{error_code::invalid_proof_spec,
                                            "invalid proof spec"},
    std::pair<error_code, std::string_view>{error_code::invalid_merkle_proof,
                                            "invalid merkle proof"},
    std::pair<error_code, std::string_view>{
        error_code::membership_verification_failed,
        "membership verification failed"},
    std::pair<error_code, std::string_view>{
        error_code::non_membership_verification_failed,
        "non-membership verification failed"},
    std::pair<error_code, std::string_view>{error_code::unsupported_hash_op,
                                            "unsupported hash op"},
    std::pair<error_code, std::string_view>{error_code::empty_prefix,
                                            "empty prefix"},
    std::pair<error_code, std::string_view>{error_code::decoding_failed,
                                            "decoding failed"},
    std::pair<error_code, std::string_view>{error_code::storage_read_failed,
                                            "storage read failed"},
    std::pair<error_code, std::string_view>{error_code::storage_write_failed,
                                            "storage write failed"},
    std::pair<error_code, std::string_view>{
        error_code::missing_host_consensus_state,
        "missing host consensus state"},
    std::pair<error_code, std::string_view>{error_code::module_not_found,
                                            "module not found"},
    std::pair<error_code, std::string_view>{error_code::module_callback_failed,
                                            "module callback failed"},
    std::pair<error_code, std::string_view>{error_code::route_exists,
                                            "route exists"},
    std::pair<error_code, std::string_view>{
        error_code::invalid_identifier_length, "invalid identifier length"},
    std::pair<error_code, std::string_view>{
        error_code::invalid_identifier_character,
        "invalid identifier character"},
    std::pair<error_code, std::string_view>{
        error_code::invalid_identifier_prefix, "invalid identifier prefix"},
};

uint32_t band(const error_code code) {
  return static_cast<uint32_t>(code) / 100;
}

}  // namespace

error_family error_t::family() const {
  return band(code) == 6 ? error_family::host : error_family::protocol;
}

std::string_view error_t::codespace() const {
  switch (band(code)) {
    case 1:
      return "ibc.client";
    case 2:
      return "ibc.connection";
    case 3:
      return "ibc.channel";
    case 4:
      return "ibc.commitment";
    case 5:
      return "ibc.decoding";
    case 6:
      return "ibc.host";
    case 7:
      return "ibc.router";
    case 8:
      return "ibc.identifier";
    default:
      return "ibc";
  }
}

std::string_view to_string(const error_code code) {
  for (const auto& [value, name] : kErrorNames) {
    if (value == code) {
      return name;
    }
  }
  return "unknown error";
}

error_t make_error(const error_code code, std::string log) {
  return error_t{.code = code, .log = std::move(log)};
}

error_t wrap_error(const error_code code, const error_t& inner) {
  return error_t{.code = code,
                 .log = fmt::format("{}: {}", to_string(inner.code),
                                    inner.log)};
}

std::string describe(const error_t& error) {
  return fmt::format("[{}:{}] {}: {}", error.codespace(),
                     static_cast<uint32_t>(error.code), to_string(error.code),
                     error.log);
}

}  // namespace ibc::common

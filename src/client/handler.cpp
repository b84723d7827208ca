#include <ibc/client/handler.hpp>
#include <ibc/client/status.hpp>
#include <ibc/client/store.hpp>
#include <ibc/commitment/merkle.hpp>
#include <ibc/host/path.hpp>
#include <ibc/host/store.hpp>
#include <ibc/schema/encoding/scale/encoder.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace ibc::client {

namespace {

using ibc::common::error_code;
using ibc::common::make_error;
using ibc::core::height_t;

ibc::core::event_t client_event(std::string type,
                                const ibc::host::client_id_t& client_id,
                                const height_t& height) {
  return ibc::core::event_t{
      .type = std::move(type),
      .attributes = {
          {"client_id", client_id.value},
          {"client_type", std::string{ibc::host::kTendermintClientType}},
          {"consensus_height", ibc::core::to_string(height)}}};
}

// Existing state at the height that differs, or a header time that breaks
// the monotonic order of neighbouring consensus states.
ibc::common::result_t<bool> detect_misbehaviour(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const header_t& header) {
  const auto& at = height(header);
  const auto consensus = to_consensus_state(header);
  auto existing = find_consensus_state(store, client_id, at);
  if (!existing) {
    return existing.as_failure();
  }
  if (existing.value()) {
    return *existing.value() != consensus;
  }
  auto previous = previous_height(store, client_id, at);
  if (!previous) {
    return previous.as_failure();
  }
  if (previous.value()) {
    auto prev = get_consensus_state(store, client_id, *previous.value());
    if (!prev) {
      return prev.as_failure();
    }
    if (consensus.timestamp <= prev.value().timestamp) {
      return true;
    }
  }
  auto next = next_height(store, client_id, at);
  if (!next) {
    return next.as_failure();
  }
  if (next.value()) {
    auto following = get_consensus_state(store, client_id, *next.value());
    if (!following) {
      return following.as_failure();
    }
    if (consensus.timestamp >= following.value().timestamp) {
      return true;
    }
  }
  return false;
}

// Oldest-first removal of expired consensus states, stopping at the first
// one still within the trusting period.
ibc::common::status_t prune_expired(ibc::host::writer& store,
                                    const ibc::host::client_id_t& client_id,
                                    const client_state_t& state) {
  auto heights = consensus_heights(store, client_id);
  if (!heights) {
    return heights.as_failure();
  }
  for (const auto& at : heights.value()) {
    auto consensus = get_consensus_state(store, client_id, at);
    if (!consensus) {
      return consensus.as_failure();
    }
    if (!is_expired(state, consensus.value().timestamp,
                    store.host_timestamp())) {
      break;
    }
    spdlog::debug("Pruning consensus state {} of client {}",
                  ibc::core::to_string(at), client_id.value);
    BOOST_OUTCOME_TRYV(delete_consensus_state(store, client_id, at));
  }
  return outcome::success();
}

// Misbehaviour headers are checked against their own trusted state without
// the monotonic-time rules of a normal update.
ibc::common::status_t check_misbehaviour_header(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const client_state_t& state,
    const header_t& header,
    const signature_verifier_t& verifier) {
  auto trusted = get_consensus_state(store, client_id, header.trusted_height);
  if (!trusted) {
    return trusted.as_failure();
  }
  if (hash(header.trusted_next_validator_set) !=
      trusted.value().next_validators_hash) {
    return make_error(error_code::validator_set_mismatch,
                      "trusted validator set does not match the trusted "
                      "consensus state");
  }
  if (is_expired(state, trusted.value().timestamp, store.host_timestamp())) {
    return make_error(error_code::header_not_within_trusting_period,
                      fmt::format("trusted consensus state at {} is expired",
                                  ibc::core::to_string(header.trusted_height)));
  }
  BOOST_OUTCOME_TRYV(verify_commit(state.chain_id,
                                   header.trusted_next_validator_set,
                                   header.signed_header, state.trust_level,
                                   verifier));
  return verify_commit(state.chain_id, header.validator_set,
                       header.signed_header, trust_level_t{2, 3}, verifier);
}

// Merkle path of an upgrade entry: the last upgrade key is suffixed with
// the height and the entry name.
ibc::commitment::merkle_path_t upgrade_merkle_path(
    const std::vector<std::string>& upgrade_path,
    const uint64_t height,
    const bool client) {
  auto keys = upgrade_path;
  keys.back() = client
                    ? ibc::host::path::upgraded_client_state(keys.back(), height)
                    : ibc::host::path::upgraded_consensus_state(keys.back(),
                                                                height);
  return ibc::commitment::merkle_path_t{.key_path = std::move(keys)};
}

ibc::common::status_t verify_upgrade_proof(
    const client_state_t& state,
    const consensus_state_t& root,
    ibc::commitment::merkle_path_t path,
    const ibc::schema::bytes_view_t& value,
    const ibc::schema::bytes_view_t& proof_bytes) {
  auto proof = ibc::commitment::decode_proof(proof_bytes);
  if (!proof) {
    return proof.as_failure();
  }
  auto verified = ibc::commitment::verify_membership(
      state.proof_specs, root.root, path, value, proof.value());
  if (!verified) {
    return ibc::common::wrap_error(error_code::upgrade_verification_failed,
                                   verified.error());
  }
  return outcome::success();
}

// Fields a recovery may change are normalised so the remainder can be
// compared directly.
client_state_t recovery_comparable(client_state_t state) {
  state.latest_height = height_t{};
  state.frozen_height = std::nullopt;
  state.trusting_period = 0;
  state.chain_id.clear();
  state.allow_update = allow_update_t{};
  return state;
}

}  // namespace

ibc::common::status_t validate_create_client(const ibc::host::reader& store,
                                             const msg_create_client& msg) {
  BOOST_OUTCOME_TRYV(validate(msg.client_state));
  BOOST_OUTCOME_TRYV(validate(msg.consensus_state));
  if (is_frozen(msg.client_state)) {
    return make_error(error_code::invalid_client_state,
                      "a new client cannot be frozen");
  }
  if (is_expired(msg.client_state, msg.consensus_state.timestamp,
                 store.host_timestamp())) {
    return make_error(
        error_code::client_expired,
        fmt::format("consensus state at {} is already expired",
                    ibc::core::to_string(msg.consensus_state.timestamp)));
  }
  return outcome::success();
}

ibc::common::result_t<ibc::host::client_id_t> execute_create_client(
    ibc::host::writer& store,
    const msg_create_client& msg) {
  auto sequence =
      ibc::host::allocate_sequence(store, ibc::host::path::kNextClientSequence);
  if (!sequence) {
    return sequence.as_failure();
  }
  auto client_id = ibc::host::format_client_id(
      ibc::host::kTendermintClientType, sequence.value());
  const auto& at = msg.client_state.latest_height;
  set_client_state(store, client_id, msg.client_state);
  BOOST_OUTCOME_TRYV(
      set_consensus_state(store, client_id, at, msg.consensus_state));
  set_update_metadata(store, client_id, at);
  store.emit(client_event("create_client", client_id, at));
  spdlog::info("Created client {} for chain {} at {}", client_id.value,
               msg.client_state.chain_id, ibc::core::to_string(at));
  return client_id;
}

ibc::common::status_t validate_update_client(
    const ibc::host::reader& store,
    const msg_update_client& msg,
    const signature_verifier_t& verifier) {
  auto state = get_client_state(store, msg.client_id);
  if (!state) {
    return state.as_failure();
  }
  BOOST_OUTCOME_TRYV(require_active(store, msg.client_id, state.value()));
  BOOST_OUTCOME_TRYV(validate_basic(msg.header));
  auto trusted =
      get_consensus_state(store, msg.client_id, msg.header.trusted_height);
  if (!trusted) {
    return trusted.as_failure();
  }
  return verify_header(state.value(), trusted.value(), msg.header,
                       store.host_timestamp(), verifier);
}

ibc::common::status_t execute_update_client(ibc::host::writer& store,
                                            const msg_update_client& msg) {
  auto state = get_client_state(store, msg.client_id);
  if (!state) {
    return state.as_failure();
  }
  auto& client_state = state.value();
  const auto& at = height(msg.header);

  auto misbehaving = detect_misbehaviour(store, msg.client_id, msg.header);
  if (!misbehaving) {
    return misbehaving.as_failure();
  }
  if (misbehaving.value()) {
    client_state.frozen_height = at;
    set_client_state(store, msg.client_id, client_state);
    store.emit(client_event("client_misbehaviour", msg.client_id, at));
    spdlog::warn("Client {} frozen at {}: conflicting header",
                 msg.client_id.value, ibc::core::to_string(at));
    return outcome::success();
  }

  BOOST_OUTCOME_TRYV(prune_expired(store, msg.client_id, client_state));
  auto existing = find_consensus_state(store, msg.client_id, at);
  if (!existing) {
    return existing.as_failure();
  }
  if (!existing.value()) {
    BOOST_OUTCOME_TRYV(set_consensus_state(store, msg.client_id, at,
                                           to_consensus_state(msg.header)));
    set_update_metadata(store, msg.client_id, at);
  }
  client_state.latest_height = std::max(client_state.latest_height, at);
  set_client_state(store, msg.client_id, client_state);
  store.emit(client_event("update_client", msg.client_id, at));
  spdlog::debug("Updated client {} to {}", msg.client_id.value,
                ibc::core::to_string(at));
  return outcome::success();
}

ibc::common::status_t validate_submit_misbehaviour(
    const ibc::host::reader& store,
    const msg_submit_misbehaviour& msg,
    const signature_verifier_t& verifier) {
  auto state = get_client_state(store, msg.client_id);
  if (!state) {
    return state.as_failure();
  }
  BOOST_OUTCOME_TRYV(require_active(store, msg.client_id, state.value()));
  const auto& misbehaviour = msg.misbehaviour;
  BOOST_OUTCOME_TRYV(validate_basic(misbehaviour));
  if (misbehaviour.header1.signed_header.header.chain_id !=
      state.value().chain_id) {
    return make_error(error_code::chain_id_mismatch,
                      "misbehaviour headers are for another chain");
  }
  for (const auto* header : {&misbehaviour.header1, &misbehaviour.header2}) {
    auto checked = check_misbehaviour_header(store, msg.client_id,
                                             state.value(), *header, verifier);
    if (!checked) {
      return ibc::common::wrap_error(error_code::invalid_misbehaviour,
                                     checked.error());
    }
  }
  const auto& first = misbehaviour.header1.signed_header.header;
  const auto& second = misbehaviour.header2.signed_header.header;
  auto conflicting = first.height == second.height && hash(first) != hash(second);
  auto time_violation = first.height > second.height && first.time <= second.time;
  if (!conflicting && !time_violation) {
    return make_error(error_code::misbehaviour_not_detected,
                      "headers are consistent");
  }
  return outcome::success();
}

ibc::common::status_t execute_submit_misbehaviour(
    ibc::host::writer& store,
    const msg_submit_misbehaviour& msg) {
  auto state = get_client_state(store, msg.client_id);
  if (!state) {
    return state.as_failure();
  }
  const auto& at = height(msg.misbehaviour.header1);
  state.value().frozen_height = at;
  set_client_state(store, msg.client_id, state.value());
  store.emit(client_event("client_misbehaviour", msg.client_id, at));
  spdlog::warn("Client {} frozen at {} by submitted misbehaviour",
               msg.client_id.value, ibc::core::to_string(at));
  return outcome::success();
}

client_state_t apply_upgrade(const client_state_t& current,
                             const client_state_t& upgraded) {
  return client_state_t{.chain_id = upgraded.chain_id,
                        .trust_level = current.trust_level,
                        .trusting_period = current.trusting_period,
                        .unbonding_period = upgraded.unbonding_period,
                        .max_clock_drift = current.max_clock_drift,
                        .latest_height = upgraded.latest_height,
                        .frozen_height = std::nullopt,
                        .proof_specs = upgraded.proof_specs,
                        .upgrade_path = upgraded.upgrade_path,
                        .allow_update = current.allow_update};
}

ibc::common::status_t validate_upgrade_client(const ibc::host::reader& store,
                                              const msg_upgrade_client& msg) {
  auto state = get_client_state(store, msg.client_id);
  if (!state) {
    return state.as_failure();
  }
  const auto& current = state.value();
  BOOST_OUTCOME_TRYV(require_active(store, msg.client_id, current));
  if (current.upgrade_path.empty() || current.upgrade_path.size() > 2) {
    return make_error(error_code::invalid_upgrade_path,
                      fmt::format("upgrade path has {} keys, expected 1 or 2",
                                  current.upgrade_path.size()));
  }
  if (msg.client_state.latest_height <= current.latest_height) {
    return make_error(
        error_code::low_upgrade_height,
        fmt::format("upgraded height {} must exceed current height {}",
                    ibc::core::to_string(msg.client_state.latest_height),
                    ibc::core::to_string(current.latest_height)));
  }
  auto upgraded = apply_upgrade(current, msg.client_state);
  auto valid = validate(upgraded);
  if (!valid) {
    return ibc::common::wrap_error(error_code::invalid_client_state,
                                   valid.error());
  }
  if (msg.consensus_state.timestamp.nanoseconds == 0) {
    return make_error(error_code::invalid_consensus_state,
                      "upgraded consensus state timestamp must be set");
  }
  auto root = get_consensus_state(store, msg.client_id, current.latest_height);
  if (!root) {
    return root.as_failure();
  }
  auto encoder = ibc::schema::encoding::scale_encoder_t{};
  const auto revision_height = current.latest_height.revision_height;
  BOOST_OUTCOME_TRYV(verify_upgrade_proof(
      current, root.value(),
      upgrade_merkle_path(current.upgrade_path, revision_height, true),
      encoder.encode(msg.client_state), msg.proof_upgrade_client));
  return verify_upgrade_proof(
      current, root.value(),
      upgrade_merkle_path(current.upgrade_path, revision_height, false),
      encoder.encode(msg.consensus_state), msg.proof_upgrade_consensus_state);
}

ibc::common::status_t execute_upgrade_client(ibc::host::writer& store,
                                             const msg_upgrade_client& msg) {
  auto state = get_client_state(store, msg.client_id);
  if (!state) {
    return state.as_failure();
  }
  auto upgraded = apply_upgrade(state.value(), msg.client_state);
  auto consensus = consensus_state_t{
      .root = ibc::schema::make_bytes(kSentinelRoot),
      .timestamp = msg.consensus_state.timestamp,
      .next_validators_hash = msg.consensus_state.next_validators_hash};
  const auto& at = upgraded.latest_height;
  set_client_state(store, msg.client_id, upgraded);
  BOOST_OUTCOME_TRYV(set_consensus_state(store, msg.client_id, at, consensus));
  set_update_metadata(store, msg.client_id, at);
  store.emit(client_event("upgrade_client", msg.client_id, at));
  spdlog::info("Upgraded client {} to chain {} at {}", msg.client_id.value,
               upgraded.chain_id, ibc::core::to_string(at));
  return outcome::success();
}

ibc::common::status_t validate_recover_client(const ibc::host::reader& store,
                                              const msg_recover_client& msg) {
  if (msg.subject_client_id == msg.substitute_client_id) {
    return make_error(error_code::invalid_recovery,
                      "subject and substitute must differ");
  }
  auto subject = get_client_state(store, msg.subject_client_id);
  if (!subject) {
    return subject.as_failure();
  }
  auto substitute = get_client_state(store, msg.substitute_client_id);
  if (!substitute) {
    return substitute.as_failure();
  }
  if (!(subject.value().latest_height < substitute.value().latest_height)) {
    return make_error(
        error_code::invalid_recovery,
        fmt::format("subject height {} must be below substitute height {}",
                    ibc::core::to_string(subject.value().latest_height),
                    ibc::core::to_string(substitute.value().latest_height)));
  }
  auto subject_status = status(store, msg.subject_client_id, subject.value());
  if (!subject_status) {
    return subject_status.as_failure();
  }
  auto substitute_status =
      status(store, msg.substitute_client_id, substitute.value());
  if (!substitute_status) {
    return substitute_status.as_failure();
  }
  if (substitute_status.value() != client_status::active) {
    return make_error(error_code::invalid_recovery,
                      fmt::format("substitute client is {}",
                                  to_string(substitute_status.value())));
  }
  const auto& allow = subject.value().allow_update;
  switch (subject_status.value()) {
    case client_status::active:
      return make_error(error_code::invalid_recovery,
                        "subject client is active");
    case client_status::frozen:
      if (!allow.after_misbehaviour) {
        return make_error(error_code::update_not_allowed,
                          "subject does not allow recovery after "
                          "misbehaviour");
      }
      break;
    case client_status::expired:
      if (!allow.after_expiry) {
        return make_error(error_code::update_not_allowed,
                          "subject does not allow recovery after expiry");
      }
      break;
  }
  if (recovery_comparable(subject.value()) !=
      recovery_comparable(substitute.value())) {
    return make_error(error_code::invalid_recovery,
                      "substitute parameters differ from the subject");
  }
  return outcome::success();
}

ibc::common::status_t execute_recover_client(ibc::host::writer& store,
                                             const msg_recover_client& msg) {
  auto subject = get_client_state(store, msg.subject_client_id);
  if (!subject) {
    return subject.as_failure();
  }
  auto substitute = get_client_state(store, msg.substitute_client_id);
  if (!substitute) {
    return substitute.as_failure();
  }
  const auto& at = substitute.value().latest_height;
  auto consensus = get_consensus_state(store, msg.substitute_client_id, at);
  if (!consensus) {
    return consensus.as_failure();
  }
  auto recovered = subject.value();
  recovered.chain_id = substitute.value().chain_id;
  recovered.trusting_period = substitute.value().trusting_period;
  recovered.latest_height = at;
  recovered.frozen_height = std::nullopt;
  set_client_state(store, msg.subject_client_id, recovered);
  BOOST_OUTCOME_TRYV(set_consensus_state(store, msg.subject_client_id, at,
                                         consensus.value()));
  set_update_metadata(store, msg.subject_client_id, at);
  store.emit(ibc::core::event_t{
      .type = "recover_client",
      .attributes = {
          {"subject_client_id", msg.subject_client_id.value},
          {"substitute_client_id", msg.substitute_client_id.value},
          {"client_type", std::string{ibc::host::kTendermintClientType}}}});
  spdlog::info("Recovered client {} from {}", msg.subject_client_id.value,
               msg.substitute_client_id.value);
  return outcome::success();
}

}  // namespace ibc::client

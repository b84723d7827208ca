#include <ibc/client/proof.hpp>
#include <ibc/client/status.hpp>
#include <ibc/client/store.hpp>
#include <ibc/commitment/merkle.hpp>
#include <spdlog/fmt/fmt.h>

namespace ibc::client {

namespace {

using ibc::common::error_code;
using ibc::common::make_error;

// Everything both proof directions check before touching the proof itself.
ibc::common::result_t<consensus_state_t> proof_root(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const client_state_t& state,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& prefix) {
  BOOST_OUTCOME_TRYV(require_active(store, client_id, state));
  if (state.latest_height < proof_height) {
    return make_error(
        error_code::invalid_proof_height,
        fmt::format("proof height {} is above client latest height {}",
                    ibc::core::to_string(proof_height),
                    ibc::core::to_string(state.latest_height)));
  }
  auto consensus = get_consensus_state(store, client_id, proof_height);
  if (!consensus) {
    return consensus.as_failure();
  }
  if (prefix.empty()) {
    return make_error(error_code::empty_prefix,
                      "commitment prefix cannot be empty");
  }
  return consensus;
}

}  // namespace

ibc::common::status_t verify_membership(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const client_state_t& state,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& prefix,
    const ibc::schema::bytes_view_t& proof,
    std::string path,
    const ibc::schema::bytes_view_t& value) {
  auto consensus = proof_root(store, client_id, state, proof_height, prefix);
  if (!consensus) {
    return consensus.as_failure();
  }
  auto merkle_proof = ibc::commitment::decode_proof(proof);
  if (!merkle_proof) {
    return merkle_proof.as_failure();
  }
  return ibc::commitment::verify_membership(
      state.proof_specs, consensus.value().root,
      ibc::commitment::apply_prefix(prefix, std::move(path)), value,
      merkle_proof.value());
}

ibc::common::status_t verify_non_membership(
    const ibc::host::reader& store,
    const ibc::host::client_id_t& client_id,
    const client_state_t& state,
    const ibc::core::height_t& proof_height,
    const ibc::schema::bytes_view_t& prefix,
    const ibc::schema::bytes_view_t& proof,
    std::string path) {
  auto consensus = proof_root(store, client_id, state, proof_height, prefix);
  if (!consensus) {
    return consensus.as_failure();
  }
  auto merkle_proof = ibc::commitment::decode_proof(proof);
  if (!merkle_proof) {
    return merkle_proof.as_failure();
  }
  return ibc::commitment::verify_non_membership(
      state.proof_specs, consensus.value().root,
      ibc::commitment::apply_prefix(prefix, std::move(path)),
      merkle_proof.value());
}

ibc::common::error_t as_verification_error(const ibc::common::error_code code,
                                           const ibc::common::error_t& error) {
  if (error.codespace() == "ibc.commitment") {
    return ibc::common::wrap_error(code, error);
  }
  return error;
}

}  // namespace ibc::client

#pragma once

#include <ibc/client/header.hpp>
#include <ibc/client/msgs.hpp>
#include <ibc/commitment/merkle.hpp>
#include <ibc/handler/engine.hpp>
#include <ibc/host/chain_store.hpp>
#include <ibc/storage/memory/storage.hpp>
#include <ibc/testing/signer.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace ibc::testing {

using memory_chain_t = ibc::host::chain_store<ibc::storage::memory_storage_tag>;
using memory_engine_t = ibc::handler::engine<ibc::storage::memory_storage_tag>;

/// Wall clock shared by every chain of a test, in milliseconds.
struct mock_clock final {
  uint64_t now_ms{1'700'000'000'000ull};
};

inline constexpr auto kBlockTimeMs = uint64_t{5000};
inline constexpr auto kTrustingPeriod = ibc::core::seconds(14 * 24 * 3600);
inline constexpr auto kMaxClockDrift = ibc::core::seconds(3600);

/// In-memory host chain with its own validator set. Messages go into the
/// open block; `commit()` seals it and opens the next one, so the last
/// committed height is always one below `store().host_height()`.
class mock_chain final {
 public:
  mock_chain(std::string chain_id,
             mock_clock& clock,
             const std::size_t validator_count = 4)
      : clock_{clock},
        store_{ibc::storage::make_storage<ibc::storage::memory_storage_tag>(""),
               ibc::host::make_chain_info(std::move(chain_id))},
        engine_{store_, modules_} {
    for (std::size_t i = 0; i < validator_count; ++i) {
      signers_.emplace_back();
      auto key = ibc::schema::public_key_t{signers_.back().public_key()};
      validators_.validators.push_back(
          ibc::client::validator_t{.address = ibc::client::derive_address(key),
                                   .public_key = key,
                                   .voting_power = 10});
    }
    open_block(1);
  }

  const std::string& chain_id() const { return store_.chain_info().chain_id; }
  uint64_t revision() const { return store_.host_height().revision_number; }

  memory_chain_t& store() { return store_; }
  const memory_chain_t& store() const { return store_; }
  memory_engine_t& engine() { return engine_; }
  ibc::router::router& modules() { return modules_; }
  const ibc::client::validator_set_t& validators() const { return validators_; }

  uint64_t committed_height() const {
    return store_.host_height().revision_height - 1;
  }

  ibc::core::height_t height(const uint64_t revision_height) const {
    return ibc::core::height_t{.revision_number = revision(),
                               .revision_height = revision_height};
  }

  ibc::core::height_t latest_height() const {
    return height(committed_height());
  }

  ibc::common::result_t<ibc::handler::events_t> dispatch(
      const ibc::handler::message_t& message) {
    return engine_.dispatch(message);
  }

  /// Seal the open block and open the next one at the current clock.
  ibc::schema::bytes_t commit() {
    auto root = engine_.commit();
    if (!root) {
      throw std::runtime_error{ibc::common::describe(root.error())};
    }
    clock_.now_ms += kBlockTimeMs;
    open_block(store_.host_height().revision_height + 1);
    return root.value();
  }

  /// Commit `count` empty blocks.
  void advance(const std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) {
      commit();
    }
  }

  ibc::host::host_block_t block(const uint64_t revision_height) const {
    auto block = store_.host_block(revision_height);
    if (!block || !block.value()) {
      throw std::runtime_error{"no committed block at that height"};
    }
    return *block.value();
  }

  /// Signed header of committed block `at`, trusting `trusted`.
  ibc::client::header_t header(const uint64_t at,
                               const ibc::core::height_t& trusted) const {
    auto committed = block(at);
    auto header = ibc::client::block_header_t{
        .chain_id = chain_id(),
        .height = height(at),
        .time = committed.timestamp,
        .validators_hash = ibc::client::hash(validators_),
        .next_validators_hash = committed.next_validators_hash,
        .app_hash = committed.app_hash};
    return ibc::client::header_t{
        .signed_header = sign(header),
        .validator_set = validators_,
        .trusted_height = trusted,
        .trusted_next_validator_set = validators_};
  }

  /// Commit over `header` signed by every validator.
  ibc::client::signed_header_t sign(
      const ibc::client::block_header_t& header) const {
    auto commit = ibc::client::commit_t{.height = header.height,
                                        .round = 0,
                                        .block_hash = ibc::client::hash(header),
                                        .signatures = {}};
    for (std::size_t i = 0; i < signers_.size(); ++i) {
      auto signature = ibc::client::commit_sig_t{
          .flag = ibc::client::block_id_flag::commit,
          .validator_address = validators_.validators[i].address,
          .timestamp = header.time,
          .signature = {}};
      signature.signature = signers_[i].sign(
          ibc::client::vote_sign_bytes(header.chain_id, commit, signature));
      commit.signatures.push_back(std::move(signature));
    }
    return ibc::client::signed_header_t{.header = header,
                                        .commit = std::move(commit)};
  }

  /// Light client of this chain as a counterparty would create it.
  ibc::client::client_state_t client_state(const uint64_t at) const {
    const auto& info = store_.chain_info();
    return ibc::client::client_state_t{
        .chain_id = chain_id(),
        .trust_level = {1, 3},
        .trusting_period = kTrustingPeriod,
        .unbonding_period = info.unbonding_period,
        .max_clock_drift = kMaxClockDrift,
        .latest_height = height(at),
        .frozen_height = std::nullopt,
        .proof_specs = info.proof_specs,
        .upgrade_path = info.upgrade_path,
        .allow_update = {}};
  }

  ibc::client::consensus_state_t consensus_state(const uint64_t at) const {
    auto committed = block(at);
    return ibc::client::consensus_state_t{
        .root = committed.app_hash,
        .timestamp = committed.timestamp,
        .next_validators_hash = committed.next_validators_hash};
  }

  ibc::client::msg_create_client create_client_msg() const {
    return ibc::client::msg_create_client{
        .client_state = client_state(committed_height()),
        .consensus_state = consensus_state(committed_height())};
  }

  /// Encoded proof of `path` in the ibc store at the last committed height.
  ibc::schema::bytes_t prove(const std::string& path) const {
    return prove_in(ibc::host::kIbcStore, path);
  }

  ibc::schema::bytes_t prove_in(const std::string_view store,
                                const std::string& path) const {
    auto proof = store_.prove(store, path);
    if (!proof) {
      throw std::runtime_error{ibc::common::describe(proof.error())};
    }
    return ibc::commitment::encode_proof(proof.value());
  }

 private:
  void open_block(const uint64_t revision_height) {
    engine_.begin_block(revision_height,
                        ibc::core::from_milliseconds(clock_.now_ms),
                        ibc::client::hash(validators_));
  }

  mock_clock& clock_;
  ibc::router::router modules_;
  memory_chain_t store_;
  memory_engine_t engine_;
  std::vector<ed25519_signer> signers_;
  ibc::client::validator_set_t validators_;
};

}  // namespace ibc::testing

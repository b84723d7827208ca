#include <ibc/client/client_state.hpp>
#include <ibc/client/consensus_state.hpp>
#include <ibc/commitment/merkle.hpp>
#include <ibc/host/context.hpp>
#include <spdlog/fmt/fmt.h>

namespace ibc::client {

namespace {

using ibc::common::error_code;
using ibc::common::make_error;

inline constexpr auto kMinChainIdLength = size_t{3};
inline constexpr auto kMaxChainIdLength = size_t{50};

}  // namespace

ibc::common::status_t validate_trust_level(const trust_level_t& level) {
  if (level.denominator == 0 || level.numerator == 0 ||
      level.numerator > level.denominator ||
      level.numerator * 3 < level.denominator) {
    return make_error(error_code::invalid_trust_level,
                      fmt::format("trust level {}/{} is outside [1/3, 1]",
                                  level.numerator, level.denominator));
  }
  return outcome::success();
}

ibc::common::status_t validate(const client_state_t& state) {
  if (state.chain_id.size() < kMinChainIdLength ||
      state.chain_id.size() > kMaxChainIdLength) {
    return make_error(error_code::invalid_client_state,
                      fmt::format("chain id '{}' length must be within "
                                  "[{}, {}]",
                                  state.chain_id, kMinChainIdLength,
                                  kMaxChainIdLength));
  }
  BOOST_OUTCOME_TRYV(validate_trust_level(state.trust_level));
  if (state.trusting_period == 0) {
    return make_error(error_code::invalid_client_state,
                      "trusting period must be positive");
  }
  if (state.unbonding_period == 0) {
    return make_error(error_code::invalid_client_state,
                      "unbonding period must be positive");
  }
  if (state.max_clock_drift == 0) {
    return make_error(error_code::invalid_client_state,
                      "max clock drift must be positive");
  }
  if (state.trusting_period >= state.unbonding_period) {
    return make_error(
        error_code::invalid_client_state,
        fmt::format("trusting period {}ns must be below unbonding period {}ns",
                    state.trusting_period, state.unbonding_period));
  }
  if (state.latest_height.revision_height == 0) {
    return make_error(error_code::invalid_height,
                      "latest height must have a positive revision height");
  }
  auto revision = ibc::host::parse_chain_revision(state.chain_id);
  if (state.latest_height.revision_number != revision) {
    return make_error(error_code::revision_mismatch,
                      fmt::format("latest height {} does not match revision "
                                  "{} of chain {}",
                                  ibc::core::to_string(state.latest_height),
                                  revision, state.chain_id));
  }
  auto specs = ibc::commitment::validate_proof_specs(state.proof_specs);
  if (!specs) {
    return ibc::common::wrap_error(error_code::invalid_client_state,
                                   specs.error());
  }
  for (const auto& key : state.upgrade_path) {
    if (key.empty()) {
      return make_error(error_code::invalid_client_state,
                        "upgrade path keys cannot be empty");
    }
  }
  return outcome::success();
}

bool is_frozen(const client_state_t& state) {
  return state.frozen_height.has_value();
}

client_state_t zero_custom_fields(const client_state_t& state) {
  return client_state_t{.chain_id = state.chain_id,
                        .trust_level = trust_level_t{0, 0},
                        .trusting_period = 0,
                        .unbonding_period = state.unbonding_period,
                        .max_clock_drift = 0,
                        .latest_height = state.latest_height,
                        .frozen_height = std::nullopt,
                        .proof_specs = state.proof_specs,
                        .upgrade_path = state.upgrade_path,
                        .allow_update = allow_update_t{}};
}

ibc::common::status_t validate(const consensus_state_t& state) {
  if (state.root.empty()) {
    return make_error(error_code::invalid_consensus_state,
                      "root cannot be empty");
  }
  if (!ibc::core::is_set(state.timestamp)) {
    return make_error(error_code::invalid_consensus_state,
                      "timestamp must be set");
  }
  return outcome::success();
}

}  // namespace ibc::client

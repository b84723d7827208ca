#include <ibc/commitment/merkle.hpp>
#include <ibc/commitment/verify.hpp>
#include <ibc/schema/encoding/scale/encoder.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace ibc::commitment {

namespace {

using ibc::common::error_code;
using ibc::common::make_error;
using ibc::common::status_t;
using ibc::schema::bytes_t;
using ibc::schema::bytes_view_t;

status_t check_shape(const std::vector<ics23::proof_spec_t>& specs,
                     const bytes_view_t& root,
                     const merkle_path_t& path,
                     const merkle_proof_t& proof) {
  if (proof.proofs.empty()) {
    return make_error(error_code::empty_proof, "merkle proof is empty");
  }
  if (root.empty()) {
    return make_error(error_code::empty_root, "commitment root is empty");
  }
  if (specs.size() != proof.proofs.size() ||
      path.key_path.size() != proof.proofs.size()) {
    return make_error(
        error_code::mismatched_number_of_proofs,
        fmt::format("{} proofs, {} specs, {} path keys", proof.proofs.size(),
                    specs.size(), path.key_path.size()));
  }
  return outcome::success();
}

// Walks proofs[start..] upwards, each layer proving the previous subroot
// under the next key, and finally compares against `root`.
status_t verify_chained(const std::vector<ics23::proof_spec_t>& specs,
                        const bytes_view_t& root,
                        const merkle_path_t& path,
                        bytes_t value,
                        const merkle_proof_t& proof,
                        const size_t start) {
  const auto depth = proof.proofs.size();
  for (auto i = start; i < depth; ++i) {
    auto subroot = ics23::calculate_root(proof.proofs[i]);
    if (!subroot) {
      return subroot.as_failure();
    }
    const auto& key = path.key_path[depth - 1 - i];
    auto verified = ics23::verify_membership(
        proof.proofs[i], specs[i], subroot.value(),
        ibc::schema::make_bytes_view(key), value);
    if (!verified) {
      return make_error(error_code::membership_verification_failed,
                        fmt::format("layer {} key {}: {}", i, key,
                                    verified.error().log));
    }
    value = std::move(subroot.value());
  }
  if (!std::equal(std::begin(value), std::end(value), std::begin(root),
                  std::end(root))) {
    return make_error(error_code::membership_verification_failed,
                      fmt::format("calculated root {} does not match {}",
                                  ibc::schema::to_hex(value),
                                  ibc::schema::to_hex(root)));
  }
  return outcome::success();
}

}  // namespace

merkle_path_t apply_prefix(const bytes_view_t& prefix, std::string path) {
  return merkle_path_t{
      .key_path = {ibc::schema::make_string(prefix), std::move(path)}};
}

status_t validate_proof_specs(const std::vector<ics23::proof_spec_t>& specs) {
  if (specs.empty()) {
    return make_error(error_code::invalid_proof_spec, "no proof specs");
  }
  for (const auto& spec : specs) {
    BOOST_OUTCOME_TRYV(ics23::validate_spec(spec));
  }
  return outcome::success();
}

status_t verify_membership(const std::vector<ics23::proof_spec_t>& specs,
                           const bytes_view_t& root,
                           const merkle_path_t& path,
                           const bytes_view_t& value,
                           const merkle_proof_t& proof) {
  BOOST_OUTCOME_TRYV(check_shape(specs, root, path, proof));
  if (value.empty()) {
    return make_error(error_code::empty_value, "proven value is empty");
  }
  return verify_chained(specs, root, path, ibc::schema::make_bytes(value),
                        proof, 0);
}

status_t verify_non_membership(const std::vector<ics23::proof_spec_t>& specs,
                               const bytes_view_t& root,
                               const merkle_path_t& path,
                               const merkle_proof_t& proof) {
  BOOST_OUTCOME_TRYV(check_shape(specs, root, path, proof));
  const auto& innermost = proof.proofs.front();
  if (!std::holds_alternative<ics23::non_existence_proof_t>(innermost)) {
    return make_error(error_code::invalid_merkle_proof,
                      "innermost proof must be a non-existence proof");
  }
  auto subroot = ics23::calculate_root(innermost);
  if (!subroot) {
    return subroot.as_failure();
  }
  const auto& key = path.key_path.back();
  auto absent = ics23::verify_non_membership(
      innermost, specs.front(), subroot.value(),
      ibc::schema::make_bytes_view(key));
  if (!absent) {
    return make_error(error_code::non_membership_verification_failed,
                      fmt::format("key {}: {}", key, absent.error().log));
  }
  auto chained =
      verify_chained(specs, root, path, std::move(subroot.value()), proof, 1);
  if (!chained) {
    return ibc::common::wrap_error(
        error_code::non_membership_verification_failed, chained.error());
  }
  return outcome::success();
}

ibc::common::result_t<merkle_proof_t> decode_proof(const bytes_view_t& bytes) {
  if (bytes.empty()) {
    return make_error(error_code::empty_proof, "proof bytes are empty");
  }
  return ibc::schema::encoding::decode_input<merkle_proof_t>(bytes,
                                                             "merkle proof");
}

bytes_t encode_proof(const merkle_proof_t& proof) {
  auto encoder = ibc::schema::encoding::scale_encoder_t{};
  return encoder.encode(proof);
}

}  // namespace ibc::commitment

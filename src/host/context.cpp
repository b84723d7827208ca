#include <ibc/commitment/ics23.hpp>
#include <ibc/core/timestamp.hpp>
#include <ibc/host/context.hpp>

#include <charconv>

namespace ibc::host {

uint64_t parse_chain_revision(const std::string_view chain_id) {
  auto dash = chain_id.rfind('-');
  if (dash == std::string_view::npos || dash + 1 >= chain_id.size()) {
    return 0;
  }
  auto digits = chain_id.substr(dash + 1);
  if (digits.size() > 1 && digits.front() == '0') {
    return 0;
  }
  auto revision = uint64_t{0};
  auto [ptr, ec] = std::from_chars(digits.data(),
                                   digits.data() + digits.size(), revision);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return 0;
  }
  return revision;
}

chain_info_t make_chain_info(std::string chain_id) {
  return chain_info_t{
      .chain_id = std::move(chain_id),
      .commitment_prefix = {'i', 'b', 'c'},
      .proof_specs = {ibc::commitment::ics23::tendermint_spec(),
                      ibc::commitment::ics23::tendermint_spec()},
      .unbonding_period = ibc::core::seconds(21 * 24 * 3600),
      .upgrade_path = {"upgrade", "upgradedIBCState"},
      .max_expected_time_per_block = ibc::core::seconds(30),
      .versions = ibc::connection::compatible_versions()};
}

}  // namespace ibc::host

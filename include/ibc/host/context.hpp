#pragma once

#include <ibc/commitment/ics23.hpp>
#include <ibc/common/error.hpp>
#include <ibc/connection/version.hpp>
#include <ibc/core/event.hpp>
#include <ibc/core/height.hpp>
#include <ibc/core/timestamp.hpp>
#include <ibc/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ibc::host {

/// Parameters of the host chain itself. Counterparties hold a light client of
/// this chain and `conn_open_try`/`conn_open_ack` check that client against
/// these values.
struct chain_info_t final {
  std::string chain_id;
  ibc::schema::bytes_t commitment_prefix{'i', 'b', 'c'};
  std::vector<ibc::commitment::ics23::proof_spec_t> proof_specs;
  ibc::schema::duration_nanoseconds_t unbonding_period{};
  std::vector<std::string> upgrade_path{"upgrade", "upgradedIBCState"};
  ibc::schema::duration_nanoseconds_t max_expected_time_per_block{};
  std::vector<ibc::connection::version_t> versions;
};

/// Committed header data of one host block. Its app hash is the root the
/// counterparty stores in its consensus state for this chain.
struct host_block_t final {
  uint64_t height{};
  ibc::core::timestamp_t timestamp;
  ibc::schema::bytes_t app_hash;
  ibc::schema::hash32_t next_validators_hash{};

  bool operator==(const host_block_t&) const = default;
};

/// Read access to the provable store and to host block data.
class reader {
 public:
  virtual ~reader() = default;

  virtual ibc::common::result_t<std::optional<ibc::schema::bytes_t>> get(
      std::string_view path) const = 0;

  virtual ibc::core::height_t host_height() const = 0;
  virtual ibc::core::timestamp_t host_timestamp() const = 0;

  virtual const chain_info_t& chain_info() const = 0;

  /// Committed block record at `height` of the current revision.
  virtual ibc::common::result_t<std::optional<host_block_t>> host_block(
      uint64_t height) const = 0;
};

class writer : public reader {
 public:
  virtual void set(std::string path, ibc::schema::bytes_t value) = 0;
  virtual void remove(std::string path) = 0;
  virtual void emit(ibc::core::event_t event) = 0;
};

/// Revision number encoded in a chain id of the form `{name}-{revision}`,
/// zero when the chain id carries none.
uint64_t parse_chain_revision(std::string_view chain_id);

/// Default parameters for a chain committing with the simple Merkle tree.
chain_info_t make_chain_info(std::string chain_id);

}  // namespace ibc::host

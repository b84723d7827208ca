#include <blake3.h>
#include <ibc/blake3/hash.hpp>

namespace ibc::blake3 {

ibc::schema::hash32_t hash(const ibc::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = ibc::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<ibc::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace ibc::blake3

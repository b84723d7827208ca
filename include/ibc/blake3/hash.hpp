#pragma once
#include <ibc/schema/primitives.hpp>

namespace ibc::blake3 {

ibc::schema::hash32_t hash(const ibc::schema::bytes_view_t& bytes);

}  // namespace ibc::blake3

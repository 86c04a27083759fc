/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/int_serialization.hpp"

#include <boost/endian/conversion.hpp>

namespace tessera::common {

  std::array<uint8_t, 8> uint64_to_le_bytes(uint64_t number) {
    std::array<uint8_t, 8> result{};
    boost::endian::store_little_u64(result.data(), number);
    return result;
  }

  std::array<uint8_t, 16> uint128_to_le_bytes(const uint128_t &i) {
    std::array<uint8_t, 16> res{};
    export_bits(i, res.begin(), 8, false);
    return res;
  }

  uint256_t be_bytes_to_uint256(std::span<const uint8_t, 32> bytes) {
    uint256_t result;
    import_bits(result, bytes.begin(), bytes.end(), 8, true);
    return result;
  }

}  // namespace tessera::common

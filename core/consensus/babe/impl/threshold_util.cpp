/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/threshold_util.hpp"

#include <cmath>

#include <boost/assert.hpp>
#include <boost/range/adaptors.hpp>
#include <boost/range/numeric.hpp>

namespace tessera::consensus::babe {

  Threshold calculateThreshold(const std::pair<uint64_t, uint64_t> &ratio,
                               const primitives::AuthorityList &authorities,
                               primitives::AuthorityIndex authority_index) {
    BOOST_ASSERT(authority_index < authorities.size());
    BOOST_ASSERT(ratio.second != 0);

    double float_point_ratio = double(ratio.first) / ratio.second;

    using boost::adaptors::transformed;
    auto total_weight =
        boost::accumulate(authorities | transformed([](const auto &authority) {
                            return double(authority.weight);
                          }),
                          0.);
    if (total_weight == 0.) {
      return Threshold{0};
    }
    double theta = double(authorities[authority_index].weight) / total_weight;

    using namespace boost::multiprecision;  // NOLINT
    cpp_rational p_rat(1. - std::pow(1. - float_point_ratio, theta));

    static const auto a = (uint256_t{1} << 128);
    static const auto max = uint256_t{std::numeric_limits<Threshold>::max()};
    uint256_t scaled = a * numerator(p_rat) / denominator(p_rat);
    // p == 1 (c == 1) lands exactly on 2^128
    return Threshold{std::min(scaled, max)};
  }

}  // namespace tessera::consensus::babe

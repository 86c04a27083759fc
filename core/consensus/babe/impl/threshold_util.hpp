/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/timeline/types.hpp"
#include "primitives/authority.hpp"

namespace tessera::consensus::babe {

  /// Calculates the primary selection threshold for a given authority, taking
  /// into account `c` (`1 - c` represents the probability of a slot being
  /// empty): p = 1 - (1 - c)^theta, where theta is the authority's share of
  /// the total weight. The result is p scaled to 2^128 and saturated.
  Threshold calculateThreshold(const std::pair<uint64_t, uint64_t> &ratio,
                               const primitives::AuthorityList &authorities,
                               primitives::AuthorityIndex authority_index);

}  // namespace tessera::consensus::babe

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <initializer_list>

#include "common/blob.hpp"

namespace testutil {
  /**
   * @brief creates hash from initializers list
   * @param bytes initializers
   * @return newly created hash
   */
  inline tessera::common::Hash256 createHash256(
      std::initializer_list<uint8_t> bytes) {
    tessera::common::Hash256 h;
    h.fill(0u);
    std::copy_n(bytes.begin(), bytes.size(), h.begin());
    return h;
  }

}  // namespace testutil

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"

namespace tessera::crypto {

  /**
   * Hasher backed by OpenSSL digests
   */
  class HasherImpl : public Hasher {
   public:
    ~HasherImpl() override = default;

    Hash256 blake2s_256(common::BufferView data) const override;

    Hash256 sha2_256(common::BufferView data) const override;
  };

}  // namespace tessera::crypto

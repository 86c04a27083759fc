/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "common/buffer.hpp"
#include "crypto/sr25519_types.hpp"

namespace tessera::crypto {

  /**
   * SR25519 based verifiable random function implementation
   */
  class VRFProvider {
   public:
    virtual ~VRFProvider() = default;

    /**
     * Generates random keypair for signing the message
     */
    virtual Sr25519Keypair generateKeypair() const = 0;

    /**
     * Sign message \param msg using \param keypair. If computed value is less
     * than \param threshold then return optional containing this value and
     * proof. Otherwise none returned
     */
    virtual std::optional<VRFOutput> sign(
        const common::Buffer &msg,
        const Sr25519Keypair &keypair,
        const VRFThreshold &threshold) const = 0;

    /**
     * Verifies that \param output was derived using \param public_key on \param
     * msg and tells whether it is below \param threshold
     */
    virtual VRFVerifyOutput verify(const common::Buffer &msg,
                                   const VRFOutput &output,
                                   const Sr25519PublicKey &public_key,
                                   const VRFThreshold &threshold) const = 0;
  };

}  // namespace tessera::crypto

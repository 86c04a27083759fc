/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "crypto/sr25519_types.hpp"

namespace tessera::crypto {

  /**
   * sr25519 provider error codes
   */
  enum class Sr25519ProviderError {
    SIGN_UNKNOWN_ERROR = 1,  // unknown error occured during call to `sign`
                             // method of bound function
    VERIFY_UNKNOWN_ERROR     // unknown error occured during call to `verify`
                             // method of bound function
  };

  class Sr25519Provider {
   public:
    virtual ~Sr25519Provider() = default;

    /**
     * Derive keypair from seed
     */
    virtual Sr25519Keypair generateKeypair(const Sr25519Seed &seed) const = 0;

    /**
     * Sign message \param message using \param keypair
     * @return signature
     */
    virtual outcome::result<Sr25519Signature> sign(
        const Sr25519Keypair &keypair, common::BufferView message) const = 0;

    /**
     * Verifies that \param message was signed by the owner of \param
     * public_key
     */
    virtual outcome::result<bool> verify(
        const Sr25519Signature &signature,
        common::BufferView message,
        const Sr25519PublicKey &public_key) const = 0;
  };

}  // namespace tessera::crypto

OUTCOME_HPP_DECLARE_ERROR(tessera::crypto, Sr25519ProviderError)

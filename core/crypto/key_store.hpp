/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "common/buffer.hpp"
#include "crypto/sr25519_types.hpp"

namespace tessera::crypto {

  enum class KeyStoreError {
    KEY_NOT_AVAILABLE = 1,
    SIGNING_FAILED,
  };

  /**
   * Custody of the local authority keys. Consensus code only refers to keys
   * by their public part and never sees secrets.
   */
  class KeyStore {
   public:
    virtual ~KeyStore() = default;

    virtual bool hasKey(const Sr25519PublicKey &key) const = 0;

    virtual std::vector<Sr25519PublicKey> publicKeys() const = 0;

    /**
     * Signs \param message with the secret matching \param key
     * @return signature or KEY_NOT_AVAILABLE
     */
    virtual outcome::result<Sr25519Signature> sign(
        const Sr25519PublicKey &key, common::BufferView message) const = 0;

    /**
     * Evaluates VRF of \param message with the secret matching \param key
     * @return output and proof if the output is below \param threshold,
     * none otherwise; KEY_NOT_AVAILABLE if the key is not held
     */
    virtual outcome::result<std::optional<VRFOutput>> vrfSign(
        const Sr25519PublicKey &key,
        const common::Buffer &message,
        const VRFThreshold &threshold) const = 0;
  };

}  // namespace tessera::crypto

OUTCOME_HPP_DECLARE_ERROR(tessera::crypto, KeyStoreError);

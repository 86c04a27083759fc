/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/key_store.hpp"

#include <mutex>
#include <unordered_map>

#include "crypto/sr25519_provider.hpp"
#include "crypto/vrf_provider.hpp"
#include "log/logger.hpp"

namespace tessera::crypto {

  /**
   * In-memory sr25519 key store
   */
  class KeyStoreImpl : public KeyStore {
   public:
    KeyStoreImpl(std::shared_ptr<Sr25519Provider> sr25519_provider,
                 std::shared_ptr<VRFProvider> vrf_provider);

    /// Derives a keypair from \param seed and keeps it
    Sr25519PublicKey insertKey(const Sr25519Seed &seed);

    /// Generates a fresh random keypair and keeps it
    Sr25519PublicKey generateKey();

    bool hasKey(const Sr25519PublicKey &key) const override;

    std::vector<Sr25519PublicKey> publicKeys() const override;

    outcome::result<Sr25519Signature> sign(
        const Sr25519PublicKey &key, common::BufferView message) const override;

    outcome::result<std::optional<VRFOutput>> vrfSign(
        const Sr25519PublicKey &key,
        const common::Buffer &message,
        const VRFThreshold &threshold) const override;

   private:
    std::optional<Sr25519Keypair> findKeypair(
        const Sr25519PublicKey &key) const;

    void insert(Sr25519Keypair keypair);

    std::shared_ptr<Sr25519Provider> sr25519_provider_;
    std::shared_ptr<VRFProvider> vrf_provider_;

    mutable std::mutex mutex_;
    std::unordered_map<Sr25519PublicKey, Sr25519Keypair> keys_;

    log::Logger logger_;
  };

}  // namespace tessera::crypto

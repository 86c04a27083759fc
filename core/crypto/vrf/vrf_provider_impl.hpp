/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/vrf_provider.hpp"

#include "crypto/random_generator.hpp"

namespace tessera::crypto {

  class VRFProviderImpl : public VRFProvider {
   public:
    explicit VRFProviderImpl(std::shared_ptr<CSPRNG> generator);

    ~VRFProviderImpl() override = default;

    Sr25519Keypair generateKeypair() const override;

    std::optional<VRFOutput> sign(const common::Buffer &msg,
                                  const Sr25519Keypair &keypair,
                                  const VRFThreshold &threshold) const override;

    VRFVerifyOutput verify(const common::Buffer &msg,
                           const VRFOutput &output,
                           const Sr25519PublicKey &public_key,
                           const VRFThreshold &threshold) const override;

   private:
    std::shared_ptr<CSPRNG> generator_;
  };

}  // namespace tessera::crypto

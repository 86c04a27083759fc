/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/babe_lottery.hpp"

#include "log/logger.hpp"

namespace tessera::crypto {
  class Hasher;
  class KeyStore;
  class VRFProvider;
}  // namespace tessera::crypto

namespace tessera::consensus::babe {

  class BabeLotteryImpl : public BabeLottery {
   public:
    BabeLotteryImpl(std::shared_ptr<crypto::KeyStore> key_store,
                    std::shared_ptr<crypto::VRFProvider> vrf_provider,
                    std::shared_ptr<crypto::Hasher> hasher);

    outcome::result<crypto::VRFOutput> compute(
        const primitives::AuthorityId &key,
        const Randomness &randomness,
        EpochNumber epoch,
        SlotNumber slot) const override;

    bool verify(const primitives::AuthorityId &public_key,
                const Randomness &randomness,
                EpochNumber epoch,
                SlotNumber slot,
                const crypto::VRFOutput &output) const override;

    crypto::VRFVerifyOutput checkPrimary(
        const primitives::AuthorityId &public_key,
        const Randomness &randomness,
        EpochNumber epoch,
        SlotNumber slot,
        const crypto::VRFOutput &output,
        const Threshold &threshold) const override;

    Threshold threshold(
        const Epoch &epoch,
        primitives::AuthorityIndex authority_index) const override;

    primitives::AuthorityIndex secondarySlotAuthor(
        SlotNumber slot,
        size_t authorities_count,
        const Randomness &randomness) const override;

    outcome::result<std::optional<SlotClaim>> getSlotLeadership(
        const Epoch &epoch,
        SlotNumber slot,
        primitives::AuthorityIndex authority_index) const override;

   private:
    log::Logger logger_;
    std::shared_ptr<crypto::KeyStore> key_store_;
    std::shared_ptr<crypto::VRFProvider> vrf_provider_;
    std::shared_ptr<crypto::Hasher> hasher_;
  };

}  // namespace tessera::consensus::babe

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/babe_block_validator.hpp"

#include "log/logger.hpp"

namespace tessera::crypto {
  class Hasher;
  class Sr25519Provider;
}  // namespace tessera::crypto

namespace tessera::consensus::babe {
  class BabeLottery;
  class EpochTracker;
  struct Seal;
}  // namespace tessera::consensus::babe

namespace tessera::consensus::babe {

  class BabeBlockValidatorImpl : public BabeBlockValidator {
   public:
    BabeBlockValidatorImpl(
        std::shared_ptr<EpochTracker> epoch_tracker,
        std::shared_ptr<BabeLottery> lottery,
        std::shared_ptr<crypto::Hasher> hasher,
        std::shared_ptr<crypto::Sr25519Provider> sr25519_provider);

    outcome::result<VerifiedSeal> validateHeader(
        const primitives::BlockHeader &header,
        const primitives::BlockHeader &parent_header) const override;

   private:
    /// Checks VRF of the claim and its eligibility
    outcome::result<void> verifyClaim(const primitives::BlockHeader &header,
                                      const BabeBlockHeader &babe_header,
                                      const Epoch &epoch) const;

    bool verifySignature(const primitives::BlockHeader &header,
                         const Seal &seal,
                         const primitives::AuthorityId &public_key) const;

    log::Logger log_;
    std::shared_ptr<EpochTracker> epoch_tracker_;
    std::shared_ptr<BabeLottery> lottery_;
    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<crypto::Sr25519Provider> sr25519_provider_;
  };

}  // namespace tessera::consensus::babe

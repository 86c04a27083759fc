/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/vrf/vrf_provider_impl.hpp"

#include <boost/assert.hpp>

#include "common/int_serialization.hpp"

namespace tessera::crypto {
  namespace vrf_constants = constants::sr25519::vrf;

  namespace {
    void secure_cleanup(uint8_t *ptr, size_t size) {
      volatile auto *p = ptr;
      while (size-- != 0) {
        *p++ = 0;
      }
    }
  }  // namespace

  VRFProviderImpl::VRFProviderImpl(std::shared_ptr<CSPRNG> generator)
      : generator_{std::move(generator)} {
    BOOST_ASSERT(generator_);
  }

  Sr25519Keypair VRFProviderImpl::generateKeypair() const {
    auto seed = generator_->randomBytes(constants::sr25519::SEED_SIZE);

    std::array<uint8_t, constants::sr25519::KEYPAIR_SIZE> kp{};
    sr25519_keypair_from_seed(kp.data(), seed.data());

    Sr25519Keypair keypair;
    std::copy(kp.begin(),
              kp.begin() + constants::sr25519::SECRET_SIZE,
              keypair.secret_key.begin());
    std::copy(kp.begin() + constants::sr25519::SECRET_SIZE,
              kp.begin() + constants::sr25519::KEYPAIR_SIZE,
              keypair.public_key.begin());
    secure_cleanup(kp.data(), kp.size());
    secure_cleanup(seed.data(), seed.size());
    return keypair;
  }

  std::optional<VRFOutput> VRFProviderImpl::sign(
      const common::Buffer &msg,
      const Sr25519Keypair &keypair,
      const VRFThreshold &threshold) const {
    std::array<uint8_t, Sr25519SecretKey::size() + Sr25519PublicKey::size()>
        keypair_buf{};
    std::copy(keypair.secret_key.begin(),
              keypair.secret_key.end(),
              keypair_buf.begin());
    std::copy(keypair.public_key.begin(),
              keypair.public_key.end(),
              keypair_buf.begin() + Sr25519SecretKey::size());

    std::array<uint8_t, vrf_constants::OUTPUT_SIZE + vrf_constants::PROOF_SIZE>
        out_proof{};
    auto threshold_bytes = common::uint128_to_le_bytes(threshold);
    auto sign_res = sr25519_vrf_sign_if_less(out_proof.data(),
                                             keypair_buf.data(),
                                             msg.data(),
                                             msg.size(),
                                             threshold_bytes.data());
    secure_cleanup(keypair_buf.data(), keypair_buf.size());
    if (not sign_res.is_less
        or (SR25519_SIGNATURE_RESULT_OK != sign_res.result)) {
      return std::nullopt;
    }

    VRFOutput res;
    std::copy_n(
        out_proof.begin(), vrf_constants::OUTPUT_SIZE, res.output.begin());
    std::copy_n(out_proof.begin() + vrf_constants::OUTPUT_SIZE,
                vrf_constants::PROOF_SIZE,
                res.proof.begin());

    return res;
  }

  VRFVerifyOutput VRFProviderImpl::verify(const common::Buffer &msg,
                                          const VRFOutput &output,
                                          const Sr25519PublicKey &public_key,
                                          const VRFThreshold &threshold) const {
    auto res =
        sr25519_vrf_verify(public_key.data(),
                           msg.data(),
                           msg.size(),
                           output.output.data(),
                           output.proof.data(),
                           common::uint128_to_le_bytes(threshold).data());
    return VRFVerifyOutput{
        .is_valid = res.result == SR25519_SIGNATURE_RESULT_OK,
        .is_less = res.is_less};
  }

}  // namespace tessera::crypto

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

extern "C" {
#include <schnorrkel/schnorrkel.h>
}

#include <boost/multiprecision/cpp_int.hpp>

#include "common/blob.hpp"

namespace tessera::crypto {

  namespace constants::sr25519 {
    /**
     * Important constants to deal with sr25519
     */
    enum {
      KEYPAIR_SIZE = SR25519_KEYPAIR_SIZE,
      SECRET_SIZE = SR25519_SECRET_SIZE,
      PUBLIC_SIZE = SR25519_PUBLIC_SIZE,
      SIGNATURE_SIZE = SR25519_SIGNATURE_SIZE,
      SEED_SIZE = SR25519_SEED_SIZE
    };

    namespace vrf {
      /**
       * Important constants to deal with vrf
       */
      enum {
        PROOF_SIZE = SR25519_VRF_PROOF_SIZE,
        OUTPUT_SIZE = SR25519_VRF_OUTPUT_SIZE
      };
    }  // namespace vrf

  }  // namespace constants::sr25519

  using VRFPreOutput =
      std::array<uint8_t, constants::sr25519::vrf::OUTPUT_SIZE>;
  using VRFThreshold = boost::multiprecision::uint128_t;
  using VRFProof = std::array<uint8_t, constants::sr25519::vrf::PROOF_SIZE>;

  /// Threshold every valid VRF output is below
  inline const VRFThreshold kMaxThreshold =
      std::numeric_limits<VRFThreshold>::max();

  /**
   * Output of a verifiable random function.
   * Consists of pre-output, which is an internal representation of the
   * generated random value, and the proof to this value that servers as the
   * verification of its randomness.
   */
  struct VRFOutput {
    // an internal representation of the generated random value
    VRFPreOutput output{};
    // the proof to the output, serves as the verification of its randomness
    VRFProof proof{};

    bool operator==(const VRFOutput &) const = default;

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const VRFOutput &o) {
      return s << o.output << o.proof;
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, VRFOutput &o) {
      return s >> o.output >> o.proof;
    }
  };

  /**
   * Output of a verifiable random function verification.
   */
  struct VRFVerifyOutput {
    // indicates if the proof is valid
    bool is_valid;
    // indicates if the value is less than the provided threshold
    bool is_less;
  };

}  // namespace tessera::crypto

TESSERA_BLOB_STRICT_TYPEDEF(tessera::crypto,
                            Sr25519SecretKey,
                            constants::sr25519::SECRET_SIZE);
TESSERA_BLOB_STRICT_TYPEDEF(tessera::crypto,
                            Sr25519PublicKey,
                            constants::sr25519::PUBLIC_SIZE);
TESSERA_BLOB_STRICT_TYPEDEF(tessera::crypto,
                            Sr25519Signature,
                            constants::sr25519::SIGNATURE_SIZE);
TESSERA_BLOB_STRICT_TYPEDEF(tessera::crypto,
                            Sr25519Seed,
                            constants::sr25519::SEED_SIZE);

namespace tessera::crypto {

  struct Sr25519Keypair {
    Sr25519SecretKey secret_key;
    Sr25519PublicKey public_key;

    bool operator==(const Sr25519Keypair &other) const = default;
  };

}  // namespace tessera::crypto

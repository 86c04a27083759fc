/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sr25519/sr25519_provider_impl.hpp"

namespace tessera::crypto {

  Sr25519Keypair Sr25519ProviderImpl::generateKeypair(
      const Sr25519Seed &seed) const {
    std::array<uint8_t, constants::sr25519::KEYPAIR_SIZE> kp{};
    sr25519_keypair_from_seed(kp.data(), seed.data());

    Sr25519Keypair keypair;
    std::copy(kp.begin(),
              kp.begin() + constants::sr25519::SECRET_SIZE,
              keypair.secret_key.begin());
    std::copy(kp.begin() + constants::sr25519::SECRET_SIZE,
              kp.begin() + constants::sr25519::SECRET_SIZE
                  + constants::sr25519::PUBLIC_SIZE,
              keypair.public_key.begin());
    std::fill(kp.begin(), kp.end(), 0);
    return keypair;
  }

  outcome::result<Sr25519Signature> Sr25519ProviderImpl::sign(
      const Sr25519Keypair &keypair, common::BufferView message) const {
    Sr25519Signature signature{};
    try {
      sr25519_sign(signature.data(),
                   keypair.public_key.data(),
                   keypair.secret_key.data(),
                   message.data(),
                   message.size());
    } catch (const std::exception &) {
      return Sr25519ProviderError::SIGN_UNKNOWN_ERROR;
    }
    return signature;
  }

  outcome::result<bool> Sr25519ProviderImpl::verify(
      const Sr25519Signature &signature,
      common::BufferView message,
      const Sr25519PublicKey &public_key) const {
    bool result = false;
    try {
      result = sr25519_verify(
          signature.data(), message.data(), message.size(), public_key.data());
    } catch (const std::exception &) {
      return Sr25519ProviderError::VERIFY_UNKNOWN_ERROR;
    }
    return outcome::success(result);
  }

}  // namespace tessera::crypto

OUTCOME_CPP_DEFINE_CATEGORY(tessera::crypto, Sr25519ProviderError, e) {
  using tessera::crypto::Sr25519ProviderError;
  switch (e) {
    case Sr25519ProviderError::SIGN_UNKNOWN_ERROR:
      return "failed to sign message, unknown error occured";
    case Sr25519ProviderError::VERIFY_UNKNOWN_ERROR:
      return "failed to verify message, unknown error occured";
  }
  return "unknown Sr25519ProviderError";
}

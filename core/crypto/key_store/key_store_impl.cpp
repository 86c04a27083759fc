/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/key_store/key_store_impl.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tessera::crypto, KeyStoreError, e) {
  using E = tessera::crypto::KeyStoreError;
  switch (e) {
    case E::KEY_NOT_AVAILABLE:
      return "Key is not available in the key store";
    case E::SIGNING_FAILED:
      return "Signing with a stored key failed";
  }
  return "Unknown KeyStoreError";
}

namespace tessera::crypto {

  KeyStoreImpl::KeyStoreImpl(std::shared_ptr<Sr25519Provider> sr25519_provider,
                             std::shared_ptr<VRFProvider> vrf_provider)
      : sr25519_provider_{std::move(sr25519_provider)},
        vrf_provider_{std::move(vrf_provider)},
        logger_{log::createLogger("KeyStore", "key_store")} {
    BOOST_ASSERT(sr25519_provider_);
    BOOST_ASSERT(vrf_provider_);
  }

  Sr25519PublicKey KeyStoreImpl::insertKey(const Sr25519Seed &seed) {
    auto keypair = sr25519_provider_->generateKeypair(seed);
    auto public_key = keypair.public_key;
    insert(std::move(keypair));
    return public_key;
  }

  Sr25519PublicKey KeyStoreImpl::generateKey() {
    auto keypair = vrf_provider_->generateKeypair();
    auto public_key = keypair.public_key;
    insert(std::move(keypair));
    return public_key;
  }

  void KeyStoreImpl::insert(Sr25519Keypair keypair) {
    std::lock_guard lock{mutex_};
    SL_DEBUG(logger_, "Key {} added", keypair.public_key);
    auto public_key = keypair.public_key;
    keys_.insert_or_assign(public_key, std::move(keypair));
  }

  std::optional<Sr25519Keypair> KeyStoreImpl::findKeypair(
      const Sr25519PublicKey &key) const {
    std::lock_guard lock{mutex_};
    if (auto it = keys_.find(key); it != keys_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  bool KeyStoreImpl::hasKey(const Sr25519PublicKey &key) const {
    std::lock_guard lock{mutex_};
    return keys_.contains(key);
  }

  std::vector<Sr25519PublicKey> KeyStoreImpl::publicKeys() const {
    std::lock_guard lock{mutex_};
    std::vector<Sr25519PublicKey> result;
    result.reserve(keys_.size());
    for (const auto &[public_key, _] : keys_) {
      result.push_back(public_key);
    }
    return result;
  }

  outcome::result<Sr25519Signature> KeyStoreImpl::sign(
      const Sr25519PublicKey &key, common::BufferView message) const {
    auto keypair = findKeypair(key);
    if (not keypair) {
      return KeyStoreError::KEY_NOT_AVAILABLE;
    }
    auto res = sr25519_provider_->sign(*keypair, message);
    if (res.has_error()) {
      SL_WARN(logger_,
              "Can't sign with key {}: {}",
              key,
              res.error().message());
      return KeyStoreError::SIGNING_FAILED;
    }
    return res.value();
  }

  outcome::result<std::optional<VRFOutput>> KeyStoreImpl::vrfSign(
      const Sr25519PublicKey &key,
      const common::Buffer &message,
      const VRFThreshold &threshold) const {
    auto keypair = findKeypair(key);
    if (not keypair) {
      return KeyStoreError::KEY_NOT_AVAILABLE;
    }
    return vrf_provider_->sign(message, *keypair, threshold);
  }

}  // namespace tessera::crypto

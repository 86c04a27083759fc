/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/key_store/key_store_impl.hpp"

#include <gtest/gtest.h>

#include "crypto/random_generator/boost_generator.hpp"
#include "crypto/sr25519/sr25519_provider_impl.hpp"
#include "crypto/vrf/vrf_provider_impl.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace tessera::crypto;
using tessera::common::Buffer;

class KeyStoreTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    seed_.fill(7);
    message_.put("block to be sealed");
  }

  std::shared_ptr<Sr25519ProviderImpl> sr25519_provider_ =
      std::make_shared<Sr25519ProviderImpl>();
  std::shared_ptr<VRFProviderImpl> vrf_provider_ =
      std::make_shared<VRFProviderImpl>(
          std::make_shared<BoostRandomGenerator>());
  KeyStoreImpl key_store_{sr25519_provider_, vrf_provider_};

  Sr25519Seed seed_;
  Buffer message_;
};

/**
 * @given empty key store
 * @when a key is derived from a seed
 * @then the key is held and equal to the one derived by the provider
 */
TEST_F(KeyStoreTest, InsertFromSeed) {
  auto public_key = key_store_.insertKey(seed_);

  EXPECT_EQ(public_key, sr25519_provider_->generateKeypair(seed_).public_key);
  EXPECT_TRUE(key_store_.hasKey(public_key));
  EXPECT_EQ(key_store_.publicKeys(), std::vector<Sr25519PublicKey>{public_key});
}

/**
 * @given key store with a key
 * @when message is signed with it
 * @then signature verifies against the public key
 */
TEST_F(KeyStoreTest, SignVerifies) {
  auto public_key = key_store_.insertKey(seed_);

  EXPECT_OUTCOME_TRUE(signature, key_store_.sign(public_key, message_));
  EXPECT_OUTCOME_TRUE(valid,
                      sr25519_provider_->verify(signature, message_, public_key));
  EXPECT_TRUE(valid);
}

/**
 * @given key store without the requested key
 * @when signing or evaluating VRF with it
 * @then KEY_NOT_AVAILABLE is returned
 */
TEST_F(KeyStoreTest, UnknownKey) {
  auto unknown = sr25519_provider_->generateKeypair(seed_).public_key;
  EXPECT_FALSE(key_store_.hasKey(unknown));

  EXPECT_EC(key_store_.sign(unknown, message_),
            KeyStoreError::KEY_NOT_AVAILABLE);
  EXPECT_EC(key_store_.vrfSign(unknown, message_, kMaxThreshold),
            KeyStoreError::KEY_NOT_AVAILABLE);
}

/**
 * @given key store with a generated key
 * @when VRF is evaluated with maximal and zero thresholds
 * @then output is produced below the maximal threshold only and it verifies
 */
TEST_F(KeyStoreTest, VrfSignRespectsThreshold) {
  auto public_key = key_store_.generateKey();

  EXPECT_OUTCOME_TRUE(output,
                      key_store_.vrfSign(public_key, message_, kMaxThreshold));
  ASSERT_TRUE(output.has_value());
  auto verify_res = vrf_provider_->verify(
      message_, output.value(), public_key, kMaxThreshold);
  EXPECT_TRUE(verify_res.is_valid);
  EXPECT_TRUE(verify_res.is_less);

  EXPECT_OUTCOME_TRUE(nothing,
                      key_store_.vrfSign(public_key, message_, VRFThreshold{0}));
  EXPECT_FALSE(nothing.has_value());
}

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/equivocation_detector_impl.hpp"

#include <limits>

#include <gtest/gtest.h>

#include "crypto/hasher/hasher_impl.hpp"
#include "mock/core/consensus/timeline/slot_clock_mock.hpp"
#include "testutil/consensus/babe_headers.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/primitives/mp_utils.hpp"

using namespace tessera;
using namespace consensus;
using namespace babe;
using primitives::AuthorityId;
using primitives::BlockHeader;
using testing::Invoke;

class EquivocationDetectorTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    author_.fill(1);
    other_author_.fill(2);

    ON_CALL(*slot_clock_, currentSlot())
        .WillByDefault(Invoke([this] { return current_slot_; }));
  }

  /// Distinct headers in the same slot differ by parent
  BlockHeader header(SlotNumber slot, uint8_t parent_byte) const {
    return testutil::makeBabeHeader(*hasher_,
                                    5,
                                    testutil::createHash256({parent_byte}),
                                    testutil::secondaryPlain(slot, 0));
  }

  std::shared_ptr<crypto::HasherImpl> hasher_ =
      std::make_shared<crypto::HasherImpl>();
  std::shared_ptr<testing::NiceMock<SlotClockMock>> slot_clock_ =
      std::make_shared<testing::NiceMock<SlotClockMock>>();
  EquivocationDetectorImpl detector_{hasher_, slot_clock_, 5};

  SlotNumber current_slot_ = 42;

  AuthorityId author_;
  AuthorityId other_author_;
};

/**
 * @given header observed for an authority and a slot
 * @when a different header of the same authority and slot is observed
 * @then proof with both headers is returned
 */
TEST_F(EquivocationDetectorTest, TwoHeadersInSlot) {
  auto first = header(42, 1);
  auto second = header(42, 2);

  EXPECT_FALSE(detector_.observe(author_, 42, first).has_value());
  auto proof = detector_.observe(author_, 42, second);

  ASSERT_TRUE(proof.has_value());
  EXPECT_EQ(proof->offender, author_);
  EXPECT_EQ(proof->slot, 42u);
  EXPECT_EQ(proof->first_header, first);
  EXPECT_EQ(proof->second_header, second);
}

/**
 * @given header already observed
 * @when it is observed again, also without precomputed hash
 * @then no proof is returned
 */
TEST_F(EquivocationDetectorTest, SameHeaderRepeated) {
  auto first = header(42, 1);
  EXPECT_FALSE(detector_.observe(author_, 42, first).has_value());
  EXPECT_FALSE(detector_.observe(author_, 42, first).has_value());

  auto no_hash = first;
  no_hash.hash_opt.reset();
  EXPECT_FALSE(detector_.observe(author_, 42, no_hash).has_value());
}

/**
 * @given equivocation already reported for a slot
 * @when a third distinct header is observed, and the second one again
 * @then the third one is reported against the first, the repeat is not
 */
TEST_F(EquivocationDetectorTest, ThirdHeader) {
  auto first = header(42, 1);
  auto second = header(42, 2);
  auto third = header(42, 3);
  detector_.observe(author_, 42, first);
  ASSERT_TRUE(detector_.observe(author_, 42, second).has_value());

  auto proof = detector_.observe(author_, 42, third);
  ASSERT_TRUE(proof.has_value());
  EXPECT_EQ(proof->first_header, first);
  EXPECT_EQ(proof->second_header, third);

  EXPECT_FALSE(detector_.observe(author_, 42, second).has_value());
}

/**
 * @given headers of different authorities or different slots
 * @when they are observed
 * @then nothing is reported
 */
TEST_F(EquivocationDetectorTest, DifferentAuthorsAndSlots) {
  EXPECT_FALSE(detector_.observe(author_, 42, header(42, 1)).has_value());
  EXPECT_FALSE(
      detector_.observe(other_author_, 42, header(42, 2)).has_value());
  EXPECT_FALSE(detector_.observe(author_, 43, header(43, 3)).has_value());
}

/**
 * @given headers observed in slots 10 and 16
 * @when the current slot moves to 20 and other headers of those slots arrive
 * @then slot 10 is beyond the horizon and forgotten, slot 16 is still watched
 */
TEST_F(EquivocationDetectorTest, Horizon) {
  current_slot_ = 10;
  detector_.observe(author_, 10, header(10, 1));
  current_slot_ = 16;
  detector_.observe(author_, 16, header(16, 1));

  current_slot_ = 20;
  EXPECT_FALSE(detector_.observe(author_, 10, header(10, 2)).has_value());
  EXPECT_TRUE(detector_.observe(author_, 16, header(16, 2)).has_value());
}

/**
 * @given headers claiming slots far ahead of the current one, up to the
 * largest slot number
 * @when an authority equivocates in the current slot
 * @then the equivocation is still reported
 */
TEST_F(EquivocationDetectorTest, FutureSlotsKeepHorizon) {
  constexpr auto kMaxSlot = std::numeric_limits<SlotNumber>::max();
  EXPECT_FALSE(detector_.observe(other_author_, 1'000'042, header(1'000'042, 1))
                   .has_value());
  EXPECT_FALSE(
      detector_.observe(other_author_, kMaxSlot, header(kMaxSlot, 1))
          .has_value());

  EXPECT_FALSE(detector_.observe(author_, 42, header(42, 1)).has_value());
  auto proof = detector_.observe(author_, 42, header(42, 2));
  ASSERT_TRUE(proof.has_value());
  EXPECT_EQ(proof->slot, 42u);

  // far future headers are watched as well
  EXPECT_TRUE(
      detector_.observe(other_author_, kMaxSlot, header(kMaxSlot, 2))
          .has_value());
}

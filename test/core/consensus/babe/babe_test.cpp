/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/babe_impl.hpp"

#include <gtest/gtest.h>

#include "consensus/babe/babe_config_error.hpp"
#include "consensus/babe/impl/babe_digests_util.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "mock/core/authorship/proposer_mock.hpp"
#include "mock/core/blockchain/block_tree_mock.hpp"
#include "mock/core/consensus/babe/babe_lottery_mock.hpp"
#include "mock/core/consensus/babe/block_header_appender_mock.hpp"
#include "mock/core/consensus/babe/epoch_tracker_mock.hpp"
#include "mock/core/consensus/timeline/slot_clock_mock.hpp"
#include "mock/core/crypto/key_store_mock.hpp"
#include "testutil/consensus/babe_headers.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/primitives/mp_utils.hpp"

using namespace tessera;
using namespace consensus;
using namespace babe;
using authorship::ProposerMock;
using blockchain::BlockTreeMock;
using crypto::KeyStoreError;
using crypto::KeyStoreMock;
using primitives::Block;
using primitives::BlockInfo;
using testing::_;
using testing::DoAll;
using testing::Invoke;
using testing::Return;
using testing::SaveArg;

class BabeTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    local_key_.fill(1);
    remote_key_.fill(2);
    signature_.fill(3);

    epoch_ = Epoch{
        .epoch_index = 2,
        .start_slot = 20,
        .duration = 10,
        .authorities = {{.id = remote_key_, .weight = 1},
                        {.id = local_key_, .weight = 1}},
        .config = {.leadership_rate = {1, 4},
                   .allowed_slots = AllowedSlots::PrimaryAndSecondaryPlain},
    };

    claim_ = SlotClaim{
        .slot = 25,
        .slot_type = SlotType::Primary,
        .authority_index = 1,
        .authority_id = local_key_,
    };
    claim_.vrf_output.output.fill(4);

    best_header_ = testutil::makeBabeHeader(
        *hasher_, 7, testutil::createHash256({6}), testutil::secondaryPlain(24, 2));
    best_block_ = best_header_.blockInfo();

    ON_CALL(*block_tree_, getBlockHeader(best_block_.hash))
        .WillByDefault(Return(best_header_));
    ON_CALL(*block_tree_, bestBlock()).WillByDefault(Return(best_block_));
    ON_CALL(*block_tree_, addBlock(_)).WillByDefault(Return(outcome::success()));
    ON_CALL(*block_appender_, appendAuthoredHeader(_))
        .WillByDefault(Return(ImportedHeader{}));
    ON_CALL(*epoch_tracker_, epochForSlot(best_block_.hash, _))
        .WillByDefault(Return(epoch_));
    ON_CALL(*key_store_, hasKey(local_key_)).WillByDefault(Return(true));
    ON_CALL(*key_store_, sign(local_key_, _))
        .WillByDefault(Return(signature_));
    ON_CALL(*lottery_, getSlotLeadership(_, _, _))
        .WillByDefault(Return(std::optional<SlotClaim>{}));
    ON_CALL(*proposer_, propose(_, _))
        .WillByDefault(Invoke([](const BlockInfo &parent,
                                 const primitives::Digest &digest)
                                  -> outcome::result<Block> {
          return Block{.header = {.number = parent.number + 1,
                                  .parent_hash = parent.hash,
                                  .digest = digest}};
        }));

    babe_ = std::make_shared<BabeImpl>(slot_clock_,
                                       block_tree_,
                                       epoch_tracker_,
                                       lottery_,
                                       key_store_,
                                       proposer_,
                                       block_appender_,
                                       hasher_,
                                       worker_);
  }

  void runWorker() {
    worker_->run();
    worker_->restart();
  }

  std::shared_ptr<testing::NiceMock<SlotClockMock>> slot_clock_ =
      std::make_shared<testing::NiceMock<SlotClockMock>>();
  std::shared_ptr<testing::NiceMock<BlockTreeMock>> block_tree_ =
      std::make_shared<testing::NiceMock<BlockTreeMock>>();
  std::shared_ptr<testing::NiceMock<EpochTrackerMock>> epoch_tracker_ =
      std::make_shared<testing::NiceMock<EpochTrackerMock>>();
  std::shared_ptr<testing::NiceMock<BabeLotteryMock>> lottery_ =
      std::make_shared<testing::NiceMock<BabeLotteryMock>>();
  std::shared_ptr<testing::NiceMock<KeyStoreMock>> key_store_ =
      std::make_shared<testing::NiceMock<KeyStoreMock>>();
  std::shared_ptr<testing::NiceMock<ProposerMock>> proposer_ =
      std::make_shared<testing::NiceMock<ProposerMock>>();
  std::shared_ptr<testing::NiceMock<BlockHeaderAppenderMock>> block_appender_ =
      std::make_shared<testing::NiceMock<BlockHeaderAppenderMock>>();
  std::shared_ptr<crypto::HasherImpl> hasher_ =
      std::make_shared<crypto::HasherImpl>();
  std::shared_ptr<boost::asio::io_context> worker_ =
      std::make_shared<boost::asio::io_context>();

  std::shared_ptr<BabeImpl> babe_;

  primitives::AuthorityId local_key_;
  primitives::AuthorityId remote_key_;
  crypto::Sr25519Signature signature_;
  Epoch epoch_;
  SlotClaim claim_;
  primitives::BlockHeader best_header_;
  BlockInfo best_block_;
};

/**
 * @given node holding no key of the epoch authorities
 * @when a slot is processed
 * @then it is skipped without asking the lottery
 */
TEST_F(BabeTest, NotAnAuthority) {
  EXPECT_CALL(*key_store_, hasKey(_)).WillRepeatedly(Return(false));
  EXPECT_CALL(*lottery_, getSlotLeadership(_, _, _)).Times(0);

  EXPECT_OUTCOME_TRUE(state, babe_->processSlot(25, best_block_));
  EXPECT_EQ(state, ClaimState::Skipped);
  EXPECT_EQ(babe_->state(), ClaimState::Skipped);
}

/**
 * @given node holding keys of two authorities of the epoch
 * @when a slot is processed
 * @then configuration error is returned
 */
TEST_F(BabeTest, MultipleLocalAuthorities) {
  EXPECT_CALL(*key_store_, hasKey(_)).WillRepeatedly(Return(true));
  EXPECT_CALL(*lottery_, getSlotLeadership(_, _, _)).Times(0);

  EXPECT_EC(babe_->processSlot(25, best_block_),
            ConfigError::MULTIPLE_LOCAL_AUTHORITIES);
  EXPECT_EQ(babe_->state(), ClaimState::Skipped);
}

/**
 * @given local authority whose key vanished from the key store
 * @when a slot is processed
 * @then it is skipped without error
 */
TEST_F(BabeTest, KeyNotAvailable) {
  EXPECT_CALL(*lottery_, getSlotLeadership(epoch_, 25, 1))
      .WillOnce(Return(KeyStoreError::KEY_NOT_AVAILABLE));

  EXPECT_OUTCOME_TRUE(state, babe_->processSlot(25, best_block_));
  EXPECT_EQ(state, ClaimState::Skipped);
}

/**
 * @given local authority which is not a leader of the slot
 * @when the slot is processed
 * @then it is skipped and nothing is proposed
 */
TEST_F(BabeTest, NotLeader) {
  EXPECT_CALL(*proposer_, propose(_, _)).Times(0);

  EXPECT_OUTCOME_TRUE(state, babe_->processSlot(25, best_block_));
  EXPECT_EQ(state, ClaimState::Skipped);
  runWorker();
}

/**
 * @given best block already in the processed slot
 * @when the slot is processed
 * @then it is skipped before the epoch is resolved
 */
TEST_F(BabeTest, BestBlockInSameSlot) {
  EXPECT_CALL(*epoch_tracker_, epochForSlot(_, _)).Times(0);

  EXPECT_OUTCOME_TRUE(state, babe_->processSlot(24, best_block_));
  EXPECT_EQ(state, ClaimState::Skipped);
}

/**
 * @given slot whose epoch can not be resolved
 * @when it is processed
 * @then the error is returned
 */
TEST_F(BabeTest, EpochUnknown) {
  EXPECT_CALL(*epoch_tracker_, epochForSlot(best_block_.hash, 25))
      .WillOnce(Return(EpochTrackerError::UNKNOWN_BLOCK));

  EXPECT_EC(babe_->processSlot(25, best_block_),
            EpochTrackerError::UNKNOWN_BLOCK);
  EXPECT_EQ(babe_->state(), ClaimState::Skipped);
}

/**
 * @given local authority leading the slot
 * @when the slot is processed and the worker runs
 * @then a block with the claim in its pre-digest is proposed on top of the
 * best block, sealed by the local key and stored
 */
TEST_F(BabeTest, ClaimAndPropose) {
  EXPECT_CALL(*lottery_, getSlotLeadership(epoch_, 25, 1))
      .WillOnce(Return(std::make_optional(claim_)));

  primitives::Digest inherent;
  EXPECT_CALL(*proposer_, propose(best_block_, _))
      .WillOnce(Invoke([&](const BlockInfo &parent,
                           const primitives::Digest &digest)
                           -> outcome::result<Block> {
        inherent = digest;
        return Block{.header = {.number = parent.number + 1,
                                .parent_hash = parent.hash,
                                .digest = digest}};
      }));
  common::Buffer signed_message;
  EXPECT_CALL(*key_store_, sign(local_key_, _))
      .WillOnce(Invoke([&](const auto &, common::BufferView message)
                           -> outcome::result<crypto::Sr25519Signature> {
        signed_message.put(message);
        return signature_;
      }));
  primitives::BlockHeader recorded;
  Block added;
  {
    testing::InSequence seq;
    EXPECT_CALL(*block_appender_, appendAuthoredHeader(_))
        .WillOnce(DoAll(SaveArg<0>(&recorded), Return(ImportedHeader{})));
    EXPECT_CALL(*block_tree_, addBlock(_))
        .WillOnce(DoAll(SaveArg<0>(&added), Return(outcome::success())));
  }

  EXPECT_OUTCOME_TRUE(state, babe_->processSlot(25, best_block_));
  EXPECT_EQ(state, ClaimState::Claimed);
  EXPECT_EQ(babe_->state(), ClaimState::Claimed);

  runWorker();

  ASSERT_EQ(inherent.size(), 1u);
  EXPECT_OUTCOME_TRUE(babe_header, getBabeBlockHeader(added.header));
  EXPECT_EQ(babe_header,
            (BabeBlockHeader{
                .slot_assignment_type = SlotType::Primary,
                .authority_index = 1,
                .slot_number = 25,
                .epoch_index = 2,
                .vrf_output = claim_.vrf_output,
            }));
  EXPECT_EQ(added.header.parent_hash, best_block_.hash);
  EXPECT_EQ(added.header.number, best_block_.number + 1);

  EXPECT_OUTCOME_TRUE(seal, getSeal(added.header));
  EXPECT_EQ(seal.signature, signature_);
  auto unsealed = primitives::calculateUnsealedHash(added.header, *hasher_);
  EXPECT_EQ(signed_message, common::Buffer(unsealed));
  EXPECT_EQ(recorded, added.header);
}

/**
 * @given claimed slot whose sealed block can not be recorded
 * @when the proposal runs
 * @then the block is not handed to the block tree
 */
TEST_F(BabeTest, AuthoredBlockRejected) {
  EXPECT_CALL(*lottery_, getSlotLeadership(epoch_, 25, 1))
      .WillOnce(Return(std::make_optional(claim_)));
  EXPECT_CALL(*block_appender_, appendAuthoredHeader(_))
      .WillOnce(Return(EpochTrackerError::STALE_EPOCH));
  EXPECT_CALL(*block_tree_, addBlock(_)).Times(0);

  EXPECT_OUTCOME_TRUE(state, babe_->processSlot(25, best_block_));
  EXPECT_EQ(state, ClaimState::Claimed);
  runWorker();

  // the next slot is evaluated again
  EXPECT_CALL(*lottery_, getSlotLeadership(epoch_, 26, 1))
      .WillOnce(Return(std::optional<SlotClaim>{}));
  EXPECT_OUTCOME_TRUE(next, babe_->processSlot(26, best_block_));
  EXPECT_EQ(next, ClaimState::Skipped);
}

/**
 * @given proposal of a claimed slot not finished yet
 * @when the next slot is processed
 * @then it is skipped, and slots are evaluated again once the proposal is done
 */
TEST_F(BabeTest, ProposalInProgress) {
  EXPECT_CALL(*lottery_, getSlotLeadership(epoch_, 25, 1))
      .WillOnce(Return(std::make_optional(claim_)));
  EXPECT_CALL(*lottery_, getSlotLeadership(epoch_, 27, 1))
      .WillOnce(Return(std::optional<SlotClaim>{}));

  EXPECT_OUTCOME_TRUE(claimed, babe_->processSlot(25, best_block_));
  EXPECT_EQ(claimed, ClaimState::Claimed);

  EXPECT_OUTCOME_TRUE(busy, babe_->processSlot(26, best_block_));
  EXPECT_EQ(busy, ClaimState::Skipped);

  runWorker();

  EXPECT_OUTCOME_TRUE(after, babe_->processSlot(27, best_block_));
  EXPECT_EQ(after, ClaimState::Skipped);
}

/**
 * @given started block production
 * @when the slot clock ticks
 * @then the slot is processed on top of the best block, until stopped
 */
TEST_F(BabeTest, SlotClockDrivesProduction) {
  SlotClock::TickHandler handler;
  EXPECT_CALL(*slot_clock_, start(_)).WillOnce(SaveArg<0>(&handler));
  EXPECT_CALL(*slot_clock_, stop());
  EXPECT_CALL(*lottery_, getSlotLeadership(epoch_, 25, 1))
      .WillOnce(Return(std::make_optional(claim_)));
  EXPECT_CALL(*block_tree_, addBlock(_));

  babe_->start();
  ASSERT_TRUE(handler);
  handler(SlotTick{.slot = 25});
  EXPECT_EQ(babe_->state(), ClaimState::Claimed);
  runWorker();

  babe_->stop();
}

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/consensus_core.hpp"

#include <unordered_map>

#include <gtest/gtest.h>

#include "blockchain/block_tree_error.hpp"
#include "consensus/babe/babe.hpp"
#include "consensus/babe/babe_config_error.hpp"
#include "consensus/babe/block_header_appender.hpp"
#include "consensus/babe/epoch_tracker.hpp"
#include "consensus/babe/impl/babe_digests_util.hpp"
#include "consensus/timeline/slot_clock.hpp"
#include "crypto/key_store/key_store_impl.hpp"
#include "crypto/random_generator/boost_generator.hpp"
#include "crypto/sr25519/sr25519_provider_impl.hpp"
#include "crypto/vrf/vrf_provider_impl.hpp"
#include "mock/core/authorship/proposer_mock.hpp"
#include "mock/core/blockchain/block_tree_mock.hpp"
#include "mock/core/runtime/babe_api_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/primitives/mp_utils.hpp"

using namespace tessera;
using application::ConsensusCore;
using application::TesseraConfig;
using authorship::ProposerMock;
using blockchain::BlockTreeError;
using blockchain::BlockTreeMock;
using consensus::babe::ClaimState;
using consensus::babe::ConfigError;
using consensus::babe::NextEpochDescriptor;
using primitives::Block;
using primitives::BlockHash;
using primitives::BlockHeader;
using primitives::BlockInfo;
using testing::_;
using testing::Invoke;
using testing::ReturnRef;

class ConsensusCoreTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    crypto::Sr25519Seed seed;
    seed.fill(5);
    local_key_ = key_store_->insertKey(seed);

    config_.babe.slot_duration = consensus::SlotDuration{1000};
    config_.babe.epoch_length = 10;
    config_.babe.epoch_config = {
        .leadership_rate = {1, 1},
        .allowed_slots = consensus::babe::AllowedSlots::PrimaryOnly,
    };
    config_.babe.authorities = {{.id = local_key_, .weight = 1}};
    config_.babe.randomness.fill(7);
    config_.genesis_slot = 100;

    genesis_hash_ = testutil::createHash256({0xff});
    headers_[genesis_hash_] =
        BlockHeader{.number = 0, .hash_opt = genesis_hash_};

    ON_CALL(*block_tree_, getGenesisBlockHash())
        .WillByDefault(ReturnRef(genesis_hash_));
    ON_CALL(*block_tree_, getBlockHeader(_))
        .WillByDefault(Invoke([this](const BlockHash &hash)
                                  -> outcome::result<BlockHeader> {
          auto it = headers_.find(hash);
          if (it == headers_.end()) {
            return BlockTreeError::HEADER_NOT_FOUND;
          }
          return it->second;
        }));
    ON_CALL(*block_tree_, addBlockHeader(_))
        .WillByDefault(Invoke(
            [this](const BlockHeader &header) -> outcome::result<void> {
              headers_[header.hash()] = header;
              return outcome::success();
            }));
  }

  ConsensusCore::Collaborators collaborators() const {
    return {
        .block_tree = block_tree_,
        .key_store = key_store_,
        .proposer = proposer_,
        .babe_api = babe_api_,
        .main_context = main_context_,
        .worker_context = worker_context_,
    };
  }

  std::shared_ptr<crypto::KeyStoreImpl> key_store_ =
      std::make_shared<crypto::KeyStoreImpl>(
          std::make_shared<crypto::Sr25519ProviderImpl>(),
          std::make_shared<crypto::VRFProviderImpl>(
              std::make_shared<crypto::BoostRandomGenerator>()));
  std::shared_ptr<testing::NiceMock<BlockTreeMock>> block_tree_ =
      std::make_shared<testing::NiceMock<BlockTreeMock>>();
  std::shared_ptr<testing::NiceMock<ProposerMock>> proposer_ =
      std::make_shared<testing::NiceMock<ProposerMock>>();
  std::shared_ptr<testing::StrictMock<runtime::BabeApiMock>> babe_api_ =
      std::make_shared<testing::StrictMock<runtime::BabeApiMock>>();
  std::shared_ptr<boost::asio::io_context> main_context_ =
      std::make_shared<boost::asio::io_context>();
  std::shared_ptr<boost::asio::io_context> worker_context_ =
      std::make_shared<boost::asio::io_context>();

  TesseraConfig config_;
  primitives::AuthorityId local_key_;
  BlockHash genesis_hash_;
  std::unordered_map<BlockHash, BlockHeader> headers_;
};

/**
 * @given configuration without authorities
 * @when consensus core is created
 * @then configuration error is returned
 */
TEST_F(ConsensusCoreTest, InvalidConfig) {
  config_.babe.authorities.clear();
  EXPECT_EC(ConsensusCore::create(config_, collaborators()),
            ConfigError::EMPTY_AUTHORITIES);
}

/**
 * @given configuration with a logging override of an unknown group
 * @when consensus core is created
 * @then logging error is returned
 */
TEST_F(ConsensusCoreTest, InvalidLogOverride) {
  config_.log = {"no_such_group=debug"};
  EXPECT_EC(ConsensusCore::create(config_, collaborators()),
            log::Error::WRONG_GROUP);
}

/**
 * @given valid configuration
 * @when consensus core is created
 * @then its components are built, with the genesis epoch starting at the
 * configured slot
 */
TEST_F(ConsensusCoreTest, Create) {
  config_.log = {"babe=debug"};
  EXPECT_OUTCOME_TRUE(core, ConsensusCore::create(config_, collaborators()));
  ASSERT_NE(core->slotClock(), nullptr);
  ASSERT_NE(core->epochTracker(), nullptr);
  ASSERT_NE(core->blockAppender(), nullptr);
  ASSERT_NE(core->babe(), nullptr);

  EXPECT_EQ(core->slotClock()->slotDuration(), config_.babe.slot_duration);
  EXPECT_OUTCOME_TRUE(epoch,
                      core->epochTracker()->epochForSlot(genesis_hash_, 105));
  EXPECT_EQ(epoch.epoch_index, 0u);
  EXPECT_EQ(epoch.start_slot, 100u);
  EXPECT_EQ(epoch.authorities, config_.babe.authorities);

  core->start();
  core->stop();
}

/**
 * @given consensus core of the only authority of the chain, with a block tree
 * storing every added block
 * @when it produces the first block of the genesis epoch
 * @then the next epoch announced by the block is tracked on top of it, and
 * importing the block again passes verification
 */
TEST_F(ConsensusCoreTest, ProduceAndImport) {
  EXPECT_OUTCOME_TRUE(core, ConsensusCore::create(config_, collaborators()));

  NextEpochDescriptor descriptor{.authorities = config_.babe.authorities};
  descriptor.randomness.fill(8);
  EXPECT_CALL(*proposer_, propose(BlockInfo(0, genesis_hash_), _))
      .WillOnce(Invoke([&](const BlockInfo &parent,
                           const primitives::Digest &inherent)
                           -> outcome::result<Block> {
        Block block{.header = {.number = parent.number + 1,
                               .parent_hash = parent.hash,
                               .digest = inherent}};
        block.header.digest.push_back(
            consensus::babe::makeNextEpochDigest(descriptor));
        return block;
      }));
  Block produced;
  EXPECT_CALL(*block_tree_, addBlock(_))
      .WillOnce(Invoke([&](const Block &block) -> outcome::result<void> {
        produced = block;
        headers_[block.header.hash()] = block.header;
        return outcome::success();
      }));

  EXPECT_OUTCOME_TRUE(
      state, core->babe()->processSlot(103, BlockInfo(0, genesis_hash_)));
  EXPECT_EQ(state, ClaimState::Claimed);
  worker_context_->run();
  ASSERT_EQ(headers_.size(), 2u);
  const auto produced_info = produced.header.blockInfo();

  EXPECT_OUTCOME_TRUE(next_epoch,
                      core->epochTracker()->epochForSlot(produced_info.hash,
                                                         112));
  EXPECT_EQ(next_epoch.epoch_index, 1u);
  EXPECT_EQ(next_epoch.start_slot, 110u);
  EXPECT_EQ(next_epoch.randomness, descriptor.randomness);
  EXPECT_EQ(next_epoch.authorities, descriptor.authorities);

  auto header = produced.header;
  EXPECT_OUTCOME_TRUE(imported,
                      core->blockAppender()->appendHeader(std::move(header)));
  EXPECT_EQ(imported.block, produced_info);
  EXPECT_EQ(imported.seal.authority_id, local_key_);
  EXPECT_EQ(imported.seal.slot_type, consensus::babe::SlotType::Primary);
  EXPECT_EQ(imported.weight, 2u);
}

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/consensus_core.hpp"

#include "clock/impl/basic_waitable_timer.hpp"
#include "clock/impl/clock_impl.hpp"
#include "consensus/babe/babe_config_error.hpp"
#include "consensus/babe/impl/babe_block_validator_impl.hpp"
#include "consensus/babe/impl/babe_impl.hpp"
#include "consensus/babe/impl/babe_lottery_impl.hpp"
#include "consensus/babe/impl/block_header_appender_impl.hpp"
#include "consensus/babe/impl/epoch_tracker_impl.hpp"
#include "consensus/babe/impl/equivocation_detector_impl.hpp"
#include "consensus/timeline/impl/slot_clock_impl.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "crypto/random_generator/boost_generator.hpp"
#include "crypto/sr25519/sr25519_provider_impl.hpp"
#include "crypto/vrf/vrf_provider_impl.hpp"

namespace tessera::application {

  ConsensusCore::ConsensusCore()
      : logger_(log::createLogger("ConsensusCore", "application")) {}

  outcome::result<std::shared_ptr<ConsensusCore>> ConsensusCore::create(
      const TesseraConfig &config, Collaborators collaborators) {
    BOOST_ASSERT(collaborators.block_tree);
    BOOST_ASSERT(collaborators.key_store);
    BOOST_ASSERT(collaborators.proposer);
    BOOST_ASSERT(collaborators.babe_api);
    BOOST_ASSERT(collaborators.main_context);
    BOOST_ASSERT(collaborators.worker_context);

    OUTCOME_TRY(log::tuneLoggingSystem(config.log));
    OUTCOME_TRY(consensus::babe::validateConfiguration(config.babe));

    // done so because of private constructor
    std::shared_ptr<ConsensusCore> core{new ConsensusCore};

    auto hasher = std::make_shared<crypto::HasherImpl>();
    auto sr25519_provider = std::make_shared<crypto::Sr25519ProviderImpl>();
    auto vrf_provider = std::make_shared<crypto::VRFProviderImpl>(
        std::make_shared<crypto::BoostRandomGenerator>());

    core->slot_clock_ = std::make_shared<consensus::SlotClockImpl>(
        std::make_shared<clock::SystemClockImpl>(),
        std::make_unique<clock::BasicWaitableTimer>(collaborators.main_context),
        config.babe.slot_duration);

    core->epoch_tracker_ = std::make_shared<consensus::babe::EpochTrackerImpl>(
        collaborators.block_tree,
        consensus::babe::genesisEpoch(config.babe, config.genesis_slot));

    auto lottery = std::make_shared<consensus::babe::BabeLotteryImpl>(
        collaborators.key_store, vrf_provider, hasher);

    auto validator = std::make_shared<consensus::babe::BabeBlockValidatorImpl>(
        core->epoch_tracker_, lottery, hasher, sr25519_provider);

    auto equivocation_detector =
        std::make_shared<consensus::babe::EquivocationDetectorImpl>(
            hasher, core->slot_clock_, config.equivocation_slot_horizon);

    core->block_appender_ =
        std::make_shared<consensus::babe::BlockHeaderAppenderImpl>(
            collaborators.block_tree,
            hasher,
            validator,
            core->epoch_tracker_,
            equivocation_detector,
            collaborators.babe_api);

    core->babe_ = std::make_shared<consensus::babe::BabeImpl>(
        core->slot_clock_,
        collaborators.block_tree,
        core->epoch_tracker_,
        lottery,
        collaborators.key_store,
        collaborators.proposer,
        core->block_appender_,
        hasher,
        collaborators.worker_context);

    SL_INFO(core->logger_,
            "Consensus configured: slot {} ms, epoch {} slots, {}, "
            "{} authorities",
            config.babe.slot_duration.count(),
            config.babe.epoch_length,
            to_string(config.babe.epoch_config.allowed_slots),
            config.babe.authorities.size());

    return core;
  }

  void ConsensusCore::start() {
    SL_INFO(logger_, "Block production is started");
    babe_->start();
  }

  void ConsensusCore::stop() {
    babe_->stop();
    SL_INFO(logger_, "Block production is stopped");
  }

}  // namespace tessera::application

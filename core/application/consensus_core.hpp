/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>

#include "application/impl/tessera_config.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"

namespace tessera::authorship {
  class Proposer;
}

namespace tessera::blockchain {
  class BlockTree;
}

namespace tessera::crypto {
  class KeyStore;
}

namespace tessera::runtime {
  class BabeApi;
}

namespace tessera::consensus {
  class SlotClock;
}

namespace tessera::consensus::babe {
  class Babe;
  class BlockHeaderAppender;
  class EpochTracker;
}  // namespace tessera::consensus::babe

namespace tessera::application {

  /**
   * Assembles the consensus components from the configuration and the
   * collaborators provided by the host node
   */
  class ConsensusCore {
   public:
    struct Collaborators {
      std::shared_ptr<blockchain::BlockTree> block_tree;
      std::shared_ptr<crypto::KeyStore> key_store;
      std::shared_ptr<authorship::Proposer> proposer;
      std::shared_ptr<runtime::BabeApi> babe_api;
      /// context slot ticks are handled on
      std::shared_ptr<boost::asio::io_context> main_context;
      /// context blocks are proposed on
      std::shared_ptr<boost::asio::io_context> worker_context;
    };

    /**
     * Checks \param config, applies its logging overrides and builds the
     * components
     * @return ConfigError or logging error on invalid configuration
     */
    static outcome::result<std::shared_ptr<ConsensusCore>> create(
        const TesseraConfig &config, Collaborators collaborators);

    /// Starts block production on slot ticks
    void start();

    void stop();

    std::shared_ptr<consensus::SlotClock> slotClock() const {
      return slot_clock_;
    }

    std::shared_ptr<consensus::babe::EpochTracker> epochTracker() const {
      return epoch_tracker_;
    }

    std::shared_ptr<consensus::babe::BlockHeaderAppender> blockAppender()
        const {
      return block_appender_;
    }

    std::shared_ptr<consensus::babe::Babe> babe() const {
      return babe_;
    }

   private:
    ConsensusCore();

    log::Logger logger_;
    std::shared_ptr<consensus::SlotClock> slot_clock_;
    std::shared_ptr<consensus::babe::EpochTracker> epoch_tracker_;
    std::shared_ptr<consensus::babe::BlockHeaderAppender> block_appender_;
    std::shared_ptr<consensus::babe::Babe> babe_;
  };

}  // namespace tessera::application

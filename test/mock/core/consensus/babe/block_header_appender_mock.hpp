/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/block_header_appender.hpp"

#include <gmock/gmock.h>

namespace tessera::consensus::babe {

  class BlockHeaderAppenderMock : public BlockHeaderAppender {
   public:
    MOCK_METHOD(outcome::result<ImportedHeader>,
                appendHeader,
                (primitives::BlockHeader &&),
                (override));

    MOCK_METHOD(outcome::result<ImportedHeader>,
                appendAuthoredHeader,
                (const primitives::BlockHeader &),
                (override));

    MOCK_METHOD(outcome::result<void>,
                onFinalized,
                (const primitives::BlockInfo &),
                (override));
  };

}  // namespace tessera::consensus::babe

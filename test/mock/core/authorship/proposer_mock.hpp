/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "authorship/proposer.hpp"

#include <gmock/gmock.h>

namespace tessera::authorship {

  class ProposerMock : public Proposer {
   public:
    MOCK_METHOD(outcome::result<primitives::Block>,
                propose,
                (const primitives::BlockInfo &, const primitives::Digest &),
                (override));
  };

}  // namespace tessera::authorship

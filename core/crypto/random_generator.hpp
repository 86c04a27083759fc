/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/crypto/random_generator.hpp>

namespace tessera::crypto {
  using CSPRNG = libp2p::crypto::random::CSPRNG;
}  // namespace tessera::crypto

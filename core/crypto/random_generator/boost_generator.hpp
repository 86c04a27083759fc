/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/crypto/random_generator/boost_generator.hpp>

#include "crypto/random_generator.hpp"

namespace tessera::crypto {

  using BoostRandomGenerator = libp2p::crypto::random::BoostRandomGenerator;

}  // namespace tessera::crypto

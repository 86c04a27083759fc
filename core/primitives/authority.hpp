/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "crypto/sr25519_types.hpp"

namespace tessera::primitives {

  using AuthorityId = crypto::Sr25519PublicKey;
  using AuthorityWeight = uint64_t;
  using AuthorityIndex = uint32_t;

  /**
   * Authority, which participates in block production
   */
  struct Authority {
    AuthorityId id;
    AuthorityWeight weight{};

    bool operator==(const Authority &other) const = default;

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const Authority &a) {
      return s << a.id << a.weight;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, Authority &a) {
      return s >> a.id >> a.weight;
    }
  };

  /// Ordered set of block-producing authorities with their weights
  using AuthorityList = std::vector<Authority>;

}  // namespace tessera::primitives

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/sr25519_types.hpp"

namespace tessera::consensus::babe {

  /**
   * Basically a signature of the block's header
   */
  struct Seal {
    /// Sig_sr25519(Blake2s(header without seal))
    crypto::Sr25519Signature signature;

    bool operator==(const Seal &other) const = default;

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const Seal &seal) {
      return s << seal.signature;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, Seal &seal) {
      return s >> seal.signature;
    }
  };

}  // namespace tessera::consensus::babe

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "common/blob.hpp"
#include "common/buffer.hpp"

namespace tessera::primitives {

  /// Four-byte tag of the consensus engine a digest item belongs to
  using ConsensusEngineId = common::Blob<4>;

  inline const ConsensusEngineId kBabeEngineId{{'B', 'A', 'B', 'E'}};

  /**
   * Kind of a digest item. Values are the leading byte of the encoding.
   */
  enum class DigestItemKind : uint8_t {
    /// Message from the runtime to the consensus engine, e.g. the next epoch
    Consensus = 4,
    /// Signature of the block author; always the last item
    Seal = 5,
    /// Data produced by the block author before the runtime runs
    PreRuntime = 6,
  };

  /**
   * Chain-specific auxiliary data of a block header
   */
  struct DigestItem {
    DigestItemKind kind{};
    ConsensusEngineId consensus_engine_id{};
    common::Buffer data{};

    bool operator==(const DigestItem &other) const = default;

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const DigestItem &item) {
      return s << static_cast<uint8_t>(item.kind) << item.consensus_engine_id
               << item.data;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, DigestItem &item) {
      uint8_t kind = 0;
      s >> kind >> item.consensus_engine_id >> item.data;
      item.kind = static_cast<DigestItemKind>(kind);
      return s;
    }
  };

  using Digest = std::vector<DigestItem>;

}  // namespace tessera::primitives

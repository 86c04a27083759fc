/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <fmt/format.h>
#include <boost/functional/hash.hpp>

#include "common/blob.hpp"

namespace tessera::primitives {

  using BlockNumber = uint32_t;
  using BlockHash = common::Hash256;

  /// Identity of a block: its height and hash
  struct BlockInfo {
    BlockNumber number{};
    BlockHash hash{};

    BlockInfo() = default;
    BlockInfo(BlockNumber number, const BlockHash &hash)
        : number{number}, hash{hash} {}

    bool operator==(const BlockInfo &other) const = default;

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    friend Stream &operator<<(Stream &s, const BlockInfo &info) {
      return s << info.number << info.hash;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    friend Stream &operator>>(Stream &s, BlockInfo &info) {
      return s >> info.number >> info.hash;
    }
  };

}  // namespace tessera::primitives

template <>
struct std::hash<tessera::primitives::BlockInfo> {
  auto operator()(const tessera::primitives::BlockInfo &info) const {
    auto seed = std::hash<tessera::primitives::BlockHash>{}(info.hash);
    boost::hash_combine(seed, info.number);
    return seed;
  }
};

template <>
struct fmt::formatter<tessera::primitives::BlockInfo> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const tessera::primitives::BlockInfo &info,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{:s} #{}", info.hash, info.number);
  }
};

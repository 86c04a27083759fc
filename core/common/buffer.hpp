/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <scale/scale.hpp>

#include "common/hexutil.hpp"

namespace tessera::common {

  using BufferView = std::span<const uint8_t>;

  /**
   * Growable byte sequence. SCALE-encoded as a length-prefixed collection.
   */
  class Buffer : public std::vector<uint8_t> {
    using Base = std::vector<uint8_t>;

   public:
    Buffer() = default;
    Buffer(const Buffer &) = default;
    Buffer(Buffer &&) noexcept = default;
    Buffer &operator=(const Buffer &) = default;
    Buffer &operator=(Buffer &&) noexcept = default;

    explicit Buffer(Base other) : Base(std::move(other)) {}
    Buffer(std::initializer_list<uint8_t> list) : Base(list) {}
    Buffer(BufferView view) : Base(view.begin(), view.end()) {}

    template <size_t N>
    explicit Buffer(const std::array<uint8_t, N> &other)
        : Base(other.begin(), other.end()) {}

    /// Appends the bytes of `view` and returns itself for chaining
    Buffer &put(BufferView view) {
      insert(end(), view.begin(), view.end());
      return *this;
    }

    Buffer &put(std::string_view str) {
      insert(end(), str.begin(), str.end());
      return *this;
    }

    Buffer &putUint8(uint8_t byte) {
      push_back(byte);
      return *this;
    }

    BufferView view() const {
      return {data(), size()};
    }

    std::string toHex() const {
      return hex_lower(view());
    }

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const Buffer &buffer) {
      return s << static_cast<const Base &>(buffer);
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, Buffer &buffer) {
      return s >> static_cast<Base &>(buffer);
    }
  };

}  // namespace tessera::common

template <>
struct fmt::formatter<tessera::common::Buffer> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const tessera::common::Buffer &buffer, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "0x{}", buffer.toHex());
  }
};

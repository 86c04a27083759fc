/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <span>

#include <fmt/format.h>
#include <boost/functional/hash.hpp>
#include <scale/scale.hpp>

#include "common/hexutil.hpp"

#define TESSERA_BLOB_STRICT_TYPEDEF(space_name, class_name, blob_size)         \
  namespace space_name {                                                       \
    struct class_name : public ::tessera::common::Blob<blob_size> {            \
      using Base = ::tessera::common::Blob<blob_size>;                         \
                                                                               \
      class_name() = default;                                                  \
      class_name(const class_name &) = default;                                \
      class_name(class_name &&) = default;                                     \
      class_name &operator=(const class_name &) = default;                     \
      class_name &operator=(class_name &&) = default;                          \
                                                                               \
      explicit class_name(const Base &blob) : Base{blob} {}                    \
      explicit class_name(Base &&blob) : Base{std::move(blob)} {}              \
                                                                               \
      ~class_name() = default;                                                 \
                                                                               \
      class_name &operator=(const Base &blob) {                                \
        Blob::operator=(blob);                                                 \
        return *this;                                                          \
      }                                                                        \
                                                                               \
      static ::outcome::result<class_name> fromHexWithPrefix(                  \
          std::string_view hex) {                                              \
        OUTCOME_TRY(blob, Base::fromHexWithPrefix(hex));                       \
        return class_name{std::move(blob)};                                    \
      }                                                                        \
                                                                               \
      friend inline ::scale::ScaleEncoderStream &operator<<(                   \
          ::scale::ScaleEncoderStream &s,                                      \
          const space_name::class_name &data) {                                \
        return s << static_cast<const Base &>(data);                           \
      }                                                                        \
                                                                               \
      friend inline ::scale::ScaleDecoderStream &operator>>(                   \
          ::scale::ScaleDecoderStream &s, space_name::class_name &data) {      \
        return s >> static_cast<Base &>(data);                                 \
      }                                                                        \
    };                                                                         \
  };                                                                           \
                                                                               \
  template <>                                                                  \
  struct std::hash<space_name::class_name> {                                   \
    auto operator()(const space_name::class_name &key) const {                 \
      /* NOLINTNEXTLINE */                                                     \
      return boost::hash_range(key.cbegin(), key.cend());                      \
    }                                                                          \
  };                                                                           \
                                                                               \
  template <>                                                                  \
  struct fmt::formatter<space_name::class_name>                                \
      : fmt::formatter<space_name::class_name::Base> {                         \
    template <typename FormatCtx>                                              \
    auto format(const space_name::class_name &blob, FormatCtx &ctx) const      \
        -> decltype(ctx.out()) {                                               \
      return fmt::formatter<space_name::class_name::Base>::format(blob, ctx);  \
    }                                                                          \
  };

namespace tessera::common {

  /**
   * Error codes for exceptions that may occur during blob initialization
   */
  enum class BlobError { INCORRECT_LENGTH = 1 };

  /**
   * Base type which represents blob of fixed size.
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
    using Array = std::array<uint8_t, size_>;

   public:
    // Next line is required at least for the scale-codec
    static constexpr bool is_static_collection = true;

    constexpr Blob() : Array{} {}

    constexpr explicit Blob(const Array &l) : Array{l} {}

    static constexpr size_t size() {
      return size_;
    }

    std::string toHex() const {
      return hex_lower({this->begin(), this->end()});
    }

    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      OUTCOME_TRY(res, unhex(hex));
      return fromSpan(res);
    }

    static outcome::result<Blob<size_>> fromHexWithPrefix(
        std::string_view hex) {
      OUTCOME_TRY(res, unhexWith0x(hex));
      return fromSpan(res);
    }

    /**
     * Create Blob from a byte span of exactly `size_` bytes
     */
    static outcome::result<Blob<size_>> fromSpan(
        std::span<const uint8_t> span) {
      if (span.size() != size_) {
        return BlobError::INCORRECT_LENGTH;
      }

      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }
  };

  using Hash256 = Blob<32>;

}  // namespace tessera::common

template <size_t N>
struct std::hash<tessera::common::Blob<N>> {
  auto operator()(const tessera::common::Blob<N> &blob) const {
    return boost::hash_range(blob.data(), blob.data() + N);  // NOLINT
  }
};

template <size_t N>
struct fmt::formatter<tessera::common::Blob<N>> {
  // Presentation format: 's' - short, 'l' - long.
  char presentation = N > 4 ? 's' : 'l';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const tessera::common::Blob<N> &blob, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (presentation == 's') {
      return fmt::format_to(ctx.out(),
                            "0x{:02x}{:02x}…{:02x}{:02x}",
                            blob[0],
                            blob[1],
                            blob[N - 2],
                            blob[N - 1]);
    }
    return fmt::format_to(ctx.out(), "0x{}", blob.toHex());
  }
};

OUTCOME_HPP_DECLARE_ERROR(tessera::common, BlobError);

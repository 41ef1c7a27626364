/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <ostream>
#include <span>
#include <string_view>

#include <fmt/format.h>
#include <boost/functional/hash.hpp>

#include "common/hexutil.hpp"

/**
 * Declares a distinct fixed-size byte type, so that e.g. an address can not
 * be passed where a contribution key is expected. Parses from 0x-prefixed
 * hex, hashes and formats like the underlying blob.
 */
#define DECAI_BLOB_STRICT_TYPEDEF(space_name, class_name, blob_size)          \
  namespace space_name {                                                      \
    struct class_name : public ::decai::common::Blob<blob_size> {             \
      using Base = ::decai::common::Blob<blob_size>;                          \
                                                                              \
      class_name() = default;                                                 \
      explicit class_name(const Base &blob) : Base{blob} {}                   \
                                                                              \
      static ::outcome::result<class_name> fromHexWithPrefix(                 \
          std::string_view hex) {                                             \
        OUTCOME_TRY(blob, Base::fromHexWithPrefix(hex));                      \
        return class_name{blob};                                              \
      }                                                                       \
    };                                                                        \
  }                                                                           \
                                                                              \
  template <>                                                                 \
  struct std::hash<space_name::class_name>                                    \
      : std::hash<space_name::class_name::Base> {};                           \
                                                                              \
  template <>                                                                 \
  struct fmt::formatter<space_name::class_name>                               \
      : fmt::formatter<space_name::class_name::Base> {};

namespace decai::common {

  enum class BlobError : uint8_t { INCORRECT_LENGTH = 1 };
  Q_ENUM_ERROR_CODE(BlobError) {
    using E = decltype(e);
    switch (e) {
      case E::INCORRECT_LENGTH:
        return "Byte string length does not match the blob size";
    }
    abort();
  }

  /// Fixed-size byte array, zero-initialized, hex on the outside
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
    using Array = std::array<uint8_t, size_>;

   public:
    constexpr Blob() : Array{} {}

    constexpr explicit Blob(const Array &bytes) : Array{bytes} {}

    static constexpr size_t size() {
      return size_;
    }

    std::string toHex() const {
      return hex_lower({this->begin(), this->end()});
    }

    static outcome::result<Blob> fromSpan(std::span<const uint8_t> bytes) {
      if (bytes.size() != size_) {
        return BlobError::INCORRECT_LENGTH;
      }
      Blob blob;
      std::ranges::copy(bytes, blob.begin());
      return blob;
    }

    static outcome::result<Blob> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return fromSpan(bytes);
    }

    static outcome::result<Blob> fromHexWithPrefix(std::string_view hex) {
      OUTCOME_TRY(bytes, unhexWith0x(hex));
      return fromSpan(bytes);
    }
  };

  using Hash256 = Blob<32>;

  template <size_t N>
  inline std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << "0x" << blob.toHex();
  }

}  // namespace decai::common

template <size_t N>
struct std::hash<decai::common::Blob<N>> {
  size_t operator()(const decai::common::Blob<N> &blob) const {
    return boost::hash_range(blob.begin(), blob.end());
  }
};

/// "{}" and "{:l}" print the whole value, "{:s}" keeps two bytes per side
template <size_t N>
struct fmt::formatter<decai::common::Blob<N>> {
  bool abbreviate = false;

  constexpr auto parse(format_parse_context &ctx) {
    auto it = ctx.begin();
    if (it != ctx.end() and (*it == 's' or *it == 'l')) {
      abbreviate = *it++ == 's';
    }
    if (it != ctx.end() and *it != '}') {
      throw format_error("invalid blob format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const decai::common::Blob<N> &blob, FormatContext &ctx) const {
    auto hex = blob.toHex();
    if (abbreviate and N > 4) {
      return fmt::format_to(
          ctx.out(), "0x{}..{}", hex.substr(0, 4), hex.substr(hex.size() - 4));
    }
    return fmt::format_to(ctx.out(), "0x{}", hex);
  }
};

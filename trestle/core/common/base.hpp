// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic macros, concepts, types, and constants.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>

#include <intx/intx.hpp>

#include <trestle/core/common/assert.hpp>

namespace trestle {

using namespace std::string_view_literals;

template <class T>
concept UnsignedIntegral = std::unsigned_integral<T> || std::same_as<T, intx::uint128> ||
                           std::same_as<T, intx::uint256>;

using BlockNum = uint64_t;

//! Nonce of a message inside a lane
using MessageNonce = uint64_t;

inline constexpr MessageNonce kMaxMessageNonce = std::numeric_limits<MessageNonce>::max();

//! Identifier of a parachain inside its relay chain
using ParaId = uint32_t;

//! Balance type used for relayer rewards
using Balance = intx::uint128;

inline constexpr size_t kAddressLength{20};

inline constexpr size_t kHashLength{32};

// https://en.wikipedia.org/wiki/Binary_prefix
inline constexpr uint64_t kKibi{1024};
inline constexpr uint64_t kMebi{1024 * kKibi};

consteval uint64_t operator"" _Kibi(unsigned long long x) {
    TRESTLE_ASSERT(x <= std::numeric_limits<uint64_t>::max() / kKibi);
    return x * kKibi;
}
consteval uint64_t operator"" _Mebi(unsigned long long x) {
    TRESTLE_ASSERT(x <= std::numeric_limits<uint64_t>::max() / kMebi);
    return x * kMebi;
}

}  // namespace trestle

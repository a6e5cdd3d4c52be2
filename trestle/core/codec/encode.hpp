// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

// Binary encoding of bridge data structures.
// Fixed width integers are little endian, variable length items carry a compact length prefix
// (1, 2 or 4 bytes for values below 2^30, a length tagged big integer form above).

#pragma once

#include <array>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <trestle/core/common/base.hpp>
#include <trestle/core/common/bytes.hpp>

namespace trestle::codec {

inline constexpr uint64_t kMaxSingleByteCompact{(1ull << 6) - 1};
inline constexpr uint64_t kMaxTwoBytesCompact{(1ull << 14) - 1};
inline constexpr uint64_t kMaxFourBytesCompact{(1ull << 30) - 1};

void encode_compact(Bytes& to, uint64_t n);

size_t compact_length(uint64_t n) noexcept;

template <UnsignedIntegral T>
void encode(Bytes& to, const T& n) {
    uint8_t buffer[sizeof(T)];
    intx::le::unsafe::store(buffer, n);
    to.append(buffer, sizeof(T));
}

void encode(Bytes& to, bool b);

//! Variable length byte string, compact length prefixed
void encode(Bytes& to, ByteView str);

void encode(Bytes& to, const evmc::bytes32& hash);

void encode(Bytes& to, const evmc::address& address);

template <size_t N>
void encode(Bytes& to, const std::array<uint8_t, N>& array) {
    to.append(array.data(), N);
}

}  // namespace trestle::codec

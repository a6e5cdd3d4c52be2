// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "encode.hpp"

namespace trestle::codec {

void encode_compact(Bytes& to, uint64_t n) {
    if (n <= kMaxSingleByteCompact) {
        to.push_back(static_cast<uint8_t>(n << 2));
    } else if (n <= kMaxTwoBytesCompact) {
        encode(to, static_cast<uint16_t>((n << 2) | 0b01));
    } else if (n <= kMaxFourBytesCompact) {
        encode(to, static_cast<uint32_t>((n << 2) | 0b10));
    } else {
        const size_t bytes_needed{intx::count_significant_bytes(n)};
        to.push_back(static_cast<uint8_t>(((bytes_needed - 4) << 2) | 0b11));
        for (size_t i{0}; i < bytes_needed; ++i) {
            to.push_back(static_cast<uint8_t>(n >> (8 * i)));
        }
    }
}

size_t compact_length(uint64_t n) noexcept {
    if (n <= kMaxSingleByteCompact) {
        return 1;
    }
    if (n <= kMaxTwoBytesCompact) {
        return 2;
    }
    if (n <= kMaxFourBytesCompact) {
        return 4;
    }
    return 1 + intx::count_significant_bytes(n);
}

void encode(Bytes& to, bool b) {
    to.push_back(b ? 1 : 0);
}

void encode(Bytes& to, ByteView str) {
    encode_compact(to, str.size());
    to.append(str);
}

void encode(Bytes& to, const evmc::bytes32& hash) {
    to.append(hash.bytes, sizeof(hash.bytes));
}

void encode(Bytes& to, const evmc::address& address) {
    to.append(address.bytes, sizeof(address.bytes));
}

}  // namespace trestle::codec

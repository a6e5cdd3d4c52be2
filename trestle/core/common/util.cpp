// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <algorithm>

namespace trestle {

std::string to_hex(ByteView bytes, bool with_prefix) {
    static const char* kHexDigits{"0123456789abcdef"};
    std::string out(bytes.size() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{&out[0]};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept {
    if (ch >= '0' && ch <= '9') {
        return static_cast<uint8_t>(ch - '0');
    }
    if (ch >= 'a' && ch <= 'f') {
        return static_cast<uint8_t>(ch - 'a' + 10);
    }
    if (ch >= 'A' && ch <= 'F') {
        return static_cast<uint8_t>(ch - 'A' + 10);
    }
    return std::nullopt;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    if (hex.empty()) {
        return Bytes{};
    }

    const size_t pos{hex.size() & 1};
    Bytes out((hex.size() + pos) / 2, '\0');
    auto dst{out.begin()};
    if (pos) {
        const auto lo{decode_hex_digit(hex[0])};
        if (!lo) return std::nullopt;
        *dst++ = *lo;
        hex.remove_prefix(1);
    }
    while (!hex.empty()) {
        const auto hi{decode_hex_digit(hex[0])};
        const auto lo{decode_hex_digit(hex[1])};
        if (!hi || !lo) return std::nullopt;
        *dst++ = static_cast<uint8_t>((*hi << 4) | *lo);
        hex.remove_prefix(2);
    }
    return out;
}

size_t prefix_length(ByteView a, ByteView b) {
    size_t len{std::min(a.size(), b.size())};
    for (size_t i{0}; i < len; ++i) {
        if (a[i] != b[i]) {
            return i;
        }
    }
    return len;
}

Bytes keccak128(ByteView view) {
    const ethash::hash256 hash{keccak256(view)};
    return Bytes{hash.bytes, 16};
}

}  // namespace trestle

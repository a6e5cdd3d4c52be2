// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "decode.hpp"

namespace trestle::codec {

tl::expected<uint64_t, DecodingError> decode_compact(ByteView& from) noexcept {
    if (from.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    const uint8_t mode{static_cast<uint8_t>(from[0] & 0b11)};
    uint64_t value{0};
    switch (mode) {
        case 0b00:
            value = from[0] >> 2;
            from.remove_prefix(1);
            return value;
        case 0b01: {
            if (from.size() < 2) {
                return tl::unexpected{DecodingError::kInputTooShort};
            }
            value = intx::le::unsafe::load<uint16_t>(from.data()) >> 2;
            if (value <= kMaxSingleByteCompact) {
                return tl::unexpected{DecodingError::kNonCanonicalSize};
            }
            from.remove_prefix(2);
            return value;
        }
        case 0b10: {
            if (from.size() < 4) {
                return tl::unexpected{DecodingError::kInputTooShort};
            }
            value = intx::le::unsafe::load<uint32_t>(from.data()) >> 2;
            if (value <= kMaxTwoBytesCompact) {
                return tl::unexpected{DecodingError::kNonCanonicalSize};
            }
            from.remove_prefix(4);
            return value;
        }
        default: {
            const size_t bytes_count{static_cast<size_t>(from[0] >> 2) + 4};
            if (bytes_count > sizeof(uint64_t)) {
                return tl::unexpected{DecodingError::kOverflow};
            }
            if (from.size() < 1 + bytes_count) {
                return tl::unexpected{DecodingError::kInputTooShort};
            }
            for (size_t i{0}; i < bytes_count; ++i) {
                value |= static_cast<uint64_t>(from[1 + i]) << (8 * i);
            }
            if (value <= kMaxFourBytesCompact || intx::count_significant_bytes(value) != bytes_count) {
                return tl::unexpected{DecodingError::kNonCanonicalSize};
            }
            from.remove_prefix(1 + bytes_count);
            return value;
        }
    }
}

DecodingResult decode(ByteView& from, bool& to, Leftover mode) noexcept {
    if (from.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    if (from[0] > 1) {
        return tl::unexpected{DecodingError::kInvalidBool};
    }
    to = from[0] == 1;
    from.remove_prefix(1);
    return check_leftover(from, mode);
}

DecodingResult decode(ByteView& from, Bytes& to, Leftover mode) noexcept {
    const auto length{decode_compact(from)};
    if (!length) {
        return tl::unexpected{length.error()};
    }
    if (from.size() < *length) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    to = from.substr(0, static_cast<size_t>(*length));
    from.remove_prefix(static_cast<size_t>(*length));
    return check_leftover(from, mode);
}

DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode) noexcept {
    if (from.size() < sizeof(to.bytes)) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    std::memcpy(to.bytes, from.data(), sizeof(to.bytes));
    from.remove_prefix(sizeof(to.bytes));
    return check_leftover(from, mode);
}

DecodingResult decode(ByteView& from, evmc::address& to, Leftover mode) noexcept {
    if (from.size() < sizeof(to.bytes)) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    std::memcpy(to.bytes, from.data(), sizeof(to.bytes));
    from.remove_prefix(sizeof(to.bytes));
    return check_leftover(from, mode);
}

}  // namespace trestle::codec

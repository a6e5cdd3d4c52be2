// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstring>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <trestle/core/codec/encode.hpp>
#include <trestle/core/common/base.hpp>
#include <trestle/core/common/bytes.hpp>
#include <trestle/core/common/decoding_result.hpp>

namespace trestle::codec {

// Whether to allow or prohibit trailing characters in an input after decoding.
// If prohibited and the input does contain extra characters, decode() returns kInputTooLong.
enum class Leftover {
    kProhibit,
    kAllow,
};

inline DecodingResult check_leftover(ByteView from, Leftover mode) noexcept {
    if (mode != Leftover::kAllow && !from.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

//! Consumes a compact encoded integer, rejecting non canonical forms
tl::expected<uint64_t, DecodingError> decode_compact(ByteView& from) noexcept;

template <UnsignedIntegral T>
DecodingResult decode(ByteView& from, T& to, Leftover mode = Leftover::kProhibit) noexcept {
    if (from.size() < sizeof(T)) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    to = intx::le::unsafe::load<T>(from.data());
    from.remove_prefix(sizeof(T));
    return check_leftover(from, mode);
}

DecodingResult decode(ByteView& from, bool& to, Leftover mode = Leftover::kProhibit) noexcept;

DecodingResult decode(ByteView& from, Bytes& to, Leftover mode = Leftover::kProhibit) noexcept;

DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode = Leftover::kProhibit) noexcept;

DecodingResult decode(ByteView& from, evmc::address& to, Leftover mode = Leftover::kProhibit) noexcept;

template <size_t N>
DecodingResult decode(ByteView& from, std::array<uint8_t, N>& to, Leftover mode = Leftover::kProhibit) noexcept {
    if (from.size() < N) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    std::memcpy(to.data(), from.data(), N);
    from.remove_prefix(N);
    return check_leftover(from, mode);
}

template <class T>
DecodingResult decode(ByteView& from, std::optional<T>& to, Leftover mode = Leftover::kProhibit) noexcept {
    if (from.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    const uint8_t tag{from[0]};
    from.remove_prefix(1);
    if (tag == 0) {
        to.reset();
        return check_leftover(from, mode);
    }
    if (tag != 1) {
        return tl::unexpected{DecodingError::kInvalidOptionTag};
    }
    to.emplace();
    return decode(from, *to, mode);
}

//! Decodes a compact length prefixed sequence of items of type T
template <class T>
DecodingResult decode(ByteView& from, std::vector<T>& to, Leftover mode = Leftover::kProhibit) noexcept {
    const auto count{decode_compact(from)};
    if (!count) {
        return tl::unexpected{count.error()};
    }
    // Every item takes at least one byte: reject counts the input cannot possibly hold
    if (*count > from.size()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }

    to.clear();
    to.reserve(static_cast<size_t>(*count));
    for (uint64_t i{0}; i < *count; ++i) {
        to.emplace_back();
        if (DecodingResult res{decode(from, to.back(), Leftover::kAllow)}; !res) {
            return res;
        }
    }
    return check_leftover(from, mode);
}

template <typename Arg1, typename Arg2>
DecodingResult decode_items(ByteView& from, Arg1& arg1, Arg2& arg2) noexcept {
    if (DecodingResult res{decode(from, arg1, Leftover::kAllow)}; !res) {
        return res;
    }
    return decode(from, arg2, Leftover::kAllow);
}

template <typename Arg1, typename Arg2, typename... Args>
DecodingResult decode_items(ByteView& from, Arg1& arg1, Arg2& arg2, Args&... args) noexcept {
    if (DecodingResult res{decode(from, arg1, Leftover::kAllow)}; !res) {
        return res;
    }
    return decode_items(from, arg2, args...);
}

//! Decodes a fixed sequence of fields of various types, checking leftover at the end
template <typename Arg1, typename Arg2, typename... Args>
DecodingResult decode(ByteView& from, Leftover mode, Arg1& arg1, Arg2& arg2, Args&... args) noexcept {
    if (DecodingResult res{decode_items(from, arg1, arg2, args...)}; !res) {
        return res;
    }
    return check_leftover(from, mode);
}

}  // namespace trestle::codec

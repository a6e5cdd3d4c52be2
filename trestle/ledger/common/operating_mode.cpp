// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "operating_mode.hpp"

namespace trestle::codec {

template <class Mode>
static DecodingResult decode_mode(ByteView& from, Mode& to, uint8_t max_value, Leftover mode) noexcept {
    uint8_t raw{0};
    if (DecodingResult res{decode(from, raw, Leftover::kAllow)}; !res) {
        return res;
    }
    if (raw > max_value) {
        return tl::unexpected{DecodingError::kInvalidVariant};
    }
    to = static_cast<Mode>(raw);
    return check_leftover(from, mode);
}

void encode(Bytes& to, ledger::BasicOperatingMode mode) {
    to.push_back(static_cast<uint8_t>(mode));
}

void encode(Bytes& to, ledger::MessagesOperatingMode mode) {
    to.push_back(static_cast<uint8_t>(mode));
}

DecodingResult decode(ByteView& from, ledger::BasicOperatingMode& to, Leftover mode) noexcept {
    return decode_mode(from, to, static_cast<uint8_t>(ledger::BasicOperatingMode::kHalted), mode);
}

DecodingResult decode(ByteView& from, ledger::MessagesOperatingMode& to, Leftover mode) noexcept {
    return decode_mode(from, to, static_cast<uint8_t>(ledger::MessagesOperatingMode::kHalted), mode);
}

}  // namespace trestle::codec

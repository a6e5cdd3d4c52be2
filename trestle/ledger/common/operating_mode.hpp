// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <trestle/core/codec/decode.hpp>

namespace trestle::ledger {

enum class BasicOperatingMode : uint8_t {
    kNormal,
    kHalted,
};

enum class MessagesOperatingMode : uint8_t {
    kNormal,
    //! New outbound messages are refused, delivery and confirmation keep working
    kRejectingOutboundMessages,
    kHalted,
};

}  // namespace trestle::ledger

namespace trestle::codec {

void encode(Bytes& to, ledger::BasicOperatingMode mode);
void encode(Bytes& to, ledger::MessagesOperatingMode mode);

DecodingResult decode(ByteView& from, ledger::BasicOperatingMode& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, ledger::MessagesOperatingMode& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace trestle::codec

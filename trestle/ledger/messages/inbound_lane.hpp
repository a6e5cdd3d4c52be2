// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <trestle/core/types/lane.hpp>

namespace trestle::ledger {

enum class [[nodiscard]] ReceptionResult {
    kOk,
    kInvalidNonce,                // Nonce is not the next one expected by the lane
    kTooManyUnrewardedRelayers,   // Relayer would need a new entry and all entries are taken
    kTooManyUnconfirmedMessages,  // Lane holds too many messages the sending chain has not confirmed
};

struct InboundLaneLimits {
    MessageNonce max_unrewarded_relayer_entries{8};
    MessageNonce max_unconfirmed_messages{128};
};

//! Applies the outbound lane state proven at the sending chain.
//! Returns the new last confirmed nonce, std::nullopt when nothing changed or the state is invalid.
std::optional<MessageNonce> receive_state_update(InboundLaneData& data, const OutboundLaneData& outbound_lane_data);

//! Whether the lane accepts message nonce delivered by relayer
ReceptionResult check_message_reception(const InboundLaneData& data, const InboundLaneLimits& limits,
                                        const AccountId& relayer, MessageNonce nonce);

//! Records a received message, extending the entry of relayer when it delivered the previous message too
void note_received_message(InboundLaneData& data, const AccountId& relayer, MessageNonce nonce, bool dispatch_result);

}  // namespace trestle::ledger

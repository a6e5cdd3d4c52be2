// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "inbound_lane.hpp"

#include <cstddef>

#include <trestle/infra/common/ensure.hpp>

namespace trestle::ledger {

std::optional<MessageNonce> receive_state_update(InboundLaneData& data, const OutboundLaneData& outbound_lane_data) {
    const MessageNonce new_confirmed_nonce{outbound_lane_data.latest_received_nonce};
    if (new_confirmed_nonce > data.last_delivered_nonce()) {
        // sending chain can't confirm messages we have never delivered
        return std::nullopt;
    }
    if (new_confirmed_nonce <= data.last_confirmed_nonce) {
        return std::nullopt;
    }

    data.last_confirmed_nonce = new_confirmed_nonce;
    while (!data.relayers.empty() && data.relayers.front().messages.end <= new_confirmed_nonce) {
        data.relayers.pop_front();
    }
    if (!data.relayers.empty()) {
        auto& front{data.relayers.front().messages};
        if (front.begin <= new_confirmed_nonce) {
            const auto confirmed{static_cast<std::ptrdiff_t>(new_confirmed_nonce + 1 - front.begin)};
            front.dispatch_results.erase(front.dispatch_results.begin(), front.dispatch_results.begin() + confirmed);
            front.begin = new_confirmed_nonce + 1;
        }
    }
    return new_confirmed_nonce;
}

ReceptionResult check_message_reception(const InboundLaneData& data, const InboundLaneLimits& limits,
                                        const AccountId& relayer, MessageNonce nonce) {
    const MessageNonce last_delivered_nonce{data.last_delivered_nonce()};
    if (last_delivered_nonce == kMaxMessageNonce || nonce != last_delivered_nonce + 1) {
        return ReceptionResult::kInvalidNonce;
    }
    const bool needs_new_entry{data.relayers.empty() || data.relayers.back().relayer != relayer};
    if (needs_new_entry && data.relayers.size() >= limits.max_unrewarded_relayer_entries) {
        return ReceptionResult::kTooManyUnrewardedRelayers;
    }
    if (nonce - data.last_confirmed_nonce > limits.max_unconfirmed_messages) {
        return ReceptionResult::kTooManyUnconfirmedMessages;
    }
    return ReceptionResult::kOk;
}

void note_received_message(InboundLaneData& data, const AccountId& relayer, MessageNonce nonce,
                           bool dispatch_result) {
    ensure_invariant(nonce == data.last_delivered_nonce() + 1, "inbound lane: out of order message");
    if (!data.relayers.empty() && data.relayers.back().relayer == relayer) {
        data.relayers.back().messages.note_dispatched_message(dispatch_result);
        return;
    }
    data.relayers.push_back(UnrewardedRelayer{relayer, DeliveredMessages::new_with(nonce, dispatch_result)});
}

}  // namespace trestle::ledger

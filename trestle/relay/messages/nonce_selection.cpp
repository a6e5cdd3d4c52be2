// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "nonce_selection.hpp"

#include <algorithm>

#include <trestle/infra/common/log.hpp>

namespace trestle::relay {

std::optional<DeliverySelection> select_nonces_for_delivery(const DeliveryLaneState& state,
                                                            const std::vector<MessageDetails>& queued,
                                                            const DeliveryLimits& limits) {
    const UnrewardedRelayersState& relayers{state.unrewarded_relayers};
    const MessageNonce last_delivered{relayers.last_delivered_nonce};

    // target learns the confirmations source has seen when the proof carries the outbound lane state
    const bool outbound_state_proof_required{state.latest_confirmed_at_target < state.latest_confirmed_at_source};

    const bool unrewarded_limit_reached{relayers.unrewarded_relayer_entries >= limits.max_unrewarded_relayer_entries ||
                                        relayers.total_messages >= limits.max_unconfirmed_messages};
    if (unrewarded_limit_reached) {
        // the oldest entry must be confirmed to make room
        const MessageNonce confirmations_being_proved{
            state.latest_confirmed_at_source > state.latest_confirmed_at_target
                ? state.latest_confirmed_at_source - state.latest_confirmed_at_target
                : 0};
        if (confirmations_being_proved < relayers.messages_in_oldest_entry) {
            return std::nullopt;
        }
    }

    const MessageNonce future_confirmed{outbound_state_proof_required ? state.latest_confirmed_at_source
                                                                      : state.latest_confirmed_at_target};
    const MessageNonce unconfirmed{last_delivered > future_confirmed ? last_delivered - future_confirmed : 0};
    const MessageNonce max_nonces{std::min(
        limits.max_unconfirmed_messages > unconfirmed ? limits.max_unconfirmed_messages - unconfirmed : 0,
        limits.max_messages_in_single_batch)};

    DeliverySelection selection{
        .nonces = {last_delivered + 1, last_delivered},
        .outbound_state_proof_required = outbound_state_proof_required,
    };
    for (const auto& details : queued) {
        if (selection.nonces.size() >= max_nonces || details.nonce != selection.nonces.end + 1) {
            break;
        }
        const Weight weight{selection.dispatch_weight.saturating_add(details.dispatch_weight)};
        const size_t size{selection.payloads_size + details.size};
        if (weight.any_gt(limits.max_messages_weight_in_single_batch) ||
            size > limits.max_messages_size_in_single_batch) {
            if (selection.nonces.empty()) {
                TRESTLE_WARN_M("Message does not fit a delivery transaction",
                               {"nonce", std::to_string(details.nonce), "size", std::to_string(details.size),
                                "dispatch_ref_time", std::to_string(details.dispatch_weight.ref_time)});
            }
            break;
        }
        selection.nonces.end = details.nonce;
        selection.dispatch_weight = weight;
        selection.payloads_size = size;
    }

    if (selection.nonces.empty() && !(unrewarded_limit_reached && outbound_state_proof_required)) {
        return std::nullopt;
    }
    return selection;
}

}  // namespace trestle::relay

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "lane_params.hpp"

#include <algorithm>
#include <string>

namespace trestle::relay {

MessageLaneParams make_message_lane_params(const MessageLimits& limits, const LoopTiming& timing,
                                           const ledger::WeightCalibrator& calibrator) {
    const ledger::DeliveryTransactionLimits tx_limits{
        calibrator.select_delivery_transaction_limits(limits.max_extrinsic_weight, limits.max_unconfirmed_messages)};
    MessageNonce max_messages{tx_limits.max_messages_in_single_batch};
    if (limits.max_messages_in_single_batch != 0) {
        max_messages = std::min(max_messages, limits.max_messages_in_single_batch);
    }
    return MessageLaneParams{
        .timing = timing,
        .delivery_limits =
            DeliveryLimits{
                .max_unrewarded_relayer_entries = limits.max_unrewarded_relayer_entries,
                .max_unconfirmed_messages = limits.max_unconfirmed_messages,
                .max_messages_in_single_batch = max_messages,
                .max_messages_weight_in_single_batch = tx_limits.max_messages_weight_in_single_batch,
                .max_messages_size_in_single_batch = limits.max_extrinsic_size / 3,
            },
        .max_extrinsic_weight = limits.max_extrinsic_weight,
        .max_extrinsic_size = limits.max_extrinsic_size,
    };
}

void set_lane_nonce(Metrics* metrics, const LaneId& lane, std::string_view type, MessageNonce nonce) {
    if (!metrics) {
        return;
    }
    metrics->gauge("lane_state_nonces", {{"lane", trestle::to_string(lane)}, {"type", std::string{type}}})
        .set(static_cast<double>(nonce));
}

}  // namespace trestle::relay

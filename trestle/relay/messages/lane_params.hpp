// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <trestle/core/types/lane.hpp>
#include <trestle/core/types/weight.hpp>
#include <trestle/ledger/messages/weights.hpp>
#include <trestle/relay/common/bridge_config.hpp>
#include <trestle/relay/common/metrics.hpp>
#include <trestle/relay/messages/nonce_selection.hpp>

namespace trestle::relay {

struct MessageLaneParams {
    LoopTiming timing;
    DeliveryLimits delivery_limits;
    //! Limits of a transaction at either chain
    Weight max_extrinsic_weight;
    size_t max_extrinsic_size{0};
    bool dry_run{false};
    //! Account whose rewards are exported
    AccountId relayer;
};

//! Derives the delivery batch limits from the transaction limits of the target and the benchmarked weights.
//! Throws std::logic_error when a single message can't fit a transaction.
MessageLaneParams make_message_lane_params(const MessageLimits& limits, const LoopTiming& timing,
                                           const ledger::WeightCalibrator& calibrator);

//! Updates lane_state_nonces{lane, type}
void set_lane_nonce(Metrics* metrics, const LaneId& lane, std::string_view type, MessageNonce nonce);

}  // namespace trestle::relay

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <trestle/infra/concurrency/task.hpp>
#include <trestle/ledger/messages/weights.hpp>
#include <trestle/relay/common/metrics.hpp>
#include <trestle/relay/messages/lane_params.hpp>
#include <trestle/relay/messages/messages_clients.hpp>

namespace trestle::relay {

enum class DeliveryOutcome {
    kNoFinalizedSource,         // Target has not finalized any source header yet
    kNothingToDeliver,          // Every provable message is delivered
    kWaitingForConfirmations,   // Target lane is full until source confirms deliveries
    kDelivered,
    kDryRun,
};

//! Delivers the messages of a lane from source to target
class DeliveryRace {
  public:
    DeliveryRace(MessagesSource& source, MessagesTarget& target, const ledger::WeightCalibrator& calibrator,
                 const MessageLaneParams& params, Metrics* metrics = nullptr)
        : source_{source}, target_{target}, calibrator_{calibrator}, params_{params}, metrics_{metrics} {}

    Task<DeliveryOutcome> run_iteration();

  private:
    //! Messages following the last delivered one, with their dispatch weights at target
    Task<std::vector<MessageDetails>> queued_messages(const HeaderId& at, MessageNonce last_delivered,
                                                      MessageNonce latest_generated);
    //! Proves selection, dropping its last messages while the transaction exceeds the limits of target
    Task<PreparedMessagesProof> prove_within_limits(const HeaderId& at, DeliverySelection& selection,
                                                    const std::vector<MessageDetails>& queued);
    Weight delivery_weight(const PreparedMessagesProof& prepared, const DeliverySelection& selection) const;

    MessagesSource& source_;
    MessagesTarget& target_;
    const ledger::WeightCalibrator& calibrator_;
    const MessageLaneParams& params_;
    Metrics* metrics_;
};

}  // namespace trestle::relay

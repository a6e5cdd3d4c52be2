// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <trestle/infra/concurrency/task.hpp>
#include <trestle/ledger/messages/weights.hpp>
#include <trestle/relay/common/metrics.hpp>
#include <trestle/relay/messages/lane_params.hpp>
#include <trestle/relay/messages/messages_clients.hpp>

namespace trestle::relay {

enum class ConfirmationOutcome {
    kNoFinalizedTarget,  // Source has not finalized any target header yet
    kNothingToConfirm,   // Source knows every delivery proven by the finalized target header
    kConfirmed,
    kDryRun,
};

//! Proves the deliveries of a lane at target back to source, which rewards the relayers
class ConfirmationRace {
  public:
    ConfirmationRace(MessagesSource& source, MessagesTarget& target, const ledger::WeightCalibrator& calibrator,
                     const MessageLaneParams& params, Metrics* metrics = nullptr)
        : source_{source}, target_{target}, calibrator_{calibrator}, params_{params}, metrics_{metrics} {}

    Task<ConfirmationOutcome> run_iteration();

  private:
    Task<void> update_reward_metrics();

    MessagesSource& source_;
    MessagesTarget& target_;
    const ledger::WeightCalibrator& calibrator_;
    const MessageLaneParams& params_;
    Metrics* metrics_;
};

}  // namespace trestle::relay

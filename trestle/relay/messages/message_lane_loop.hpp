// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <trestle/infra/concurrency/task.hpp>
#include <trestle/ledger/messages/weights.hpp>
#include <trestle/relay/common/error.hpp>
#include <trestle/relay/common/metrics.hpp>
#include <trestle/relay/messages/confirmation_race.hpp>
#include <trestle/relay/messages/delivery_race.hpp>
#include <trestle/relay/messages/lane_params.hpp>
#include <trestle/relay/messages/messages_clients.hpp>

namespace trestle::relay {

//! Relays one lane: delivers messages to target and confirms the deliveries back to source.
//! The two races run independently, an error halting one of them leaves the other running.
class MessageLaneLoop {
  public:
    MessageLaneLoop(MessagesSource& source, MessagesTarget& target, const ledger::WeightCalibrator& calibrator,
                    MessageLaneParams params, Metrics* metrics = nullptr);

    //! Runs both races until cancelled or until both are halted
    Task<void> run();

    DeliveryRace& delivery() noexcept { return delivery_; }
    ConfirmationRace& confirmation() noexcept { return confirmation_; }

    //! Error kind that halted a race
    std::optional<ErrorKind> delivery_halted() const noexcept { return delivery_halted_; }
    std::optional<ErrorKind> confirmation_halted() const noexcept { return confirmation_halted_; }

  private:
    Task<void> run_race(size_t index);

    MessagesSource& source_;
    MessagesTarget& target_;
    MessageLaneParams params_;
    DeliveryRace delivery_;
    ConfirmationRace confirmation_;
    std::optional<ErrorKind> delivery_halted_;
    std::optional<ErrorKind> confirmation_halted_;
};

}  // namespace trestle::relay

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <deque>

#include <trestle/core/state/kv_store.hpp>
#include <trestle/core/types/lane.hpp>
#include <trestle/core/types/weight.hpp>

namespace trestle::ledger {

//! Interpreter of the messages received from the bridged chain
class MessageDispatch {
  public:
    virtual ~MessageDispatch() = default;

    //! Whether incoming messages can be dispatched right now
    virtual bool is_active() const = 0;

    virtual Weight dispatch_weight(const Message& message) const = 0;

    //! Returns whether the message was dispatched successfully.
    //! Dispatch failures are recorded in the lane, they never fail the delivery.
    virtual bool dispatch(state::KeyValueStore& state, const Message& message) = 0;
};

//! Pays relayers whose deliveries have been confirmed by the bridged chain
class DeliveryConfirmationPayments {
  public:
    virtual ~DeliveryConfirmationPayments() = default;

    //! Rewards delivery of the confirmed nonces in received_range. Returns the number of rewarded relayers.
    virtual MessageNonce pay_reward(state::KeyValueStore& state, const LaneId& lane,
                                    const std::deque<UnrewardedRelayer>& messages_relayers,
                                    const AccountId& confirmation_relayer, const NonceRange& received_range) = 0;
};

}  // namespace trestle::ledger

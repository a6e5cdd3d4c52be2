// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <trestle/core/types/lane.hpp>
#include <trestle/core/types/weight.hpp>

namespace trestle::relay {

struct DeliveryLimits {
    MessageNonce max_unrewarded_relayer_entries{8};
    MessageNonce max_unconfirmed_messages{128};
    MessageNonce max_messages_in_single_batch{1};
    Weight max_messages_weight_in_single_batch;
    size_t max_messages_size_in_single_batch{0};
};

//! Lane state both chains agree on when a delivery transaction is built
struct DeliveryLaneState {
    //! Latest received nonce at source, read at the source header finalized at target
    MessageNonce latest_confirmed_at_source{0};
    //! Inbound lane at target
    MessageNonce latest_confirmed_at_target{0};
    UnrewardedRelayersState unrewarded_relayers;
};

struct DeliverySelection {
    //! Empty when the transaction only carries the outbound lane state to unblock the lane
    NonceRange nonces;
    bool outbound_state_proof_required{false};
    Weight dispatch_weight;
    size_t payloads_size{0};

    friend bool operator==(const DeliverySelection&, const DeliverySelection&) = default;
};

//! Selects the messages of the next delivery transaction among queued, the details of the messages following the
//! last one delivered in order. Returns std::nullopt when target can't accept anything before new confirmations.
std::optional<DeliverySelection> select_nonces_for_delivery(const DeliveryLaneState& state,
                                                            const std::vector<MessageDetails>& queued,
                                                            const DeliveryLimits& limits);

}  // namespace trestle::relay

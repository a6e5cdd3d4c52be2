// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <trestle/core/types/lane.hpp>
#include <trestle/core/types/weight.hpp>

namespace trestle::ledger {

//! Benchmarked weights of the messages ledger calls
struct WeightInfo {
    Weight receive_single_message_proof;
    Weight receive_two_messages_proof;
    Weight receive_single_message_proof_with_outbound_lane_state;
    Weight receive_single_message_proof_1_kb;
    Weight receive_single_message_proof_16_kb;
    Weight receive_delivery_proof_for_single_message;
    Weight receive_delivery_proof_for_two_messages_by_single_relayer;
    Weight receive_delivery_proof_for_two_messages_by_two_relayers;

    //! Weights measured on the dev chain
    static WeightInfo reference();
};

struct DeliveryTransactionLimits {
    MessageNonce max_messages_in_single_batch{0};
    Weight max_messages_weight_in_single_batch;
};

//! Bridged chain sizes the weight formulas are calibrated for
struct ProofSizeParams {
    //! Size of a message the benchmarks were run with
    size_t expected_default_message_length{128};
    //! Proof bytes every proof carries regardless of the number of messages
    size_t expected_extra_storage_proof_size{1024};
};

//! Derives per-call weights of message delivery and confirmation from benchmark samples
class WeightCalibrator {
  public:
    explicit WeightCalibrator(WeightInfo info, ProofSizeParams sizes = {}) : info_{info}, sizes_{sizes} {}

    const WeightInfo& info() const noexcept { return info_; }

    Weight receive_messages_proof_overhead() const;
    Weight receive_messages_proof_messages_overhead(MessageNonce messages) const;
    Weight receive_messages_proof_outbound_lane_state_overhead() const;
    Weight storage_proof_size_overhead(size_t proof_size) const;

    Weight receive_messages_delivery_proof_overhead() const;
    Weight receive_messages_delivery_proof_messages_overhead(MessageNonce messages) const;
    Weight receive_messages_delivery_proof_relayers_overhead(MessageNonce relayers) const;

    Weight receive_messages_proof_weight(size_t proof_size, MessageNonce messages_count,
                                         const Weight& dispatch_weight) const;
    Weight receive_messages_delivery_proof_weight(size_t proof_size,
                                                  const UnrewardedRelayersState& relayers_state) const;

    //! Broken benchmark assumptions, empty when the weights are usable
    std::vector<std::string> validate(const Weight& max_extrinsic_weight, size_t max_incoming_message_proof_size,
                                      const Weight& max_incoming_message_dispatch_weight) const;

    //! Splits a delivery transaction weight between the call itself (1/3) and message dispatch (2/3)
    DeliveryTransactionLimits select_delivery_transaction_limits(const Weight& max_extrinsic_weight,
                                                                 MessageNonce max_unconfirmed_messages) const;

  private:
    WeightInfo info_;
    ProofSizeParams sizes_;
};

}  // namespace trestle::ledger

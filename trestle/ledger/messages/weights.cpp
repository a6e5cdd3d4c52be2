// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "weights.hpp"

#include <algorithm>
#include <limits>
#include <optional>

#include <absl/strings/str_cat.h>

#include <trestle/infra/common/ensure.hpp>

namespace trestle::ledger {

namespace {

    constexpr size_t kProofSizeSampleDelta{15_Kibi};

    Weight divide(const Weight& weight, uint64_t divisor) {
        return {weight.ref_time / divisor, weight.proof_size / divisor};
    }

    //! Smallest quotient over the components with a non zero divisor
    std::optional<uint64_t> min_components_checked_div(const Weight& dividend, const Weight& divisor) {
        std::optional<uint64_t> result;
        if (divisor.ref_time != 0) {
            result = dividend.ref_time / divisor.ref_time;
        }
        if (divisor.proof_size != 0) {
            const uint64_t quotient{dividend.proof_size / divisor.proof_size};
            result = result ? std::min(*result, quotient) : quotient;
        }
        return result;
    }

}  // namespace

WeightInfo WeightInfo::reference() {
    return {
        .receive_single_message_proof = Weight::from_parts(40'000'000, 52'000),
        .receive_two_messages_proof = Weight::from_parts(50'000'000, 54'000),
        .receive_single_message_proof_with_outbound_lane_state = Weight::from_parts(42'000'000, 52'500),
        .receive_single_message_proof_1_kb = Weight::from_parts(41'000'000, 53'000),
        .receive_single_message_proof_16_kb = Weight::from_parts(56'000'000, 68'360),
        .receive_delivery_proof_for_single_message = Weight::from_parts(35'000'000, 40'000),
        .receive_delivery_proof_for_two_messages_by_single_relayer = Weight::from_parts(38'000'000, 40'100),
        .receive_delivery_proof_for_two_messages_by_two_relayers = Weight::from_parts(45'000'000, 42'600),
    };
}

Weight WeightCalibrator::receive_messages_proof_overhead() const {
    return info_.receive_single_message_proof.saturating_mul(2).saturating_sub(info_.receive_two_messages_proof);
}

Weight WeightCalibrator::receive_messages_proof_messages_overhead(MessageNonce messages) const {
    return info_.receive_two_messages_proof.saturating_sub(info_.receive_single_message_proof).saturating_mul(messages);
}

Weight WeightCalibrator::receive_messages_proof_outbound_lane_state_overhead() const {
    return info_.receive_single_message_proof_with_outbound_lane_state.saturating_sub(
        info_.receive_single_message_proof);
}

Weight WeightCalibrator::storage_proof_size_overhead(size_t proof_size) const {
    const Weight byte_weight{divide(
        info_.receive_single_message_proof_16_kb.saturating_sub(info_.receive_single_message_proof_1_kb),
        kProofSizeSampleDelta)};
    return byte_weight.saturating_mul(proof_size);
}

Weight WeightCalibrator::receive_messages_delivery_proof_overhead() const {
    return info_.receive_delivery_proof_for_single_message.saturating_mul(2).saturating_sub(
        info_.receive_delivery_proof_for_two_messages_by_single_relayer);
}

Weight WeightCalibrator::receive_messages_delivery_proof_messages_overhead(MessageNonce messages) const {
    return info_.receive_delivery_proof_for_two_messages_by_single_relayer
        .saturating_sub(info_.receive_delivery_proof_for_single_message)
        .saturating_mul(messages);
}

Weight WeightCalibrator::receive_messages_delivery_proof_relayers_overhead(MessageNonce relayers) const {
    return info_.receive_delivery_proof_for_two_messages_by_two_relayers
        .saturating_sub(info_.receive_delivery_proof_for_two_messages_by_single_relayer)
        .saturating_mul(relayers);
}

Weight WeightCalibrator::receive_messages_proof_weight(size_t proof_size, MessageNonce messages_count,
                                                       const Weight& dispatch_weight) const {
    // proof of the first message is covered by the benchmarks, bigger messages pay for their bytes
    const MessageNonce extra_messages{messages_count > 0 ? messages_count - 1 : 0};
    const size_t expected_proof_size{sizes_.expected_default_message_length * extra_messages +
                                     sizes_.expected_extra_storage_proof_size};
    const size_t extra_proof_size{proof_size > expected_proof_size ? proof_size - expected_proof_size : 0};

    return receive_messages_proof_overhead()
        .saturating_add(receive_messages_proof_messages_overhead(messages_count))
        .saturating_add(dispatch_weight)
        .saturating_add(storage_proof_size_overhead(extra_proof_size));
}

Weight WeightCalibrator::receive_messages_delivery_proof_weight(
    size_t proof_size, const UnrewardedRelayersState& relayers_state) const {
    const size_t expected_proof_size{sizes_.expected_extra_storage_proof_size};
    const size_t extra_proof_size{proof_size > expected_proof_size ? proof_size - expected_proof_size : 0};

    return receive_messages_delivery_proof_overhead()
        .saturating_add(receive_messages_delivery_proof_messages_overhead(relayers_state.total_messages))
        .saturating_add(receive_messages_delivery_proof_relayers_overhead(relayers_state.unrewarded_relayer_entries))
        .saturating_add(storage_proof_size_overhead(extra_proof_size));
}

std::vector<std::string> WeightCalibrator::validate(const Weight& max_extrinsic_weight,
                                                    size_t max_incoming_message_proof_size,
                                                    const Weight& max_incoming_message_dispatch_weight) const {
    std::vector<std::string> problems;
    const auto check_positive = [&](const Weight& weight, const char* name) {
        if (weight.ref_time == 0) {
            problems.push_back(absl::StrCat(name, " has zero ref_time"));
        }
    };
    check_positive(receive_messages_proof_overhead(), "receive_messages_proof_overhead");
    check_positive(receive_messages_proof_messages_overhead(1), "receive_messages_proof_messages_overhead");
    check_positive(receive_messages_proof_outbound_lane_state_overhead(),
                   "receive_messages_proof_outbound_lane_state_overhead");
    check_positive(storage_proof_size_overhead(1), "storage_proof_size_overhead");
    check_positive(receive_messages_delivery_proof_overhead(), "receive_messages_delivery_proof_overhead");
    check_positive(receive_messages_delivery_proof_messages_overhead(1),
                   "receive_messages_delivery_proof_messages_overhead");
    check_positive(receive_messages_delivery_proof_relayers_overhead(1),
                   "receive_messages_delivery_proof_relayers_overhead");

    const Weight single_message_weight{
        receive_messages_proof_weight(max_incoming_message_proof_size, 1, max_incoming_message_dispatch_weight)};
    if (single_message_weight.any_gt(max_extrinsic_weight)) {
        problems.push_back(absl::StrCat("single message delivery weight {", single_message_weight.ref_time, ", ",
                                        single_message_weight.proof_size, "} exceeds max extrinsic weight {",
                                        max_extrinsic_weight.ref_time, ", ", max_extrinsic_weight.proof_size, "}"));
    }
    return problems;
}

DeliveryTransactionLimits WeightCalibrator::select_delivery_transaction_limits(
    const Weight& max_extrinsic_weight, MessageNonce max_unconfirmed_messages) const {
    const Weight weight_for_delivery_tx{divide(max_extrinsic_weight, 3)};
    const Weight weight_for_messages_dispatch{max_extrinsic_weight.saturating_sub(weight_for_delivery_tx)};

    const Weight delivery_tx_base_weight{
        receive_messages_proof_overhead().saturating_add(receive_messages_proof_outbound_lane_state_overhead())};
    const Weight delivery_tx_weight_rest{weight_for_delivery_tx.saturating_sub(delivery_tx_base_weight)};
    const MessageNonce max_number_of_messages{
        std::min(min_components_checked_div(delivery_tx_weight_rest, receive_messages_proof_messages_overhead(1))
                     .value_or(std::numeric_limits<uint64_t>::max()),
                 max_unconfirmed_messages)};
    ensure(max_number_of_messages > 0, "max extrinsic weight is too low to deliver a single message");

    return {max_number_of_messages, weight_for_messages_dispatch};
}

}  // namespace trestle::ledger

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "delivery_race.hpp"

#include <algorithm>
#include <variant>

#include <absl/strings/str_cat.h>

#include <trestle/infra/common/log.hpp>
#include <trestle/infra/concurrency/awaitable_wait_for_one.hpp>
#include <trestle/infra/concurrency/timeout.hpp>
#include <trestle/relay/common/error.hpp>

namespace trestle::relay {

Task<DeliveryOutcome> DeliveryRace::run_iteration() {
    using namespace concurrency::awaitable_wait_for_one;

    const std::string lane{trestle::to_string(source_.lane())};
    // the finalized source header and the inbound lane are read at the same target block
    const HeaderId target_best{co_await target_.best_header_id()};
    const auto source_header{co_await target_.best_finalized_source_header(target_best)};
    if (!source_header) {
        TRESTLE_TRACE_M("No source header finalized at target", {"lane", lane, "target", target_.name()});
        co_return DeliveryOutcome::kNoFinalizedSource;
    }
    const OutboundLaneData outbound{co_await source_.outbound_lane_data(*source_header)};
    const InboundLaneData inbound{co_await target_.inbound_lane_data(target_best)};
    const MessageNonce last_delivered{inbound.last_delivered_nonce()};
    if (last_delivered > outbound.latest_generated_nonce) {
        // deliveries are proven at source headers finalized at target, the lane states diverged
        throw RelayError{ErrorKind::kOrderingViolation,
                         absl::StrCat("lane ", lane, " at ", target_.name(), " received nonce ", last_delivered,
                                      " never generated at ", source_.name(), " block ", source_header->to_string())};
    }
    set_lane_nonce(metrics_, source_.lane(), "source_latest_generated", outbound.latest_generated_nonce);
    set_lane_nonce(metrics_, source_.lane(), "target_latest_received", last_delivered);
    set_lane_nonce(metrics_, source_.lane(), "target_latest_confirmed", inbound.last_confirmed_nonce);

    const std::vector<MessageDetails> queued{
        co_await queued_messages(*source_header, last_delivered, outbound.latest_generated_nonce)};
    const DeliveryLaneState state{
        .latest_confirmed_at_source = outbound.latest_received_nonce,
        .latest_confirmed_at_target = inbound.last_confirmed_nonce,
        .unrewarded_relayers = UnrewardedRelayersState::from(inbound),
    };
    auto selection{select_nonces_for_delivery(state, queued, params_.delivery_limits)};
    if (!selection) {
        if (last_delivered >= outbound.latest_generated_nonce) {
            co_return DeliveryOutcome::kNothingToDeliver;
        }
        TRESTLE_DEBUG_M("Waiting for delivery confirmations",
                        {"lane", lane, "last_delivered", std::to_string(last_delivered),
                         "unrewarded_relayers", std::to_string(state.unrewarded_relayers.unrewarded_relayer_entries)});
        co_return DeliveryOutcome::kWaitingForConfirmations;
    }

    const PreparedMessagesProof prepared{co_await prove_within_limits(*source_header, *selection, queued)};
    if (metrics_) {
        const size_t overhead{prepared.proof_size > selection->payloads_size
                                  ? prepared.proof_size - selection->payloads_size
                                  : 0};
        metrics_->gauge("messages_storage_proof_overhead_bytes", {{"lane", lane}})
            .set(static_cast<double>(overhead));
    }

    const std::string begin{std::to_string(selection->nonces.begin)};
    const std::string end{std::to_string(selection->nonces.end)};
    if (params_.dry_run) {
        TRESTLE_INFO_M("Dry run: not delivering messages", {"lane", lane, "begin", begin, "end", end});
        co_return DeliveryOutcome::kDryRun;
    }

    TRESTLE_INFO_M("Delivering messages", {"lane", lane, "source", source_.name(), "target", target_.name(),
                                           "begin", begin, "end", end,
                                           "with_lane_state", selection->outbound_state_proof_required ? "true"
                                                                                                       : "false"});
    auto tracker{co_await target_.submit_messages_proof(prepared.proof, selection->nonces.size(),
                                                        selection->dispatch_weight)};
    const auto result{co_await (tracker->wait() || concurrency::timeout(params_.timing.stall_timeout))};
    if (!std::get<0>(result).finalized()) {
        throw RelayError{ErrorKind::kTransactionLost,
                         absl::StrCat("delivery of messages [", begin, ", ", end, "] to ", target_.name(), " lost")};
    }

    const InboundLaneData delivered{co_await target_.inbound_lane_data(co_await target_.best_header_id())};
    const bool advanced{selection->nonces.empty()
                            ? delivered.last_confirmed_nonce >= outbound.latest_received_nonce
                            : delivered.last_delivered_nonce() >= selection->nonces.end};
    if (!advanced) {
        throw RelayError{ErrorKind::kTransactionLost,
                         absl::StrCat("messages [", begin, ", ", end, "] not received by ", target_.name())};
    }
    set_lane_nonce(metrics_, source_.lane(), "target_latest_received", delivered.last_delivered_nonce());
    set_lane_nonce(metrics_, source_.lane(), "target_latest_confirmed", delivered.last_confirmed_nonce);
    TRESTLE_INFO_M("Messages delivered", {"lane", lane, "target", target_.name(), "begin", begin, "end", end});
    co_return DeliveryOutcome::kDelivered;
}

Task<std::vector<MessageDetails>> DeliveryRace::queued_messages(const HeaderId& at, MessageNonce last_delivered,
                                                                MessageNonce latest_generated) {
    std::vector<MessageDetails> details;
    if (last_delivered >= latest_generated) {
        co_return details;
    }
    const MessageNonce window{std::max<MessageNonce>(params_.delivery_limits.max_messages_in_single_batch, 1)};
    const NonceRange nonces{last_delivered + 1, std::min(latest_generated, last_delivered + window)};
    const std::vector<Message> messages{co_await source_.messages(at, nonces)};
    if (messages.empty()) {
        co_return details;
    }
    const std::vector<Weight> weights{co_await target_.dispatch_weights(messages)};
    details.reserve(messages.size());
    for (size_t i{0}; i < messages.size(); ++i) {
        details.push_back(MessageDetails{messages[i].key.nonce, weights[i],
                                         static_cast<uint32_t>(messages[i].payload.size())});
    }
    co_return details;
}

Task<PreparedMessagesProof> DeliveryRace::prove_within_limits(const HeaderId& at, DeliverySelection& selection,
                                                              const std::vector<MessageDetails>& queued) {
    while (true) {
        PreparedMessagesProof prepared{
            co_await source_.prove_messages(at, selection.nonces, selection.outbound_state_proof_required)};
        const Weight weight{delivery_weight(prepared, selection)};
        if (weight.all_lte(params_.max_extrinsic_weight) && prepared.proof_size <= params_.max_extrinsic_size) {
            co_return prepared;
        }
        if (selection.nonces.size() <= 1) {
            throw RelayError{ErrorKind::kCapacityExceeded,
                             absl::StrCat("delivery of message ", selection.nonces.begin, " to ", target_.name(),
                                          " exceeds the transaction limits")};
        }
        const MessageDetails& dropped{queued[selection.nonces.size() - 1]};
        TRESTLE_DEBUG_M("Delivery transaction too heavy, dropping message",
                        {"nonce", std::to_string(dropped.nonce), "proof_size", std::to_string(prepared.proof_size)});
        selection.nonces.end = dropped.nonce - 1;
        selection.dispatch_weight = selection.dispatch_weight.saturating_sub(dropped.dispatch_weight);
        selection.payloads_size -= dropped.size;
    }
}

Weight DeliveryRace::delivery_weight(const PreparedMessagesProof& prepared, const DeliverySelection& selection) const {
    Weight weight{calibrator_.receive_messages_proof_weight(prepared.proof_size, selection.nonces.size(),
                                                            selection.dispatch_weight)};
    if (selection.outbound_state_proof_required) {
        weight = weight.saturating_add(calibrator_.receive_messages_proof_outbound_lane_state_overhead());
    }
    return weight;
}

}  // namespace trestle::relay

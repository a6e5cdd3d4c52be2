// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "confirmation_race.hpp"

#include <variant>

#include <absl/strings/str_cat.h>
#include <intx/intx.hpp>

#include <trestle/core/common/util.hpp>
#include <trestle/infra/common/log.hpp>
#include <trestle/infra/concurrency/awaitable_wait_for_one.hpp>
#include <trestle/infra/concurrency/timeout.hpp>
#include <trestle/relay/common/error.hpp>

namespace trestle::relay {

namespace {

    double to_gauge_value(const Balance& balance) {
        return static_cast<double>(static_cast<uint64_t>(balance >> 64)) * 0x1p64 +
               static_cast<double>(static_cast<uint64_t>(balance));
    }

}  // namespace

Task<ConfirmationOutcome> ConfirmationRace::run_iteration() {
    using namespace concurrency::awaitable_wait_for_one;

    const std::string lane{trestle::to_string(source_.lane())};
    const HeaderId source_best{co_await source_.best_header_id()};
    const auto target_header{co_await source_.best_finalized_target_header(source_best)};
    if (!target_header) {
        TRESTLE_TRACE_M("No target header finalized at source", {"lane", lane, "source", source_.name()});
        co_return ConfirmationOutcome::kNoFinalizedTarget;
    }
    const InboundLaneData inbound{co_await target_.inbound_lane_data(*target_header)};
    const OutboundLaneData outbound{co_await source_.outbound_lane_data(source_best)};
    set_lane_nonce(metrics_, source_.lane(), "source_latest_confirmed", outbound.latest_received_nonce);
    if (inbound.last_delivered_nonce() < outbound.latest_received_nonce) {
        throw RelayError{ErrorKind::kOrderingViolation,
                         absl::StrCat("lane ", lane, " at ", source_.name(), " confirmed nonce ",
                                      outbound.latest_received_nonce, " never delivered at ", target_.name(),
                                      " block ", target_header->to_string())};
    }
    if (inbound.last_delivered_nonce() == outbound.latest_received_nonce) {
        co_return ConfirmationOutcome::kNothingToConfirm;
    }

    const UnrewardedRelayersState relayers_state{UnrewardedRelayersState::from(inbound)};
    const MessagesDeliveryProof proof{co_await target_.prove_delivery(*target_header)};
    const Weight weight{calibrator_.receive_messages_delivery_proof_weight(trie::proof_size(proof.storage_proof),
                                                                           relayers_state)};
    if (weight.any_gt(params_.max_extrinsic_weight)) {
        throw RelayError{ErrorKind::kCapacityExceeded,
                         absl::StrCat("delivery confirmation of ", relayers_state.unrewarded_relayer_entries,
                                      " relayer entries exceeds the transaction weight limit of ", source_.name())};
    }

    const std::string confirmed{std::to_string(inbound.last_delivered_nonce())};
    if (params_.dry_run) {
        TRESTLE_INFO_M("Dry run: not confirming deliveries", {"lane", lane, "last_delivered", confirmed});
        co_return ConfirmationOutcome::kDryRun;
    }

    TRESTLE_INFO_M("Confirming deliveries", {"lane", lane, "source", source_.name(), "target", target_.name(),
                                             "last_delivered", confirmed,
                                             "relayers", std::to_string(relayers_state.unrewarded_relayer_entries)});
    auto tracker{co_await source_.submit_delivery_proof(proof, relayers_state)};
    const auto result{co_await (tracker->wait() || concurrency::timeout(params_.timing.stall_timeout))};
    if (!std::get<0>(result).finalized()) {
        throw RelayError{ErrorKind::kTransactionLost,
                         absl::StrCat("confirmation of messages up to ", confirmed, " at ", source_.name(), " lost")};
    }

    const OutboundLaneData after{co_await source_.outbound_lane_data(co_await source_.best_header_id())};
    if (after.latest_received_nonce < inbound.last_delivered_nonce()) {
        throw RelayError{ErrorKind::kTransactionLost,
                         absl::StrCat("messages up to ", confirmed, " not confirmed by ", source_.name())};
    }
    set_lane_nonce(metrics_, source_.lane(), "source_latest_confirmed", after.latest_received_nonce);
    co_await update_reward_metrics();
    TRESTLE_INFO_M("Deliveries confirmed", {"lane", lane, "source", source_.name(), "last_delivered", confirmed});
    co_return ConfirmationOutcome::kConfirmed;
}

Task<void> ConfirmationRace::update_reward_metrics() {
    if (!metrics_) {
        co_return;
    }
    const Balance reward{co_await source_.relayer_reward(params_.relayer)};
    metrics_->gauge("relayer_reward", {{"lane", trestle::to_string(source_.lane())},
                                       {"relayer", to_hex(ByteView{params_.relayer.bytes}, true)}})
        .set(to_gauge_value(reward));
}

}  // namespace trestle::relay

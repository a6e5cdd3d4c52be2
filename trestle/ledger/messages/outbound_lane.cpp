// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "outbound_lane.hpp"

#include <trestle/infra/common/ensure.hpp>

namespace trestle::ledger {

MessageNonce note_sent_message(OutboundLaneData& data) {
    ensure_invariant(data.latest_generated_nonce < kMaxMessageNonce, "outbound lane: nonce overflow");
    return ++data.latest_generated_nonce;
}

tl::expected<std::optional<DeliveredMessages>, ReceptionConfirmationError> confirm_delivery(
    OutboundLaneData& data, MessageNonce max_allowed_messages, MessageNonce latest_delivered_nonce,
    const std::deque<UnrewardedRelayer>& relayers) {
    const DeliveredMessages confirmed{data.latest_received_nonce + 1, latest_delivered_nonce, {}};
    if (confirmed.total_messages() == 0) {
        return std::nullopt;
    }
    if (confirmed.end > data.latest_generated_nonce) {
        return tl::make_unexpected(ReceptionConfirmationError::kFailedToConfirmFutureMessages);
    }
    if (confirmed.total_messages() > max_allowed_messages) {
        return tl::make_unexpected(ReceptionConfirmationError::kTryingToConfirmMoreMessagesThanExpected);
    }
    if (const auto checked{ensure_unrewarded_relayers_are_correct(confirmed.end, relayers)}; !checked) {
        return tl::make_unexpected(checked.error());
    }

    data.latest_received_nonce = confirmed.end;
    return confirmed;
}

tl::expected<void, ReceptionConfirmationError> ensure_unrewarded_relayers_are_correct(
    MessageNonce latest_received_nonce, const std::deque<UnrewardedRelayer>& relayers) {
    if (relayers.empty()) {
        return {};
    }
    MessageNonce expected_entry_begin{relayers.front().messages.begin};
    for (const auto& entry : relayers) {
        if (entry.messages.end < entry.messages.begin) {
            return tl::make_unexpected(ReceptionConfirmationError::kEmptyUnrewardedRelayerEntry);
        }
        if (entry.messages.begin != expected_entry_begin) {
            return tl::make_unexpected(ReceptionConfirmationError::kNonConsecutiveUnrewardedRelayerEntries);
        }
        if (entry.messages.end > latest_received_nonce) {
            return tl::make_unexpected(ReceptionConfirmationError::kFailedToConfirmFutureMessages);
        }
        expected_entry_begin = entry.messages.end + 1;
    }
    return {};
}

}  // namespace trestle::ledger

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <deque>
#include <optional>

#include <tl/expected.hpp>

#include <trestle/core/types/lane.hpp>

namespace trestle::ledger {

enum class [[nodiscard]] ReceptionConfirmationError {
    kFailedToConfirmFutureMessages,            // Bridged chain claims to have received messages never sent
    kEmptyUnrewardedRelayerEntry,              // Relayer entry without messages
    kNonConsecutiveUnrewardedRelayerEntries,   // Relayer entries leave a gap or overlap
    kTryingToConfirmMoreMessagesThanExpected,  // More messages confirmed than declared by the submitter
};

//! Allocates the next nonce of the lane
MessageNonce note_sent_message(OutboundLaneData& data);

//! Advances latest_received_nonce up to latest_delivered_nonce.
//! Returns the newly confirmed range, std::nullopt when every nonce was already confirmed.
tl::expected<std::optional<DeliveredMessages>, ReceptionConfirmationError> confirm_delivery(
    OutboundLaneData& data, MessageNonce max_allowed_messages, MessageNonce latest_delivered_nonce,
    const std::deque<UnrewardedRelayer>& relayers);

//! Checks relayer entries proven at the bridged chain form one consecutive range ending at or before
//! latest_received_nonce
tl::expected<void, ReceptionConfirmationError> ensure_unrewarded_relayers_are_correct(
    MessageNonce latest_received_nonce, const std::deque<UnrewardedRelayer>& relayers);

}  // namespace trestle::ledger

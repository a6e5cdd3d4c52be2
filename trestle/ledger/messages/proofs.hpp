// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include <trestle/core/types/lane.hpp>
#include <trestle/core/types/messages_proofs.hpp>
#include <trestle/ledger/common/header_chain.hpp>

namespace trestle::ledger {

enum class [[nodiscard]] VerificationError {
    kUnknownHeader,            // Bridged header is not finalized at this chain
    kInvalidStorageProof,      // Root mismatch or duplicate nodes
    kMessagesCountMismatch,    // Declared count differs from the proven nonce range
    kMessageMissing,           // A nonce of the range is not in the proof
    kMalformedMessage,         // Stored payload can't be decoded
    kMalformedLaneState,       // Stored lane state can't be decoded
    kLaneStateMissing,         // Delivery proof without inbound lane state
    kEmptyMessageProof,        // Neither messages nor lane state proven
    kUnusedNodesInTheProof,    // Proof carries nodes no read needed
};

//! Messages and optional outbound lane state read from a messages proof
struct ProvedLaneMessages {
    std::optional<OutboundLaneData> lane_state;
    std::vector<Message> messages;
};

//! Reads the messages of proof from the outbound lane stored by the messages module bridged_module_name
//! of the bridged chain. The outbound lane state is read when the proof carries it.
tl::expected<ProvedLaneMessages, VerificationError> verify_messages_proof(const HeaderChain& bridged_chain,
                                                                          std::string_view bridged_module_name,
                                                                          const MessagesProof& proof,
                                                                          MessageNonce messages_count);

//! Reads the inbound lane state proven by a delivery proof
tl::expected<InboundLaneData, VerificationError> verify_messages_delivery_proof(
    const HeaderChain& bridged_chain, std::string_view bridged_module_name, const MessagesDeliveryProof& proof);

}  // namespace trestle::ledger

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "proofs.hpp"

#include <trestle/infra/common/log.hpp>
#include <trestle/ledger/messages/storage_keys.hpp>

namespace trestle::ledger {

namespace {

    VerificationError to_verification_error(HeaderChainError error) {
        switch (error) {
            case HeaderChainError::kUnknownHeader:
                return VerificationError::kUnknownHeader;
            case HeaderChainError::kInvalidStorageProof:
                return VerificationError::kInvalidStorageProof;
        }
        return VerificationError::kInvalidStorageProof;
    }

}  // namespace

tl::expected<ProvedLaneMessages, VerificationError> verify_messages_proof(const HeaderChain& bridged_chain,
                                                                          std::string_view bridged_module_name,
                                                                          const MessagesProof& proof,
                                                                          MessageNonce messages_count) {
    auto checker{bridged_chain.parse_finalized_storage_proof(proof.bridged_header_hash, proof.storage_proof)};
    if (!checker) {
        return tl::unexpected{to_verification_error(checker.error())};
    }

    // end < begin is fine as long as the proof carries the lane state
    const NonceRange nonces{proof.nonces_start, proof.nonces_end};
    if (nonces.size() != messages_count) {
        return tl::unexpected{VerificationError::kMessagesCountMismatch};
    }

    ProvedLaneMessages proved;
    proved.messages.reserve(nonces.size());
    for (MessageNonce nonce{nonces.begin}; !nonces.empty() && nonce <= nonces.end; ++nonce) {
        const auto value{checker->read_value(message_storage_key(bridged_module_name, proof.lane, nonce))};
        if (!value || !*value) {
            TRESTLE_TRACE_M("Message is missing in proof", {"lane", to_string(proof.lane),
                                                            "nonce", std::to_string(nonce)});
            return tl::unexpected{VerificationError::kMessageMissing};
        }
        ByteView encoded{**value};
        Message message{MessageKey{proof.lane, nonce}, {}};
        if (!codec::decode(encoded, message.payload)) {
            return tl::unexpected{VerificationError::kMalformedMessage};
        }
        proved.messages.push_back(std::move(message));
        if (nonce == kMaxMessageNonce) break;
    }

    // A lane state lookup running into a node the proof does not carry means no state attached
    const auto lane_state{checker->read_value(outbound_lane_data_key(bridged_module_name, proof.lane))};
    if (lane_state && *lane_state) {
        ByteView encoded{**lane_state};
        OutboundLaneData data;
        if (!codec::decode(encoded, data)) {
            return tl::unexpected{VerificationError::kMalformedLaneState};
        }
        proved.lane_state = data;
    } else if (!lane_state && lane_state.error() != trie::ProofError::kStorageValueUnavailable) {
        return tl::unexpected{VerificationError::kInvalidStorageProof};
    }

    if (!proved.lane_state && proved.messages.empty()) {
        return tl::unexpected{VerificationError::kEmptyMessageProof};
    }
    if (!checker->ensure_no_unused_nodes()) {
        return tl::unexpected{VerificationError::kUnusedNodesInTheProof};
    }
    return proved;
}

tl::expected<InboundLaneData, VerificationError> verify_messages_delivery_proof(
    const HeaderChain& bridged_chain, std::string_view bridged_module_name, const MessagesDeliveryProof& proof) {
    auto checker{bridged_chain.parse_finalized_storage_proof(proof.bridged_header_hash, proof.storage_proof)};
    if (!checker) {
        return tl::unexpected{to_verification_error(checker.error())};
    }

    const auto value{checker->read_value(inbound_lane_data_key(bridged_module_name, proof.lane))};
    if (!value || !*value) {
        return tl::unexpected{VerificationError::kLaneStateMissing};
    }
    ByteView encoded{**value};
    InboundLaneData data;
    if (!codec::decode(encoded, data)) {
        return tl::unexpected{VerificationError::kMalformedLaneState};
    }
    if (!checker->ensure_no_unused_nodes()) {
        return tl::unexpected{VerificationError::kUnusedNodesInTheProof};
    }
    return data;
}

}  // namespace trestle::ledger

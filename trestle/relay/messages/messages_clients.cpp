// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "messages_clients.hpp"

#include <absl/strings/str_cat.h>

#include <trestle/infra/common/decoding_exception.hpp>
#include <trestle/ledger/messages/storage_keys.hpp>
#include <trestle/ledger/runtime_api.hpp>
#include <trestle/relay/common/runtime_call.hpp>

#include <trestle/core/codec/encode_vector.hpp>

namespace trestle::relay {

namespace api = ledger::runtime_api;

namespace {

    //! Decoded storage value, a default constructed one when the key is absent
    template <class T>
    Task<T> read_or_default(ChainClient& client, const HeaderId& at, const Bytes& key, std::string_view what) {
        const auto stored{co_await client.storage_value(at.hash, key)};
        T value{};
        if (stored) {
            ByteView view{*stored};
            success_or_throw(codec::decode(view, value),
                             absl::StrCat("malformed ", what, " at ", client.chain_name(), " block ", at.to_string()));
        }
        co_return value;
    }

}  // namespace

Task<HeaderId> ChainMessagesSource::best_header_id() {
    return client_.best_header_id();
}

Task<std::optional<HeaderId>> ChainMessagesSource::best_finalized_target_header(const HeaderId& at) {
    co_return co_await call_runtime<std::optional<HeaderId>>(client_, at.hash, api::kMessagesBestFinalized);
}

Task<OutboundLaneData> ChainMessagesSource::outbound_lane_data(const HeaderId& at) {
    co_return co_await read_or_default<OutboundLaneData>(
        client_, at, ledger::outbound_lane_data_key(endpoint_.module_name, endpoint_.lane), "outbound lane data");
}

Task<std::vector<Message>> ChainMessagesSource::messages(const HeaderId& at, const NonceRange& nonces) {
    std::vector<Message> messages;
    for (MessageNonce nonce{nonces.begin}; !nonces.empty() && nonce <= nonces.end; ++nonce) {
        const auto stored{
            co_await client_.storage_value(at.hash, ledger::message_storage_key(endpoint_.module_name,
                                                                                endpoint_.lane, nonce))};
        if (!stored) {
            break;
        }
        ByteView view{*stored};
        Message message{MessageKey{endpoint_.lane, nonce}, {}};
        success_or_throw(codec::decode(view, message.payload),
                         absl::StrCat("malformed message ", nonce, " at ", client_.chain_name()));
        messages.push_back(std::move(message));
        if (nonce == kMaxMessageNonce) break;
    }
    co_return messages;
}

Task<PreparedMessagesProof> ChainMessagesSource::prove_messages(const HeaderId& at, const NonceRange& nonces,
                                                                bool with_outbound_lane_state) {
    std::vector<Bytes> keys;
    for (MessageNonce nonce{nonces.begin}; !nonces.empty() && nonce <= nonces.end; ++nonce) {
        keys.push_back(ledger::message_storage_key(endpoint_.module_name, endpoint_.lane, nonce));
        if (nonce == kMaxMessageNonce) break;
    }
    if (with_outbound_lane_state) {
        keys.push_back(ledger::outbound_lane_data_key(endpoint_.module_name, endpoint_.lane));
    }
    auto storage_proof{co_await client_.prove_storage(at.hash, keys)};
    const size_t size{trie::proof_size(storage_proof)};
    co_return PreparedMessagesProof{
        .proof = MessagesProof{
            .bridged_header_hash = at.hash,
            .storage_proof = std::move(storage_proof),
            .lane = endpoint_.lane,
            .nonces_start = nonces.begin,
            .nonces_end = nonces.end,
        },
        .proof_size = size,
    };
}

Task<std::unique_ptr<TransactionTracker>> ChainMessagesSource::submit_delivery_proof(
    const MessagesDeliveryProof& proof, const UnrewardedRelayersState& relayers_state) {
    co_return co_await client_.submit_and_watch(
        {endpoint_.relayer, ledger::ReceiveMessagesDeliveryProofCall{proof, relayers_state}});
}

Task<Balance> ChainMessagesSource::relayer_reward(const AccountId& relayer) {
    const ledger::RewardsAccountParams params{endpoint_.lane, endpoint_.bridged_chain_id,
                                              ledger::RewardsAccountOwner::kBridgedChain};
    Bytes args;
    codec::encode(args, relayer);
    codec::encode(args, params);
    const HeaderId best{co_await client_.best_header_id()};
    const auto reward{co_await call_runtime<std::optional<Balance>>(client_, best.hash, api::kRelayerReward, args)};
    co_return reward.value_or(Balance{0});
}

Task<HeaderId> ChainMessagesTarget::best_header_id() {
    return client_.best_header_id();
}

Task<std::optional<HeaderId>> ChainMessagesTarget::best_finalized_source_header(const HeaderId& at) {
    co_return co_await call_runtime<std::optional<HeaderId>>(client_, at.hash, api::kMessagesBestFinalized);
}

Task<InboundLaneData> ChainMessagesTarget::inbound_lane_data(const HeaderId& at) {
    co_return co_await read_or_default<InboundLaneData>(
        client_, at, ledger::inbound_lane_data_key(endpoint_.module_name, endpoint_.lane), "inbound lane data");
}

Task<std::vector<Weight>> ChainMessagesTarget::dispatch_weights(const std::vector<Message>& messages) {
    Bytes args;
    codec::encode(args, messages);
    const HeaderId best{co_await client_.best_header_id()};
    auto weights{co_await call_runtime<std::vector<Weight>>(client_, best.hash, api::kInboundMessageDetails, args)};
    if (weights.size() != messages.size()) {
        throw DecodingException{DecodingError::kUnexpectedLength,
                                absl::StrCat("dispatch weights of ", messages.size(), " messages from ",
                                             client_.chain_name(), " has ", weights.size(), " entries")};
    }
    co_return weights;
}

Task<MessagesDeliveryProof> ChainMessagesTarget::prove_delivery(const HeaderId& at) {
    auto storage_proof{co_await client_.prove_storage(
        at.hash, {ledger::inbound_lane_data_key(endpoint_.module_name, endpoint_.lane)})};
    co_return MessagesDeliveryProof{
        .bridged_header_hash = at.hash,
        .storage_proof = std::move(storage_proof),
        .lane = endpoint_.lane,
    };
}

Task<std::unique_ptr<TransactionTracker>> ChainMessagesTarget::submit_messages_proof(const MessagesProof& proof,
                                                                                     MessageNonce messages_count,
                                                                                     const Weight& dispatch_weight) {
    co_return co_await client_.submit_and_watch(
        {endpoint_.relayer, ledger::ReceiveMessagesProofCall{endpoint_.relayer, proof,
                                                             static_cast<uint32_t>(messages_count),
                                                             dispatch_weight}});
}

}  // namespace trestle::relay

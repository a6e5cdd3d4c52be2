// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <trestle/core/types/header.hpp>
#include <trestle/core/types/lane.hpp>
#include <trestle/core/types/messages_proofs.hpp>
#include <trestle/infra/concurrency/task.hpp>
#include <trestle/ledger/relayers/rewards_account.hpp>
#include <trestle/relay/common/chain_client.hpp>

namespace trestle::relay {

struct PreparedMessagesProof {
    MessagesProof proof;
    //! Bytes of the trie nodes
    size_t proof_size{0};
};

//! Chain sending messages through one lane
class MessagesSource {
  public:
    virtual ~MessagesSource() = default;

    virtual const std::string& name() const = 0;
    virtual const LaneId& lane() const = 0;

    virtual Task<HeaderId> best_header_id() = 0;

    //! Best target header finalized by the light client of the source at block at, std::nullopt when uninitialized
    virtual Task<std::optional<HeaderId>> best_finalized_target_header(const HeaderId& at) = 0;

    virtual Task<OutboundLaneData> outbound_lane_data(const HeaderId& at) = 0;

    //! Stored messages of nonces, stops at the first message already pruned
    virtual Task<std::vector<Message>> messages(const HeaderId& at, const NonceRange& nonces) = 0;

    virtual Task<PreparedMessagesProof> prove_messages(const HeaderId& at, const NonceRange& nonces,
                                                       bool with_outbound_lane_state) = 0;

    virtual Task<std::unique_ptr<TransactionTracker>> submit_delivery_proof(
        const MessagesDeliveryProof& proof, const UnrewardedRelayersState& relayers_state) = 0;

    //! Reward credited to relayer for delivering the messages of the lane, still unpaid
    virtual Task<Balance> relayer_reward(const AccountId& relayer) = 0;
};

//! Chain receiving messages through one lane
class MessagesTarget {
  public:
    virtual ~MessagesTarget() = default;

    virtual const std::string& name() const = 0;

    virtual Task<HeaderId> best_header_id() = 0;

    //! Best source header finalized by the light client of the target at block at, std::nullopt when uninitialized
    virtual Task<std::optional<HeaderId>> best_finalized_source_header(const HeaderId& at) = 0;

    virtual Task<InboundLaneData> inbound_lane_data(const HeaderId& at) = 0;

    //! Weights of dispatching messages at the target
    virtual Task<std::vector<Weight>> dispatch_weights(const std::vector<Message>& messages) = 0;

    virtual Task<MessagesDeliveryProof> prove_delivery(const HeaderId& at) = 0;

    virtual Task<std::unique_ptr<TransactionTracker>> submit_messages_proof(const MessagesProof& proof,
                                                                            MessageNonce messages_count,
                                                                            const Weight& dispatch_weight) = 0;
};

//! Messages module of a chain at one end of a lane
struct LaneEndpoint {
    LaneId lane{};
    std::string module_name{"BridgeMessages"};
    //! Id of the chain at the other end, keys the rewards accounts of the lane
    ledger::ChainId bridged_chain_id{};
    AccountId relayer;
};

class ChainMessagesSource : public MessagesSource {
  public:
    ChainMessagesSource(ChainClient& client, LaneEndpoint endpoint)
        : client_{client}, endpoint_{std::move(endpoint)} {}

    const std::string& name() const override { return client_.chain_name(); }
    const LaneId& lane() const override { return endpoint_.lane; }

    Task<HeaderId> best_header_id() override;
    Task<std::optional<HeaderId>> best_finalized_target_header(const HeaderId& at) override;
    Task<OutboundLaneData> outbound_lane_data(const HeaderId& at) override;
    Task<std::vector<Message>> messages(const HeaderId& at, const NonceRange& nonces) override;
    Task<PreparedMessagesProof> prove_messages(const HeaderId& at, const NonceRange& nonces,
                                               bool with_outbound_lane_state) override;
    Task<std::unique_ptr<TransactionTracker>> submit_delivery_proof(
        const MessagesDeliveryProof& proof, const UnrewardedRelayersState& relayers_state) override;
    Task<Balance> relayer_reward(const AccountId& relayer) override;

  private:
    ChainClient& client_;
    LaneEndpoint endpoint_;
};

class ChainMessagesTarget : public MessagesTarget {
  public:
    ChainMessagesTarget(ChainClient& client, LaneEndpoint endpoint)
        : client_{client}, endpoint_{std::move(endpoint)} {}

    const std::string& name() const override { return client_.chain_name(); }

    Task<HeaderId> best_header_id() override;
    Task<std::optional<HeaderId>> best_finalized_source_header(const HeaderId& at) override;
    Task<InboundLaneData> inbound_lane_data(const HeaderId& at) override;
    Task<std::vector<Weight>> dispatch_weights(const std::vector<Message>& messages) override;
    Task<MessagesDeliveryProof> prove_delivery(const HeaderId& at) override;
    Task<std::unique_ptr<TransactionTracker>> submit_messages_proof(const MessagesProof& proof,
                                                                    MessageNonce messages_count,
                                                                    const Weight& dispatch_weight) override;

  private:
    ChainClient& client_;
    LaneEndpoint endpoint_;
};

}  // namespace trestle::relay

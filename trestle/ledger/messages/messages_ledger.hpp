// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <trestle/core/state/kv_store.hpp>
#include <trestle/core/types/lane.hpp>
#include <trestle/core/types/messages_proofs.hpp>
#include <trestle/core/types/weight.hpp>
#include <trestle/ledger/common/header_chain.hpp>
#include <trestle/ledger/common/operating_mode.hpp>
#include <trestle/ledger/common/origin.hpp>
#include <trestle/ledger/common/owned_module.hpp>
#include <trestle/ledger/messages/inbound_lane.hpp>
#include <trestle/ledger/messages/message_dispatch.hpp>

namespace trestle::ledger {

// Outcome of the messages ledger calls
enum class [[nodiscard]] MessagesResult {
    kOk,

    kBadOrigin,
    kHalted,
    kNotOperatingNormally,  // Outbound messages are rejected

    kInactiveOutboundLane,
    kMessageTooLarge,

    kTooManyMessagesInTheProof,
    kMessageDispatchInactive,
    kInvalidMessagesProof,
    kInsufficientDispatchWeight,
    kInvalidNonce,
    kTooManyUnrewardedRelayers,
    kTooManyUnconfirmedMessages,

    kInvalidMessagesDeliveryProof,
    kInvalidUnrewardedRelayersState,
    kFailedToConfirmFutureMessages,
    kEmptyUnrewardedRelayerEntry,
    kNonConsecutiveUnrewardedRelayerEntries,
    kTryingToConfirmMoreMessagesThanExpected,
};

struct MessagesConfig {
    std::string module_name{"BridgeMessages"};
    //! Name of the messages module at the bridged chain
    std::string bridged_module_name{"BridgeMessages"};
    //! Lanes accepting outbound messages
    std::vector<LaneId> active_lanes{LaneId{0, 0, 0, 0}};
    InboundLaneLimits inbound_limits;
    size_t max_message_size{64_Kibi};
    //! Storage access weights spent while pruning
    Weight db_read_weight{Weight::from_parts(25'000'000, 0)};
    Weight db_write_weight{Weight::from_parts(100'000'000, 0)};
};

struct SendMessageArtifacts {
    MessageNonce nonce{0};
    //! Messages of the lane waiting for delivery confirmation, this one included
    MessageNonce enqueued_messages{0};
};

//! On-chain endpoint of the message lanes with one bridged chain
class MessagesLedger {
  public:
    MessagesLedger(state::KeyValueStore& store, MessagesConfig config, const HeaderChain& bridged_chain,
                   MessageDispatch& dispatch, DeliveryConfirmationPayments& payments);
    ~MessagesLedger();

    MessagesLedger(const MessagesLedger&) = delete;
    MessagesLedger& operator=(const MessagesLedger&) = delete;

    //! Queues payload on an outbound lane
    tl::expected<SendMessageArtifacts, MessagesResult> send_message(const LaneId& lane, ByteView payload);

    //! Delivers messages proven at the bridged chain. Either every message of the proof is received
    //! and dispatched or the call fails without changes.
    MessagesResult receive_messages_proof(const Origin& origin, const AccountId& relayer_id_at_bridged_chain,
                                          const MessagesProof& proof, MessageNonce messages_count,
                                          const Weight& dispatch_weight);

    //! Confirms deliveries proven by the inbound lane state of the bridged chain and rewards relayers
    MessagesResult receive_messages_delivery_proof(const Origin& origin, const MessagesDeliveryProof& proof,
                                                   const UnrewardedRelayersState& relayers_state);

    MessagesResult set_operating_mode(const Origin& origin, MessagesOperatingMode mode);
    MessagesResult set_owner(const Origin& origin, const std::optional<AccountId>& new_owner);

    //! Prunes confirmed messages within remaining_weight, starting with a lane picked by block_number.
    //! Returns the weight spent.
    Weight on_idle(BlockNum block_number, const Weight& remaining_weight);

    OutboundLaneData outbound_lane_data(const LaneId& lane) const;
    InboundLaneData inbound_lane_data(const LaneId& lane) const;
    std::optional<Bytes> outbound_message_payload(const LaneId& lane, MessageNonce nonce) const;

    //! Dispatch weights of messages as they would be received on this chain
    std::vector<Weight> inbound_message_details(const std::vector<Message>& messages) const;

    MessagesOperatingMode operating_mode() const;
    std::optional<AccountId> owner() const { return owned_.owner(store_); }

    const MessagesConfig& config() const noexcept { return config_; }

  private:
    struct Storage;

    bool is_active_lane(const LaneId& lane) const;
    MessagesResult receive_messages(state::KeyValueStore& state, const AccountId& relayer_id_at_bridged_chain,
                                    const MessagesProof& proof, MessageNonce messages_count,
                                    const Weight& dispatch_weight);
    MessagesResult confirm_messages(state::KeyValueStore& state, const AccountId& confirmation_relayer,
                                    const MessagesDeliveryProof& proof,
                                    const UnrewardedRelayersState& relayers_state);
    Weight prune_messages(const LaneId& lane, const Weight& remaining_weight);

    state::KeyValueStore& store_;
    MessagesConfig config_;
    const HeaderChain& bridged_chain_;
    MessageDispatch& dispatch_;
    DeliveryConfirmationPayments& payments_;
    OwnedModule owned_;
    std::unique_ptr<const Storage> storage_;
};

}  // namespace trestle::ledger

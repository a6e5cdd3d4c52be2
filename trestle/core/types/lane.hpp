// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>

#include <trestle/core/codec/decode.hpp>
#include <trestle/core/common/base.hpp>
#include <trestle/core/common/bytes.hpp>
#include <trestle/core/types/weight.hpp>

namespace trestle {

//! Identifier of a message lane, an ordered channel between two chains
using LaneId = std::array<uint8_t, 4>;

std::string to_string(const LaneId& lane);

//! Account of a relayer or of a reward beneficiary
using AccountId = evmc::address;

struct MessageKey {
    LaneId lane_id{};
    MessageNonce nonce{0};

    friend bool operator==(const MessageKey&, const MessageKey&) = default;
};

struct Message {
    MessageKey key;
    Bytes payload;

    friend bool operator==(const Message&, const Message&) = default;
};

//! Inclusive range of nonces
struct NonceRange {
    MessageNonce begin{1};
    MessageNonce end{0};

    bool empty() const noexcept { return end < begin; }
    MessageNonce size() const noexcept { return empty() ? 0 : end - begin + 1; }

    friend bool operator==(const NonceRange&, const NonceRange&) = default;
};

//! Outbound lane state on the sending chain
struct OutboundLaneData {
    //! Nonce of the oldest message whose payload is still stored
    MessageNonce oldest_unpruned_nonce{1};
    //! Greatest nonce whose delivery to the bridged chain has been confirmed
    MessageNonce latest_received_nonce{0};
    //! Nonce of the latest message sent through the lane
    MessageNonce latest_generated_nonce{0};

    //! Messages sent but not yet confirmed as delivered
    NonceRange queued_messages() const noexcept { return {latest_received_nonce + 1, latest_generated_nonce}; }

    friend bool operator==(const OutboundLaneData&, const OutboundLaneData&) = default;
};

//! Nonces delivered by one relayer together with the dispatch outcome of each message
struct DeliveredMessages {
    MessageNonce begin{1};
    MessageNonce end{0};
    std::vector<bool> dispatch_results;

    static DeliveredMessages new_with(MessageNonce nonce, bool dispatch_result) {
        return {nonce, nonce, {dispatch_result}};
    }

    MessageNonce total_messages() const noexcept { return end >= begin ? end - begin + 1 : 0; }
    bool contains_message(MessageNonce nonce) const noexcept { return begin <= nonce && nonce <= end; }

    //! Extends the range with the next nonce
    void note_dispatched_message(bool dispatch_result) {
        ++end;
        dispatch_results.push_back(dispatch_result);
    }

    friend bool operator==(const DeliveredMessages&, const DeliveredMessages&) = default;
};

struct UnrewardedRelayer {
    AccountId relayer;
    DeliveredMessages messages;

    friend bool operator==(const UnrewardedRelayer&, const UnrewardedRelayer&) = default;
};

//! Inbound lane state on the receiving chain
struct InboundLaneData {
    //! Relayers who delivered messages not yet confirmed at the sending chain, oldest first
    std::deque<UnrewardedRelayer> relayers;
    //! Greatest nonce the sending chain has confirmed receiving delivery proof for
    MessageNonce last_confirmed_nonce{0};

    MessageNonce last_delivered_nonce() const noexcept {
        return relayers.empty() ? last_confirmed_nonce : relayers.back().messages.end;
    }

    friend bool operator==(const InboundLaneData&, const InboundLaneData&) = default;
};

//! Summary of an inbound lane declared by relayers submitting delivery confirmations
struct UnrewardedRelayersState {
    MessageNonce unrewarded_relayer_entries{0};
    MessageNonce messages_in_oldest_entry{0};
    MessageNonce total_messages{0};
    MessageNonce last_delivered_nonce{0};

    static UnrewardedRelayersState from(const InboundLaneData& data);

    friend bool operator==(const UnrewardedRelayersState&, const UnrewardedRelayersState&) = default;
};

//! Dispatch weight and size of a queued message, used by relayers to size delivery batches
struct MessageDetails {
    MessageNonce nonce{0};
    Weight dispatch_weight;
    uint32_t size{0};

    friend bool operator==(const MessageDetails&, const MessageDetails&) = default;
};

namespace codec {
    void encode(Bytes& to, const MessageKey& key);
    void encode(Bytes& to, const Message& message);
    void encode(Bytes& to, const OutboundLaneData& data);
    void encode(Bytes& to, const DeliveredMessages& messages);
    void encode(Bytes& to, const UnrewardedRelayer& relayer);
    void encode(Bytes& to, const InboundLaneData& data);
    void encode(Bytes& to, const UnrewardedRelayersState& state);

    DecodingResult decode(ByteView& from, MessageKey& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, Message& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, OutboundLaneData& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, DeliveredMessages& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, UnrewardedRelayer& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, InboundLaneData& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, UnrewardedRelayersState& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace codec

}  // namespace trestle

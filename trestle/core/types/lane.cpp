// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "lane.hpp"

#include <trestle/core/codec/encode_vector.hpp>
#include <trestle/core/common/util.hpp>

namespace trestle {

std::string to_string(const LaneId& lane) {
    return to_hex(ByteView{lane.data(), lane.size()}, /*with_prefix=*/true);
}

UnrewardedRelayersState UnrewardedRelayersState::from(const InboundLaneData& data) {
    UnrewardedRelayersState state;
    state.unrewarded_relayer_entries = data.relayers.size();
    if (!data.relayers.empty()) {
        state.messages_in_oldest_entry = data.relayers.front().messages.total_messages();
        state.total_messages = data.relayers.back().messages.end - data.relayers.front().messages.begin + 1;
    }
    state.last_delivered_nonce = data.last_delivered_nonce();
    return state;
}

namespace codec {

    static void encode_bits(Bytes& to, const std::vector<bool>& bits) {
        encode_compact(to, bits.size());
        Bytes packed((bits.size() + 7) / 8, 0);
        for (size_t i{0}; i < bits.size(); ++i) {
            if (bits[i]) {
                packed[i / 8] |= static_cast<uint8_t>(1u << (i % 8));
            }
        }
        to.append(packed);
    }

    static DecodingResult decode_bits(ByteView& from, std::vector<bool>& bits) {
        const auto count{decode_compact(from)};
        if (!count) {
            return tl::unexpected{count.error()};
        }
        if (*count > from.size() * 8) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }
        const uint64_t bytes_count{(*count + 7) / 8};
        if (from.size() < bytes_count) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }
        bits.assign(static_cast<size_t>(*count), false);
        for (size_t i{0}; i < bits.size(); ++i) {
            bits[i] = (from[i / 8] >> (i % 8)) & 1;
        }
        // Padding bits must be zero
        if (*count % 8 != 0 && (from[bytes_count - 1] >> (*count % 8)) != 0) {
            return tl::unexpected{DecodingError::kNonCanonicalSize};
        }
        from.remove_prefix(static_cast<size_t>(bytes_count));
        return {};
    }

    void encode(Bytes& to, const MessageKey& key) {
        encode(to, key.lane_id);
        encode(to, key.nonce);
    }

    void encode(Bytes& to, const Message& message) {
        encode(to, message.key);
        encode(to, ByteView{message.payload});
    }

    void encode(Bytes& to, const OutboundLaneData& data) {
        encode(to, data.oldest_unpruned_nonce);
        encode(to, data.latest_received_nonce);
        encode(to, data.latest_generated_nonce);
    }

    void encode(Bytes& to, const DeliveredMessages& messages) {
        encode(to, messages.begin);
        encode(to, messages.end);
        encode_bits(to, messages.dispatch_results);
    }

    void encode(Bytes& to, const UnrewardedRelayer& relayer) {
        encode(to, relayer.relayer);
        encode(to, relayer.messages);
    }

    void encode(Bytes& to, const InboundLaneData& data) {
        encode_compact(to, data.relayers.size());
        for (const auto& relayer : data.relayers) {
            encode(to, relayer);
        }
        encode(to, data.last_confirmed_nonce);
    }

    void encode(Bytes& to, const UnrewardedRelayersState& state) {
        encode(to, state.unrewarded_relayer_entries);
        encode(to, state.messages_in_oldest_entry);
        encode(to, state.total_messages);
        encode(to, state.last_delivered_nonce);
    }

    DecodingResult decode(ByteView& from, MessageKey& to, Leftover mode) noexcept {
        return decode(from, mode, to.lane_id, to.nonce);
    }

    DecodingResult decode(ByteView& from, Message& to, Leftover mode) noexcept {
        return decode(from, mode, to.key, to.payload);
    }

    DecodingResult decode(ByteView& from, OutboundLaneData& to, Leftover mode) noexcept {
        return decode(from, mode, to.oldest_unpruned_nonce, to.latest_received_nonce, to.latest_generated_nonce);
    }

    DecodingResult decode(ByteView& from, DeliveredMessages& to, Leftover mode) noexcept {
        if (DecodingResult res{decode_items(from, to.begin, to.end)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_bits(from, to.dispatch_results)}; !res) {
            return res;
        }
        if (to.dispatch_results.size() != to.total_messages()) {
            return tl::unexpected{DecodingError::kUnexpectedLength};
        }
        return check_leftover(from, mode);
    }

    DecodingResult decode(ByteView& from, UnrewardedRelayer& to, Leftover mode) noexcept {
        return decode(from, mode, to.relayer, to.messages);
    }

    DecodingResult decode(ByteView& from, InboundLaneData& to, Leftover mode) noexcept {
        std::vector<UnrewardedRelayer> relayers;
        if (DecodingResult res{decode_items(from, relayers, to.last_confirmed_nonce)}; !res) {
            return res;
        }
        to.relayers.assign(relayers.begin(), relayers.end());
        return check_leftover(from, mode);
    }

    DecodingResult decode(ByteView& from, UnrewardedRelayersState& to, Leftover mode) noexcept {
        return decode(from, mode, to.unrewarded_relayer_entries, to.messages_in_oldest_entry, to.total_messages,
                      to.last_delivered_nonce);
    }

}  // namespace codec

}  // namespace trestle

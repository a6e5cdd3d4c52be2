// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "lane.hpp"

#include <catch2/catch.hpp>

#include <trestle/core/codec/encode_vector.hpp>
#include <trestle/core/common/util.hpp>
#include <trestle/core/types/messages_proofs.hpp>

namespace trestle {

using namespace evmc::literals;

template <class T>
static T round_trip(const T& value) {
    Bytes encoded;
    codec::encode(encoded, value);
    ByteView view{encoded};
    T decoded;
    REQUIRE(codec::decode(view, decoded));
    return decoded;
}

TEST_CASE("Outbound lane data encoding", "[types][lane]") {
    CHECK(round_trip(OutboundLaneData{}) == OutboundLaneData{1, 0, 0});

    SECTION("boundary nonces") {
        const OutboundLaneData zero{0, 0, 0};
        CHECK(round_trip(zero) == zero);
        const OutboundLaneData max{kMaxMessageNonce, kMaxMessageNonce, kMaxMessageNonce};
        CHECK(round_trip(max) == max);
    }

    SECTION("layout") {
        Bytes encoded;
        codec::encode(encoded, OutboundLaneData{3, 3, 5});
        CHECK(to_hex(encoded) == "030000000000000003000000000000000500000000000000");
    }

    SECTION("queued messages") {
        CHECK(OutboundLaneData{3, 3, 5}.queued_messages() == NonceRange{4, 5});
        CHECK(OutboundLaneData{6, 5, 5}.queued_messages().empty());
    }
}

TEST_CASE("Inbound lane data encoding", "[types][lane]") {
    InboundLaneData data;
    data.last_confirmed_nonce = 3;
    data.relayers.push_back({0x01_address, DeliveredMessages{4, 5, {true, false}}});
    data.relayers.push_back({0x02_address, DeliveredMessages{6, 14, std::vector<bool>(9, true)}});
    CHECK(round_trip(data) == data);
    CHECK(data.last_delivered_nonce() == 14);

    SECTION("boundary nonces") {
        InboundLaneData max;
        max.last_confirmed_nonce = kMaxMessageNonce - 1;
        max.relayers.push_back({0x03_address, DeliveredMessages::new_with(kMaxMessageNonce, true)});
        CHECK(round_trip(max) == max);
        CHECK(round_trip(InboundLaneData{}) == InboundLaneData{});
    }

    SECTION("dispatch results must cover the range") {
        Bytes encoded;
        codec::encode(encoded, DeliveredMessages{4, 6, {true}});
        ByteView view{encoded};
        DeliveredMessages decoded;
        CHECK(codec::decode(view, decoded).error() == DecodingError::kUnexpectedLength);
    }
}

TEST_CASE("Message encoding", "[types][lane]") {
    SECTION("boundary nonces") {
        const Message first{{LaneId{0, 0, 0, 1}, 0}, Bytes{}};
        CHECK(round_trip(first) == first);
        const Message last{{LaneId{0xff, 0xff, 0xff, 0xff}, kMaxMessageNonce}, Bytes(300, 0x2a)};
        CHECK(round_trip(last) == last);
    }

    SECTION("truncated payload") {
        Bytes encoded;
        codec::encode(encoded, Message{{LaneId{0, 0, 0, 1}, 7}, Bytes(4, 0x01)});
        encoded.pop_back();
        ByteView view{encoded};
        Message decoded;
        CHECK(codec::decode(view, decoded).error() == DecodingError::kInputTooShort);
    }
}

TEST_CASE("Unrewarded relayers state", "[types][lane]") {
    CHECK(UnrewardedRelayersState::from(InboundLaneData{}) == UnrewardedRelayersState{0, 0, 0, 0});

    InboundLaneData data;
    data.last_confirmed_nonce = 3;
    data.relayers.push_back({0x01_address, DeliveredMessages{4, 5, {true, true}}});
    data.relayers.push_back({0x02_address, DeliveredMessages{6, 8, {true, true, true}}});
    CHECK(UnrewardedRelayersState::from(data) == UnrewardedRelayersState{2, 2, 5, 8});
}

TEST_CASE("Delivered messages", "[types][lane]") {
    auto messages{DeliveredMessages::new_with(7, true)};
    messages.note_dispatched_message(false);
    CHECK(messages.begin == 7);
    CHECK(messages.end == 8);
    CHECK(messages.total_messages() == 2);
    CHECK(messages.dispatch_results == std::vector<bool>{true, false});
    CHECK(messages.contains_message(8));
    CHECK_FALSE(messages.contains_message(9));
}

TEST_CASE("Messages proof encoding", "[types][lane]") {
    MessagesProof proof;
    proof.bridged_header_hash = Hash::of(*from_hex("01"));
    proof.storage_proof = {*from_hex("aabb"), *from_hex("cc")};
    proof.lane = LaneId{0, 0, 0, 1};
    proof.nonces_start = 0;
    proof.nonces_end = kMaxMessageNonce;
    CHECK(round_trip(proof) == proof);

    MessagesDeliveryProof delivery_proof;
    delivery_proof.bridged_header_hash = Hash::of(*from_hex("02"));
    delivery_proof.lane = LaneId{0, 0, 0, 2};
    CHECK(round_trip(delivery_proof) == delivery_proof);
}

}  // namespace trestle

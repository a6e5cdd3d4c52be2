// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "inbound_lane.hpp"

#include <catch2/catch.hpp>

namespace trestle::ledger {

namespace {

    const AccountId kRelayer1{0x01};
    const AccountId kRelayer2{0x02};
    const AccountId kRelayer3{0x03};

    InboundLaneData lane_with(std::initializer_list<UnrewardedRelayer> relayers, MessageNonce last_confirmed = 0) {
        return {std::deque<UnrewardedRelayer>{relayers}, last_confirmed};
    }

    UnrewardedRelayer entry(const AccountId& relayer, MessageNonce begin, MessageNonce end) {
        return {relayer, DeliveredMessages{begin, end, std::vector<bool>(end - begin + 1, true)}};
    }

}  // namespace

TEST_CASE("Inbound lane receives messages in order", "[ledger][messages]") {
    const InboundLaneLimits limits{.max_unrewarded_relayer_entries = 2, .max_unconfirmed_messages = 4};
    InboundLaneData data;

    CHECK(check_message_reception(data, limits, kRelayer1, 2) == ReceptionResult::kInvalidNonce);
    CHECK(check_message_reception(data, limits, kRelayer1, 0) == ReceptionResult::kInvalidNonce);
    REQUIRE(check_message_reception(data, limits, kRelayer1, 1) == ReceptionResult::kOk);
    note_received_message(data, kRelayer1, 1, true);

    SECTION("same nonce twice") {
        CHECK(check_message_reception(data, limits, kRelayer1, 1) == ReceptionResult::kInvalidNonce);
    }

    SECTION("consecutive messages by one relayer share an entry") {
        note_received_message(data, kRelayer1, 2, false);
        REQUIRE(data.relayers.size() == 1);
        CHECK(data.relayers.front().messages == DeliveredMessages{1, 2, {true, false}});
        CHECK(data.last_delivered_nonce() == 2);
    }

    SECTION("relayer entries are bounded") {
        note_received_message(data, kRelayer2, 2, true);
        CHECK(check_message_reception(data, limits, kRelayer3, 3) == ReceptionResult::kTooManyUnrewardedRelayers);
        // the last relayer extends its own entry
        CHECK(check_message_reception(data, limits, kRelayer2, 3) == ReceptionResult::kOk);
    }

    SECTION("unconfirmed messages are bounded") {
        for (MessageNonce nonce{2}; nonce <= 4; ++nonce) {
            note_received_message(data, kRelayer1, nonce, true);
        }
        CHECK(check_message_reception(data, limits, kRelayer1, 5) == ReceptionResult::kTooManyUnconfirmedMessages);
    }
}

TEST_CASE("Inbound lane applies outbound lane state", "[ledger][messages]") {
    auto data{lane_with({entry(kRelayer1, 1, 2), entry(kRelayer2, 3, 5)})};

    SECTION("nothing new") {
        auto unchanged{lane_with({entry(kRelayer1, 1, 2)}, 0)};
        CHECK_FALSE(receive_state_update(unchanged, OutboundLaneData{1, 0, 2}));
        CHECK(unchanged == lane_with({entry(kRelayer1, 1, 2)}, 0));
    }

    SECTION("confirming undelivered messages is ignored") {
        CHECK_FALSE(receive_state_update(data, OutboundLaneData{1, 6, 6}));
        CHECK(data.last_confirmed_nonce == 0);
    }

    SECTION("fully confirmed entries are dropped") {
        CHECK(receive_state_update(data, OutboundLaneData{1, 2, 5}) == 2);
        CHECK(data == lane_with({entry(kRelayer2, 3, 5)}, 2));
    }

    SECTION("partially confirmed entry is trimmed") {
        data.relayers.back().messages.dispatch_results = {true, false, true};
        CHECK(receive_state_update(data, OutboundLaneData{1, 4, 5}) == 4);
        REQUIRE(data.relayers.size() == 1);
        CHECK(data.relayers.front().messages == DeliveredMessages{5, 5, {true}});
        CHECK(data.last_confirmed_nonce == 4);
        CHECK(data.last_delivered_nonce() == 5);
    }

    SECTION("everything confirmed") {
        CHECK(receive_state_update(data, OutboundLaneData{1, 5, 5}) == 5);
        CHECK(data.relayers.empty());
        CHECK(data.last_delivered_nonce() == 5);
    }
}

}  // namespace trestle::ledger

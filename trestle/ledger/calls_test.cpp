// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "calls.hpp"

#include <catch2/catch.hpp>

#include <trestle/dev/authority_keys.hpp>

namespace trestle::ledger {

namespace {

    const AccountId kSigner{0x42};
    const LaneId kLane{0, 0, 0, 1};

    Transaction round_trip(const Transaction& transaction) {
        Bytes encoded;
        codec::encode(encoded, transaction);
        ByteView view{encoded};
        Transaction decoded;
        REQUIRE(codec::decode(view, decoded));
        return decoded;
    }

}  // namespace

TEST_CASE("Call encoding", "[ledger][calls]") {
    dev::AuthorityKeys keys{2};
    Header header;
    header.number = 7;
    header.digest.scheduled_change = ScheduledChange{keys.authorities(), 0};

    SECTION("finality proof") {
        const Transaction tx{kSigner, SubmitFinalityProofCall{header, keys.justify(header.id(), 3, 1), 1}};
        const auto decoded{round_trip(tx)};
        CHECK(decoded == tx);
        CHECK(call_name(decoded.call) == "submit_finality_proof");
    }

    SECTION("messages proof") {
        const Transaction tx{kSigner, ReceiveMessagesProofCall{
                                          .relayer_id_at_bridged_chain = AccountId{0x07},
                                          .proof = {header.hash(), {Bytes{1, 2, 3}}, kLane, 1, 2},
                                          .messages_count = 2,
                                          .dispatch_weight = Weight::from_parts(10, 20),
                                      }};
        CHECK(round_trip(tx) == tx);
    }

    SECTION("claim rewards with and without beneficiary") {
        const RewardsAccountParams params{kLane, {'m', 'l', 'a', 'u'}, RewardsAccountOwner::kBridgedChain};
        const Transaction to_self{kSigner, ClaimRewardsCall{params, std::nullopt}};
        const Transaction to_other{kSigner, ClaimRewardsCall{params, AccountId{0x99}}};
        CHECK(round_trip(to_self) == to_self);
        CHECK(round_trip(to_other) == to_other);
    }

    SECTION("unknown call index") {
        Bytes encoded;
        codec::encode(encoded, kSigner);
        encoded.push_back(static_cast<uint8_t>(std::variant_size_v<Call>));
        ByteView view{encoded};
        Transaction decoded;
        const auto result{codec::decode(view, decoded)};
        REQUIRE_FALSE(result);
        CHECK(result.error() == DecodingError::kInvalidVariant);
    }

    SECTION("trailing bytes") {
        Bytes encoded;
        codec::encode(encoded, Transaction{kSigner, SendMessageCall{kLane, Bytes{0xaa}}});
        encoded.push_back(0);
        ByteView view{encoded};
        Transaction decoded;
        const auto result{codec::decode(view, decoded)};
        REQUIRE_FALSE(result);
        CHECK(result.error() == DecodingError::kInputTooLong);
    }
}

}  // namespace trestle::ledger

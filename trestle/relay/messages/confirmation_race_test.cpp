// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "confirmation_race.hpp"

#include <vector>

#include <catch2/catch.hpp>
#include <gmock/gmock.h>

#include <trestle/core/common/util.hpp>
#include <trestle/infra/test_util/log.hpp>
#include <trestle/infra/test_util/task_runner.hpp>
#include <trestle/relay/test_util/mock_finality_clients.hpp>
#include <trestle/relay/test_util/mock_messages_clients.hpp>

namespace trestle::relay {

using testing::_;
using testing::Invoke;
using testing::InvokeWithoutArgs;
using testing::NiceMock;

namespace {

    const AccountId kRelayer{0x0A};
    const AccountId kOtherRelayer{0x0B};

    UnrewardedRelayer relayer_entry(const AccountId& relayer, MessageNonce begin, MessageNonce end) {
        return {relayer, {begin, end, std::vector<bool>(end - begin + 1, true)}};
    }

    struct ConfirmationRaceFixture : public test_util::TaskRunner {
        ConfirmationRaceFixture() {
            params.max_extrinsic_weight = Weight::from_parts(2'000'000'000'000, 5'000'000);
            params.max_extrinsic_size = 1'000'000;
            params.relayer = kRelayer;
            inbound.last_confirmed_nonce = 3;
            inbound.relayers = {relayer_entry(kRelayer, 4, 4), relayer_entry(kOtherRelayer, 5, 5)};

            ON_CALL(source, best_finalized_target_header(_))
                .WillByDefault(InvokeWithoutArgs([this]() -> Task<std::optional<HeaderId>> {
                    co_return target_header;
                }));
            ON_CALL(source, best_header_id()).WillByDefault(InvokeWithoutArgs([]() -> Task<HeaderId> {
                co_return HeaderId{50, Hash::of(Bytes{0x50})};
            }));
            ON_CALL(source, outbound_lane_data(_)).WillByDefault(Invoke([this](const HeaderId&) -> Task<OutboundLaneData> {
                co_return outbound;
            }));
            ON_CALL(target, inbound_lane_data(_)).WillByDefault(Invoke([this](const HeaderId& at) -> Task<InboundLaneData> {
                inbound_reads.push_back(at);
                co_return inbound;
            }));
            ON_CALL(target, prove_delivery(_)).WillByDefault(Invoke([this](const HeaderId& at) -> Task<MessagesDeliveryProof> {
                co_return MessagesDeliveryProof{at.hash, {Bytes(100, 0x01)}, source.lane()};
            }));
            ON_CALL(source, submit_delivery_proof(_, _))
                .WillByDefault(Invoke([this](const MessagesDeliveryProof& proof, const UnrewardedRelayersState& state)
                                          -> Task<std::unique_ptr<TransactionTracker>> {
                    submitted_proofs.push_back(proof);
                    submitted_states.push_back(state);
                    if (import_submitted) {
                        outbound.latest_received_nonce = state.last_delivered_nonce;
                    }
                    co_return test::make_resolved_tracker(submission_status);
                }));
            ON_CALL(source, relayer_reward(_)).WillByDefault(Invoke([](const AccountId&) -> Task<Balance> {
                co_return Balance{5'000};
            }));
        }

        test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
        NiceMock<test::MockMessagesSource> source;
        NiceMock<test::MockMessagesTarget> target;
        ledger::WeightCalibrator calibrator{ledger::WeightInfo::reference()};
        MessageLaneParams params;
        Metrics metrics;

        std::optional<HeaderId> target_header{HeaderId{20, Hash::of(Bytes{0x20})}};
        OutboundLaneData outbound{.oldest_unpruned_nonce = 3, .latest_received_nonce = 3, .latest_generated_nonce = 5};
        InboundLaneData inbound;
        std::vector<HeaderId> inbound_reads;
        std::vector<MessagesDeliveryProof> submitted_proofs;
        std::vector<UnrewardedRelayersState> submitted_states;
        bool import_submitted{true};
        TrackedTransactionStatus submission_status{TrackedTransactionStatus::finalized_at({})};

        ConfirmationRace race{source, target, calibrator, params, &metrics};
    };

}  // namespace

TEST_CASE("ConfirmationRace confirms deliveries at the finalized target header", "[relay][messages]") {
    ConfirmationRaceFixture fixture;

    CHECK(fixture.run(fixture.race.run_iteration()) == ConfirmationOutcome::kConfirmed);
    REQUIRE(fixture.submitted_states.size() == 1);
    CHECK(fixture.submitted_states[0] == UnrewardedRelayersState{.unrewarded_relayer_entries = 2,
                                                                 .messages_in_oldest_entry = 1,
                                                                 .total_messages = 2,
                                                                 .last_delivered_nonce = 5});
    CHECK(fixture.submitted_proofs[0].bridged_header_hash == fixture.target_header->hash);
    CHECK(fixture.inbound_reads.front() == *fixture.target_header);
    CHECK(fixture.outbound.latest_received_nonce == 5);

    CHECK(fixture.metrics.value("lane_state_nonces", {{"lane", "0x00000001"}, {"type", "source_latest_confirmed"}}) ==
          5);
    const Labels reward_labels{{"lane", "0x00000001"}, {"relayer", to_hex(ByteView{kRelayer.bytes}, true)}};
    CHECK(fixture.metrics.value("relayer_reward", reward_labels) == 5'000);

    // an already confirmed delivery is not proven again
    CHECK(fixture.run(fixture.race.run_iteration()) == ConfirmationOutcome::kNothingToConfirm);
    CHECK(fixture.submitted_states.size() == 1);
}

TEST_CASE("ConfirmationRace waits for a finalized target header", "[relay][messages]") {
    ConfirmationRaceFixture fixture;
    fixture.target_header = std::nullopt;
    EXPECT_CALL(fixture.target, inbound_lane_data(_)).Times(0);

    CHECK(fixture.run(fixture.race.run_iteration()) == ConfirmationOutcome::kNoFinalizedTarget);
}

TEST_CASE("ConfirmationRace detects diverged lanes", "[relay][messages]") {
    ConfirmationRaceFixture fixture;
    fixture.outbound.latest_received_nonce = 6;

    try {
        fixture.run(fixture.race.run_iteration());
        FAIL("expected RelayError");
    } catch (const RelayError& ex) {
        CHECK(ex.kind() == ErrorKind::kOrderingViolation);
    }
}

TEST_CASE("ConfirmationRace reads both lanes at one source block", "[relay][messages]") {
    ConfirmationRaceFixture fixture;
    const HeaderId older_source{50, Hash::of(Bytes{0x50})};
    const HeaderId newer_source{51, Hash::of(Bytes{0x51})};
    const HeaderId newer_target{22, Hash::of(Bytes{0x22})};
    // another relayer confirms up to nonce 7 with a delivery proof at newer_target
    int best_header_reads{0};
    ON_CALL(fixture.source, best_header_id()).WillByDefault(InvokeWithoutArgs([&]() -> Task<HeaderId> {
        co_return ++best_header_reads == 1 ? older_source : newer_source;
    }));
    ON_CALL(fixture.source, best_finalized_target_header(_))
        .WillByDefault(Invoke([&](const HeaderId& at) -> Task<std::optional<HeaderId>> {
            co_return at == older_source ? *fixture.target_header : newer_target;
        }));
    ON_CALL(fixture.source, outbound_lane_data(_)).WillByDefault(Invoke([&](const HeaderId& at) -> Task<OutboundLaneData> {
        co_return OutboundLaneData{.oldest_unpruned_nonce = 3,
                                   .latest_received_nonce = at == older_source ? MessageNonce{5} : MessageNonce{7},
                                   .latest_generated_nonce = 7};
    }));

    CHECK(fixture.run(fixture.race.run_iteration()) == ConfirmationOutcome::kNothingToConfirm);
    CHECK(fixture.inbound_reads == std::vector<HeaderId>{*fixture.target_header});
    CHECK(fixture.submitted_proofs.empty());
}

TEST_CASE("ConfirmationRace failures", "[relay][messages]") {
    ConfirmationRaceFixture fixture;
    ErrorKind expected{ErrorKind::kTransactionLost};

    SECTION("transaction over the weight limit") {
        fixture.params.max_extrinsic_weight = Weight::from_parts(1'000, 1'000);
        expected = ErrorKind::kCapacityExceeded;
    }
    SECTION("lost transaction") {
        fixture.submission_status = TrackedTransactionStatus::lost();
    }
    SECTION("finalized but not confirmed") {
        fixture.import_submitted = false;
    }

    try {
        fixture.run(fixture.race.run_iteration());
        FAIL("expected RelayError");
    } catch (const RelayError& ex) {
        CHECK(ex.kind() == expected);
    }
    CHECK(fixture.outbound.latest_received_nonce <= 5);
}

TEST_CASE("ConfirmationRace dry run", "[relay][messages]") {
    ConfirmationRaceFixture fixture;
    fixture.params.dry_run = true;
    EXPECT_CALL(fixture.source, submit_delivery_proof(_, _)).Times(0);

    CHECK(fixture.run(fixture.race.run_iteration()) == ConfirmationOutcome::kDryRun);
}

}  // namespace trestle::relay

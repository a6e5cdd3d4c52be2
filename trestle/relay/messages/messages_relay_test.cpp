// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch.hpp>

#include <trestle/core/common/util.hpp>
#include <trestle/dev/dev_chain.hpp>
#include <trestle/dev/dev_chain_client.hpp>
#include <trestle/infra/test_util/log.hpp>
#include <trestle/infra/test_util/task_runner.hpp>
#include <trestle/relay/finality/bridge_initialization.hpp>
#include <trestle/relay/finality/finality_loop.hpp>
#include <trestle/relay/messages/confirmation_race.hpp>
#include <trestle/relay/messages/delivery_race.hpp>
#include <trestle/relay/messages/lane_params.hpp>
#include <trestle/relay/messages/messages_clients.hpp>
#include <trestle/relay/test_util/dev_chains.hpp>

namespace trestle::relay {

namespace {

    const AccountId kRelayerX{0x0A};
    const AccountId kRelayerY{0x0B};
    const LaneId kLane{0, 0, 0, 0};
    constexpr ledger::ChainId kRialtoId{'r', 'l', 't', 'o'};
    constexpr ledger::ChainId kMillauId{'m', 'l', 'a', 'u'};
    const Balance kRewardPerMessage{1'000'000};

    dev::DevChainConfig chain_config(std::string name, ledger::ChainId chain_id, ledger::ChainId bridged_chain_id) {
        dev::DevChainConfig config;
        config.name = std::move(name);
        config.runtime.chain_id = chain_id;
        config.runtime.bridged_chain_id = bridged_chain_id;
        config.runtime.header_chain = ledger::HeaderChainConfig{};
        config.runtime.messages = ledger::MessagesConfig{};
        config.runtime.messages->active_lanes = {kLane};
        config.runtime.messages->inbound_limits.max_unrewarded_relayer_entries = 2;
        config.runtime.reward_per_message = kRewardPerMessage;
        config.bridge_owner = kRelayerX;
        return config;
    }

    //! Finalizes source up to its next block keeping a justification, then imports it into target
    void sync_finality(test_util::TaskRunner& runner, FinalityLoop& loop, dev::DevChain& source,
                       dev::DevChain& target) {
        Header header{source.produce_block()};
        while (header.number % source.config().justification_period != 0) {
            header = source.produce_block();
        }
        source.finalize(header.number);
        REQUIRE(test::run_producing_blocks(runner, loop.run_iteration(), {&target}) == IterationOutcome::kSubmitted);
    }

    struct MessagesRelayFixture : public test_util::TaskRunner {
        MessagesRelayFixture() {
            MessageLimits limits;
            limits.max_unrewarded_relayer_entries = 2;
            limits.max_messages_in_single_batch = 1;
            params = make_message_lane_params(limits, LoopTiming{}, millau.runtime().weights());
            params.relayer = kRelayerX;
        }

        test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
        dev::DevChain rialto{executor(), chain_config("Rialto", kRialtoId, kMillauId)};
        dev::DevChain millau{executor(), chain_config("Millau", kMillauId, kRialtoId)};
        dev::DevChainClient rialto_client{rialto};
        dev::DevChainClient millau_client{millau};

        ChainFinalitySource rialto_headers{rialto_client};
        ChainFinalityTarget rialto_headers_at_millau{millau_client, kRelayerX};
        FinalityLoop rialto_to_millau{executor(), rialto_headers, rialto_headers_at_millau, FinalitySyncParams{}};
        ChainFinalitySource millau_headers{millau_client};
        ChainFinalityTarget millau_headers_at_rialto{rialto_client, kRelayerX};
        FinalityLoop millau_to_rialto{executor(), millau_headers, millau_headers_at_rialto, FinalitySyncParams{}};

        ChainMessagesSource source{rialto_client, LaneEndpoint{kLane, "BridgeMessages", kMillauId, kRelayerX}};
        ChainMessagesTarget target_x{millau_client, LaneEndpoint{kLane, "BridgeMessages", kRialtoId, kRelayerX}};
        ChainMessagesTarget target_y{millau_client, LaneEndpoint{kLane, "BridgeMessages", kRialtoId, kRelayerY}};

        MessageLaneParams params;
        Metrics metrics;
        DeliveryRace delivery_x{source, target_x, millau.runtime().weights(), params, &metrics};
        DeliveryRace delivery_y{source, target_y, millau.runtime().weights(), params};
        ConfirmationRace confirmation{source, target_x, rialto.runtime().weights(), params, &metrics};
    };

}  // namespace

TEST_CASE("Messages relay between dev chains", "[relay][messages][dev]") {
    MessagesRelayFixture fixture;
    auto& runner{fixture};
    auto& rialto{fixture.rialto};
    auto& millau{fixture.millau};
    const ledger::RewardsAccountParams rewards_params{kLane, kMillauId, ledger::RewardsAccountOwner::kBridgedChain};

    // nothing to relay before the bridged headers are known
    CHECK(runner.run(fixture.delivery_x.run_iteration()) == DeliveryOutcome::kNoFinalizedSource);
    CHECK(runner.run(fixture.confirmation.run_iteration()) == ConfirmationOutcome::kNoFinalizedTarget);

    REQUIRE(test::run_producing_blocks(runner,
                                       initialize_bridge(fixture.rialto_headers, fixture.rialto_headers_at_millau),
                                       {&millau}) == InitializationOutcome::kInitialized);
    REQUIRE(test::run_producing_blocks(runner,
                                       initialize_bridge(fixture.millau_headers, fixture.millau_headers_at_rialto),
                                       {&rialto}) == InitializationOutcome::kInitialized);

    for (uint8_t i{1}; i <= 3; ++i) {
        REQUIRE(rialto.runtime().messages()->send_message(kLane, Bytes{0x01, i}));
    }
    sync_finality(runner, fixture.rialto_to_millau, rialto, millau);

    // every relayer adds an entry to the inbound lane, two are allowed
    CHECK(test::run_producing_blocks(runner, fixture.delivery_x.run_iteration(), {&millau}) ==
          DeliveryOutcome::kDelivered);
    CHECK(test::run_producing_blocks(runner, fixture.delivery_y.run_iteration(), {&millau}) ==
          DeliveryOutcome::kDelivered);
    CHECK(runner.run(fixture.delivery_x.run_iteration()) == DeliveryOutcome::kWaitingForConfirmations);
    CHECK(millau.pending_transactions() == 0);

    const InboundLaneData inbound{millau.runtime().messages()->inbound_lane_data(kLane)};
    REQUIRE(inbound.relayers.size() == 2);
    CHECK(inbound.relayers[0].relayer == kRelayerX);
    CHECK(inbound.relayers[1].relayer == kRelayerY);
    CHECK(inbound.last_delivered_nonce() == 2);
    CHECK(millau.runtime().dispatch().dispatched_messages() == 2);

    // the reward of X can't be paid out and stays credited
    rialto.runtime().balances().set_frozen(rialto.state(), kRelayerX, true);
    sync_finality(runner, fixture.millau_to_rialto, millau, rialto);
    CHECK(test::run_producing_blocks(runner, fixture.confirmation.run_iteration(), {&rialto}) ==
          ConfirmationOutcome::kConfirmed);

    const OutboundLaneData outbound{rialto.runtime().messages()->outbound_lane_data(kLane)};
    CHECK(outbound.latest_received_nonce == 2);
    CHECK(outbound.latest_generated_nonce == 3);
    CHECK(rialto.runtime().relayers().reward(kRelayerX, rewards_params) == kRewardPerMessage);
    CHECK(rialto.runtime().balances().balance(kRelayerX) == 0);
    CHECK_FALSE(rialto.runtime().relayers().reward(kRelayerY, rewards_params));
    CHECK(rialto.runtime().balances().balance(kRelayerY) == kRewardPerMessage);
    const Labels reward_labels{{"lane", "0x00000000"}, {"relayer", to_hex(ByteView{kRelayerX.bytes}, true)}};
    CHECK(fixture.metrics.value("relayer_reward", reward_labels) == 1'000'000);

    CHECK(runner.run(fixture.confirmation.run_iteration()) == ConfirmationOutcome::kNothingToConfirm);

    // the confirmed lane state reaches the target and frees the relayer entries
    sync_finality(runner, fixture.rialto_to_millau, rialto, millau);
    CHECK(test::run_producing_blocks(runner, fixture.delivery_x.run_iteration(), {&millau}) ==
          DeliveryOutcome::kDelivered);
    const InboundLaneData unblocked{millau.runtime().messages()->inbound_lane_data(kLane)};
    CHECK(unblocked.last_confirmed_nonce == 2);
    REQUIRE(unblocked.relayers.size() == 1);
    CHECK(unblocked.relayers[0] == UnrewardedRelayer{kRelayerX, DeliveredMessages{3, 3, {true}}});
    CHECK(fixture.metrics.value("lane_state_nonces", {{"lane", "0x00000000"}, {"type", "target_latest_received"}}) ==
          3);

    CHECK(runner.run(fixture.delivery_x.run_iteration()) == DeliveryOutcome::kNothingToDeliver);
}

TEST_CASE("Messages relay surfaces failed dispatch and idles on a synced lane", "[relay][messages][dev]") {
    MessagesRelayFixture fixture;
    auto& runner{fixture};
    auto& rialto{fixture.rialto};
    auto& millau{fixture.millau};

    REQUIRE(test::run_producing_blocks(runner,
                                       initialize_bridge(fixture.rialto_headers, fixture.rialto_headers_at_millau),
                                       {&millau}) == InitializationOutcome::kInitialized);
    REQUIRE(rialto.runtime().messages()->send_message(kLane, Bytes{dev::kFailingPayloadMarker}));
    sync_finality(runner, fixture.rialto_to_millau, rialto, millau);

    // a message failing at dispatch is still delivered, its result is recorded for the sender
    CHECK(test::run_producing_blocks(runner, fixture.delivery_x.run_iteration(), {&millau}) ==
          DeliveryOutcome::kDelivered);
    const InboundLaneData inbound{millau.runtime().messages()->inbound_lane_data(kLane)};
    REQUIRE(inbound.relayers.size() == 1);
    CHECK(inbound.relayers[0].messages.dispatch_results == std::vector<bool>{false});
    CHECK(millau.runtime().dispatch().failed_messages() == 1);

    CHECK(runner.run(fixture.delivery_x.run_iteration()) == DeliveryOutcome::kNothingToDeliver);
    CHECK(runner.run(fixture.delivery_y.run_iteration()) == DeliveryOutcome::kNothingToDeliver);
}

}  // namespace trestle::relay

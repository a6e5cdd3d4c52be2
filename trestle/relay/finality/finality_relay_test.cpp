// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch.hpp>

#include <boost/system/system_error.hpp>

#include <trestle/dev/dev_chain.hpp>
#include <trestle/dev/dev_chain_client.hpp>
#include <trestle/infra/test_util/log.hpp>
#include <trestle/infra/test_util/task_runner.hpp>
#include <trestle/relay/finality/bridge_initialization.hpp>
#include <trestle/relay/finality/finality_loop.hpp>
#include <trestle/relay/finality/finality_proof_stream.hpp>
#include <trestle/relay/test_util/dev_chains.hpp>

namespace trestle::relay {

namespace {

    const AccountId kRelayer{0x01};

    dev::DevChainConfig millau_config() {
        dev::DevChainConfig config;
        config.name = "Millau";
        config.runtime.header_chain = ledger::HeaderChainConfig{};
        config.bridge_owner = kRelayer;
        return config;
    }

}  // namespace

TEST_CASE("Finality relay between dev chains", "[relay][finality][dev]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    dev::DevChain rialto{runner.executor(), dev::DevChainConfig{.name = "Rialto"}};
    dev::DevChain millau{runner.executor(), millau_config()};
    dev::DevChainClient rialto_client{rialto};
    dev::DevChainClient millau_client{millau};
    ChainFinalitySource source{rialto_client};
    ChainFinalityTarget target{millau_client, kRelayer};
    Metrics metrics;
    FinalityLoop loop{runner.executor(), source, target, FinalitySyncParams{}, &metrics};
    FinalityProofStream stream{source};

    CHECK_THROWS_AS(runner.run(loop.run_iteration()), RelayError);

    REQUIRE(test::run_producing_blocks(runner, initialize_bridge(source, target), {&millau}) ==
            InitializationOutcome::kInitialized);
    CHECK(test::run_producing_blocks(runner, initialize_bridge(source, target), {&millau}) ==
          InitializationOutcome::kAlreadyInitialized);
    CHECK(millau.runtime().header_chain()->best_finalized() == rialto.best_finalized_header_id());

    // block 4 enacts a new authority set, 8 keeps a persistent justification
    for (int i{0}; i < 3; ++i) {
        rialto.produce_block();
    }
    rialto.schedule_authority_change(4, 11);
    for (int i{0}; i < 7; ++i) {
        rialto.produce_block();
    }

    auto first_streamed{runner.spawn_future(stream.next())};
    test::poll(runner);
    rialto.finalize(10);
    runner.poll_context_until_future_is_ready(first_streamed);
    const finality::Justification mandatory_proof{first_streamed.get()};
    CHECK(mandatory_proof.commit.target == rialto.header_by_number(4)->id());
    const finality::Justification best_proof{runner.run(stream.next())};
    CHECK(best_proof.commit.target == rialto.header_by_number(10)->id());
    REQUIRE(loop.streamed_proofs().try_send(mandatory_proof));
    REQUIRE(loop.streamed_proofs().try_send(best_proof));

    SECTION("mandatory header first, then the best streamed proof") {
        CHECK(test::run_producing_blocks(runner, loop.run_iteration(), {&millau}) == IterationOutcome::kSubmitted);
        CHECK(millau.runtime().header_chain()->best_finalized() == rialto.header_by_number(4)->id());
        CHECK(millau.runtime().header_chain()->current_authority_set()->set_id == 1);

        CHECK(test::run_producing_blocks(runner, loop.run_iteration(), {&millau}) == IterationOutcome::kSubmitted);
        CHECK(millau.runtime().header_chain()->best_finalized() == rialto.header_by_number(10)->id());

        CHECK(test::run_producing_blocks(runner, loop.run_iteration(), {&millau}) == IterationOutcome::kIdle);
        const Labels labels{{"source", "Rialto"}, {"target", "Millau"}};
        CHECK(metrics.value("finality_best_block_at_target", labels) == 10);
    }

    SECTION("network failures surface as system errors") {
        rialto.fail_next_requests(1);
        try {
            runner.run(loop.run_iteration());
            FAIL("expected a network error");
        } catch (const boost::system::system_error&) {
            CHECK(classify(std::current_exception()) == ErrorKind::kTransientNetwork);
        }
        CHECK(test::run_producing_blocks(runner, loop.run_iteration(), {&millau}) == IterationOutcome::kSubmitted);
    }

    SECTION("lost subscription is reopened") {
        rialto.drop_subscriptions();
        auto streamed{runner.spawn_future(stream.next())};
        test::poll(runner);
        const Header header{rialto.produce_and_finalize_block()};
        runner.poll_context_until_future_is_ready(streamed);
        CHECK(streamed.get().commit.target == header.id());
        CHECK(stream.resubscriptions() == 1);
        CHECK(rialto_client.reconnections() == 1);
    }
}

}  // namespace trestle::relay

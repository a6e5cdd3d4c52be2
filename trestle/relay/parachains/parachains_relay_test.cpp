// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch.hpp>

#include <trestle/dev/dev_chain.hpp>
#include <trestle/dev/dev_chain_client.hpp>
#include <trestle/infra/test_util/log.hpp>
#include <trestle/infra/test_util/task_runner.hpp>
#include <trestle/relay/finality/bridge_initialization.hpp>
#include <trestle/relay/finality/finality_loop.hpp>
#include <trestle/relay/parachains/parachains_loop.hpp>
#include <trestle/relay/test_util/dev_chains.hpp>

namespace trestle::relay {

namespace {

    const AccountId kRelayer{0x02};
    constexpr ParaId kParaId{2000};

    dev::DevChainConfig millau_config() {
        dev::DevChainConfig config;
        config.name = "Millau";
        config.runtime.header_chain = ledger::HeaderChainConfig{};
        config.runtime.parachains = ledger::ParachainsConfig{};
        config.bridge_owner = kRelayer;
        return config;
    }

    Header para_header(BlockNum number) {
        Header header;
        header.number = number;
        header.state_root = Hash::of(Bytes{0x50, static_cast<uint8_t>(number)});
        return header;
    }

}  // namespace

TEST_CASE("Parachains relay between dev chains", "[relay][parachains][dev]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    dev::DevChain rialto{runner.executor(), dev::DevChainConfig{.name = "Rialto"}};
    dev::DevChain millau{runner.executor(), millau_config()};
    dev::DevChainClient rialto_client{rialto};
    dev::DevChainClient millau_client{millau};

    ChainFinalitySource finality_source{rialto_client};
    ChainFinalityTarget finality_target{millau_client, kRelayer};
    FinalityLoop finality_loop{runner.executor(), finality_source, finality_target, FinalitySyncParams{}};

    ChainParachainsSource source{rialto_client};
    ChainParachainsTarget target{millau_client, kRelayer};
    ParachainsSyncParams params;
    params.parachains = {kParaId};
    ParachainsLoop loop{runner.executor(), source, target, params};

    try {
        runner.run(target.best_finalized_relay_block());
        FAIL("expected the relay chain light client to be uninitialized");
    } catch (const RelayError& ex) {
        CHECK(ex.kind() == ErrorKind::kNotInitialized);
    }

    REQUIRE(test::run_producing_blocks(runner, initialize_bridge(finality_source, finality_target), {&millau}) ==
            InitializationOutcome::kInitialized);

    // the head is stored in block 1, block 8 keeps a persistent justification
    const Header head{para_header(42)};
    rialto.set_parachain_head(kParaId, head);
    for (int i{0}; i < 8; ++i) {
        rialto.produce_block();
    }
    rialto.finalize(8);
    REQUIRE(test::run_producing_blocks(runner, finality_loop.run_iteration(), {&millau}) ==
            IterationOutcome::kSubmitted);
    const HeaderId relay_block{rialto.header_by_number(8)->id()};
    REQUIRE(runner.run(target.best_finalized_relay_block()) == relay_block);

    CHECK(runner.run(source.parachain_head(relay_block, kParaId)) == AvailableHead::available(head.id()));
    CHECK(runner.run(source.parachain_head(relay_block, kParaId + 1)) == AvailableHead::missing());
    CHECK(runner.run(source.parachain_head({99, Hash{}}, kParaId)) == AvailableHead::unavailable());
    CHECK_FALSE(runner.run(target.parachain_head(kParaId)));

    runner.run(loop.poll_heads());
    CHECK(test::run_producing_blocks(runner, loop.submit_next_head(), {&millau}) == HeadSubmissionOutcome::kSubmitted);
    CHECK(millau.runtime().parachains()->best_parachain_head_id(kParaId) == head.id());
    CHECK(runner.run(target.parachain_head(kParaId)) == ParaHeadAtTarget{head.id(), 8});

    runner.run(loop.poll_heads());
    CHECK(runner.run(loop.submit_next_head()) == HeadSubmissionOutcome::kUpToDate);
    CHECK(millau.pending_transactions() == 0);
}

}  // namespace trestle::relay

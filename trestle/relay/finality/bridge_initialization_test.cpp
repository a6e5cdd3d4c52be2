// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "bridge_initialization.hpp"

#include <catch2/catch.hpp>
#include <gmock/gmock.h>

#include <trestle/infra/test_util/log.hpp>
#include <trestle/infra/test_util/task_runner.hpp>
#include <trestle/relay/common/error.hpp>
#include <trestle/relay/test_util/mock_finality_clients.hpp>

namespace trestle::relay {

using testing::InvokeWithoutArgs;

TEST_CASE("initialize_bridge", "[relay][finality]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    testing::StrictMock<test::MockFinalitySource> source;
    testing::StrictMock<test::MockFinalityTarget> target;

    Header header;
    header.number = 12;
    const ledger::InitializationData data{.header = header, .authority_set = {{AuthorityId{0x02}}, 3}};

    SECTION("already initialized") {
        EXPECT_CALL(target, best_finalized_source_id())
            .WillOnce(InvokeWithoutArgs([]() -> Task<std::optional<HeaderId>> { co_return HeaderId{}; }));
        CHECK(runner.run(initialize_bridge(source, target)) == InitializationOutcome::kAlreadyInitialized);
    }

    SECTION("not initialized") {
        EXPECT_CALL(target, best_finalized_source_id())
            .WillOnce(InvokeWithoutArgs([]() -> Task<std::optional<HeaderId>> { co_return std::nullopt; }));
        EXPECT_CALL(source, prepare_initialization_data())
            .WillOnce(InvokeWithoutArgs([&]() -> Task<ledger::InitializationData> { co_return data; }));

        SECTION("initialized") {
            EXPECT_CALL(target, initialize(data))
                .WillOnce(InvokeWithoutArgs([]() -> Task<std::unique_ptr<TransactionTracker>> {
                    co_return test::make_resolved_tracker(TrackedTransactionStatus::finalized_at({}));
                }));
            CHECK(runner.run(initialize_bridge(source, target)) == InitializationOutcome::kInitialized);
        }

        SECTION("transaction lost") {
            EXPECT_CALL(target, initialize(data))
                .WillOnce(InvokeWithoutArgs([]() -> Task<std::unique_ptr<TransactionTracker>> {
                    co_return test::make_resolved_tracker(TrackedTransactionStatus::lost());
                }));
            CHECK_THROWS_AS(runner.run(initialize_bridge(source, target)), RelayError);
        }

        SECTION("dry run") {
            CHECK(runner.run(initialize_bridge(source, target, /*dry_run=*/true)) == InitializationOutcome::kDryRun);
        }
    }
}

}  // namespace trestle::relay

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "finality_loop.hpp"

#include <map>
#include <vector>

#include <catch2/catch.hpp>
#include <gmock/gmock.h>

#include <trestle/infra/concurrency/sleep.hpp>
#include <trestle/infra/concurrency/timeout.hpp>
#include <trestle/infra/test_util/log.hpp>
#include <trestle/infra/test_util/task_runner.hpp>
#include <trestle/relay/test_util/mock_finality_clients.hpp>

namespace trestle::relay {

using testing::_;
using testing::Invoke;
using testing::InvokeWithoutArgs;
using testing::NiceMock;

namespace {

    Header make_header(BlockNum number, bool mandatory = false, uint8_t fork = 0) {
        Header header;
        header.number = number;
        header.state_root = Hash::of(Bytes{static_cast<uint8_t>(number), fork});
        if (mandatory) {
            header.digest.scheduled_change = ScheduledChange{};
        }
        return header;
    }

    finality::Justification justify(const Header& header) {
        return {.round = 1, .commit = {.target = header.id(), .precommits = {}}};
    }

    struct FinalityLoopFixture : public test_util::TaskRunner {
        explicit FinalityLoopFixture(FinalitySyncParams params = {})
            : loop{executor(), source, target, params, &metrics} {
            add_source_header(5, false, false);
            add_source_header(6, false, false);
            add_source_header(7, false, true);
            add_source_header(8, true, true);
            add_source_header(9, false, true);
            add_source_header(10, false, false);
            best_at_target = source_headers.at(5).header.id();

            ON_CALL(source, best_finalized_number()).WillByDefault(InvokeWithoutArgs([this]() -> Task<BlockNum> {
                co_return best_at_source;
            }));
            ON_CALL(source, header_and_proof(_)).WillByDefault(Invoke([this](BlockNum number) -> Task<HeaderAndProof> {
                co_return source_headers.at(number);
            }));
            ON_CALL(target, best_finalized_source_id())
                .WillByDefault(InvokeWithoutArgs([this]() -> Task<std::optional<HeaderId>> {
                    co_return best_at_target;
                }));
            ON_CALL(target, submit_finality_proof(_, _))
                .WillByDefault(Invoke([this](const Header& header, const finality::Justification& justification)
                                          -> Task<std::unique_ptr<TransactionTracker>> {
                    submitted.push_back({header, justification});
                    if (import_submitted) {
                        best_at_target = header.id();
                    }
                    co_return test::make_resolved_tracker(submission_status);
                }));
        }

        void add_source_header(BlockNum number, bool mandatory, bool persistent) {
            const Header header{make_header(number, mandatory)};
            source_headers[number] = {header, persistent ? std::optional{justify(header)} : std::nullopt};
        }

        std::vector<BlockNum> submitted_numbers() const {
            std::vector<BlockNum> numbers;
            for (const auto& justified : submitted) {
                numbers.push_back(justified.header.number);
            }
            return numbers;
        }

        test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
        NiceMock<test::MockFinalitySource> source;
        NiceMock<test::MockFinalityTarget> target;
        Metrics metrics;

        std::map<BlockNum, HeaderAndProof> source_headers;
        BlockNum best_at_source{10};
        std::optional<HeaderId> best_at_target;
        std::vector<JustifiedHeader> submitted;
        bool import_submitted{true};
        TrackedTransactionStatus submission_status{TrackedTransactionStatus::finalized_at({})};

        FinalityLoop loop;
    };

    FinalitySyncParams params_with(HeadersToRelay headers_to_relay) {
        FinalitySyncParams params;
        params.headers_to_relay = headers_to_relay;
        return params;
    }

}  // namespace

TEST_CASE("FinalityLoop relays mandatory, persistent and streamed proofs", "[relay][finality]") {
    FinalityLoopFixture fixture;

    // proofs streamed before the source finalizes their headers must survive until needed
    const Header header12{make_header(12)};
    const Header header14{make_header(14)};
    REQUIRE(fixture.loop.streamed_proofs().try_send(justify(header12)));
    REQUIRE(fixture.loop.streamed_proofs().try_send(justify(header14)));

    // 7 has a persistent proof but 8 is mandatory, 9 is the best persistent one afterwards
    CHECK(fixture.run(fixture.loop.run_iteration()) == IterationOutcome::kSubmitted);
    CHECK(fixture.run(fixture.loop.run_iteration()) == IterationOutcome::kSubmitted);
    CHECK(fixture.submitted_numbers() == std::vector<BlockNum>{8, 9});
    CHECK(fixture.run(fixture.loop.run_iteration()) == IterationOutcome::kNoProof);
    CHECK(fixture.loop.recent_proofs_count() == 2);

    // only streamed proofs cover the new headers: the best one is used
    fixture.add_source_header(11, false, false);
    fixture.source_headers[12] = {header12, std::nullopt};
    fixture.add_source_header(13, false, false);
    fixture.source_headers[14] = {header14, std::nullopt};
    fixture.best_at_source = 14;
    CHECK(fixture.run(fixture.loop.run_iteration()) == IterationOutcome::kSubmitted);
    CHECK(fixture.submitted.back().justification == justify(header14));
    CHECK(fixture.loop.recent_proofs_count() == 0);

    fixture.add_source_header(15, false, false);
    fixture.add_source_header(16, false, true);
    fixture.add_source_header(17, false, false);
    fixture.best_at_source = 17;
    CHECK(fixture.run(fixture.loop.run_iteration()) == IterationOutcome::kSubmitted);
    CHECK(fixture.submitted_numbers() == std::vector<BlockNum>{8, 9, 14, 16});

    CHECK(fixture.metrics.value("finality_best_block_at_source", {{"source", "Source"}, {"target", "Target"}}) == 17);
    CHECK(fixture.metrics.value("finality_is_using_same_fork", {{"source", "Source"}, {"target", "Target"}}) == 1);
}

TEST_CASE("FinalityLoop idles when target is up to date", "[relay][finality]") {
    FinalityLoopFixture fixture;
    fixture.best_at_target = fixture.source_headers.at(10).header.id();
    EXPECT_CALL(fixture.target, submit_finality_proof(_, _)).Times(0);
    CHECK(fixture.run(fixture.loop.run_iteration()) == IterationOutcome::kIdle);
}

TEST_CASE("FinalityLoop select_header_to_submit", "[relay][finality]") {
    const auto select{[](HeadersToRelay headers_to_relay, bool has_mandatory) {
        FinalityLoopFixture fixture{params_with(headers_to_relay)};
        for (BlockNum number{6}; number <= 10; ++number) {
            fixture.add_source_header(number, has_mandatory && number == 8, true);
        }
        return fixture.run(fixture.loop.select_header_to_submit(5, 10));
    }};

    SECTION("without mandatory headers") {
        CHECK_FALSE(select(HeadersToRelay::kMandatory, false));
        const auto selected{select(HeadersToRelay::kAll, false)};
        REQUIRE(selected);
        CHECK(selected->header == make_header(10));
    }

    SECTION("with a mandatory header") {
        for (const auto mode : {HeadersToRelay::kMandatory, HeadersToRelay::kAll}) {
            const auto selected{select(mode, true)};
            REQUIRE(selected);
            CHECK(selected->header == make_header(8, true));
        }
    }

    SECTION("mandatory header without justification") {
        FinalityLoopFixture fixture;
        fixture.add_source_header(8, true, false);
        CHECK_THROWS_AS(fixture.run(fixture.loop.select_header_to_submit(5, 10)), RelayError);
    }
}

TEST_CASE("FinalityLoop detects forks", "[relay][finality]") {
    FinalityLoopFixture fixture;
    fixture.best_at_target = make_header(5, false, /*fork=*/42).id();
    EXPECT_CALL(fixture.target, submit_finality_proof(_, _)).Times(0);

    CHECK(fixture.run(fixture.loop.run_iteration()) == IterationOutcome::kForkDetected);
    CHECK(fixture.metrics.value("finality_is_using_same_fork", {{"source", "Source"}, {"target", "Target"}}) == 0);
}

TEST_CASE("FinalityLoop requires an initialized target", "[relay][finality]") {
    FinalityLoopFixture fixture;
    fixture.best_at_target.reset();
    try {
        fixture.run(fixture.loop.run_iteration());
        FAIL("expected RelayError");
    } catch (const RelayError& error) {
        CHECK(error.kind() == ErrorKind::kNotInitialized);
    }
}

TEST_CASE("FinalityLoop submission failures", "[relay][finality]") {
    FinalityLoopFixture fixture;

    SECTION("lost transaction is submitted again") {
        fixture.submission_status = TrackedTransactionStatus::lost();
        fixture.import_submitted = false;
        CHECK_THROWS_AS(fixture.run(fixture.loop.run_iteration()), RelayError);

        fixture.submission_status = TrackedTransactionStatus::finalized_at({});
        fixture.import_submitted = true;
        CHECK(fixture.run(fixture.loop.run_iteration()) == IterationOutcome::kSubmitted);
        CHECK(fixture.submitted_numbers() == std::vector<BlockNum>{8, 8});
    }

    SECTION("finalized transaction that did not import the header") {
        fixture.import_submitted = false;
        try {
            fixture.run(fixture.loop.run_iteration());
            FAIL("expected RelayError");
        } catch (const RelayError& error) {
            CHECK(error.kind() == ErrorKind::kTransactionLost);
        }
    }
}

TEST_CASE("FinalityLoop stalled submission", "[relay][finality]") {
    using namespace std::chrono_literals;
    FinalitySyncParams params;
    params.timing.stall_timeout = 10ms;
    FinalityLoopFixture fixture{params};
    fixture.import_submitted = false;
    ON_CALL(fixture.target, submit_finality_proof(_, _))
        .WillByDefault(Invoke([&](const Header& header, const finality::Justification& justification)
                                  -> Task<std::unique_ptr<TransactionTracker>> {
            fixture.submitted.push_back({header, justification});
            auto tracker{std::make_unique<test::MockTransactionTracker>()};
            EXPECT_CALL(*tracker, wait()).WillOnce(InvokeWithoutArgs([]() -> Task<TrackedTransactionStatus> {
                co_await sleep(1h);
                co_return TrackedTransactionStatus::lost();
            }));
            co_return tracker;
        }));

    CHECK_THROWS_AS(fixture.run(fixture.loop.run_iteration()), concurrency::TimeoutExpiredError);
    // the stall timeout has passed once the tracker timed out
    CHECK_THROWS_AS(fixture.run(fixture.loop.run_iteration()), concurrency::TimeoutExpiredError);
    CHECK(fixture.submitted_numbers() == std::vector<BlockNum>{8, 8});
}

TEST_CASE("FinalityLoop dry run", "[relay][finality]") {
    FinalitySyncParams params;
    params.dry_run = true;
    FinalityLoopFixture fixture{params};
    EXPECT_CALL(fixture.target, submit_finality_proof(_, _)).Times(0);
    CHECK(fixture.run(fixture.loop.run_iteration()) == IterationOutcome::kDryRun);
}

TEST_CASE("FinalityLoop bounds recent proofs", "[relay][finality]") {
    FinalitySyncParams params;
    params.recent_finality_proofs_limit = 2;
    FinalityLoopFixture fixture{params};
    fixture.best_at_target = fixture.source_headers.at(10).header.id();
    for (BlockNum number{20}; number < 24; ++number) {
        fixture.loop.streamed_proofs().try_send(justify(make_header(number)));
    }
    CHECK(fixture.run(fixture.loop.run_iteration()) == IterationOutcome::kIdle);
    CHECK(fixture.loop.recent_proofs_count() == 2);
}

}  // namespace trestle::relay

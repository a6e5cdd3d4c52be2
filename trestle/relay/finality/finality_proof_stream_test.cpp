// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "finality_proof_stream.hpp"

#include <deque>

#include <catch2/catch.hpp>
#include <gmock/gmock.h>

#include <trestle/infra/test_util/log.hpp>
#include <trestle/infra/test_util/task_runner.hpp>
#include <trestle/relay/test_util/mock_finality_clients.hpp>

namespace trestle::relay {

using testing::InvokeWithoutArgs;

namespace {

    Bytes encode_justification(BlockNum number) {
        finality::Justification justification;
        justification.commit.target.number = number;
        Bytes encoded;
        codec::encode(encoded, justification);
        return encoded;
    }

    //! Subscription replaying items, std::nullopt marks the loss of the subscription
    std::unique_ptr<FinalitySubscription> make_subscription(std::deque<std::optional<Bytes>> items) {
        auto subscription{std::make_unique<test::MockFinalitySubscription>()};
        auto shared_items{std::make_shared<std::deque<std::optional<Bytes>>>(std::move(items))};
        EXPECT_CALL(*subscription, next())
            .WillRepeatedly(InvokeWithoutArgs([shared_items]() -> Task<std::optional<Bytes>> {
                if (shared_items->empty()) {
                    co_return std::nullopt;
                }
                auto item{std::move(shared_items->front())};
                shared_items->pop_front();
                co_return item;
            }));
        return subscription;
    }

}  // namespace

TEST_CASE("FinalityProofStream", "[relay][finality]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    testing::StrictMock<test::MockFinalitySource> source;
    FinalityProofStream stream{source};

    SECTION("skips malformed proofs") {
        EXPECT_CALL(source, subscribe()).WillOnce(InvokeWithoutArgs([]() -> Task<std::unique_ptr<FinalitySubscription>> {
            co_return make_subscription({Bytes{0x01, 0x02}, encode_justification(7), encode_justification(9)});
        }));
        CHECK(runner.run(stream.next()).commit.target.number == 7);
        CHECK(runner.run(stream.next()).commit.target.number == 9);
        CHECK(stream.resubscriptions() == 0);
    }

    SECTION("resubscribes after the subscription is lost") {
        testing::InSequence sequence;
        EXPECT_CALL(source, subscribe()).WillOnce(InvokeWithoutArgs([]() -> Task<std::unique_ptr<FinalitySubscription>> {
            co_return make_subscription({encode_justification(3), std::nullopt});
        }));
        EXPECT_CALL(source, reconnect()).WillOnce(InvokeWithoutArgs([]() -> Task<void> { co_return; }));
        EXPECT_CALL(source, subscribe()).WillOnce(InvokeWithoutArgs([]() -> Task<std::unique_ptr<FinalitySubscription>> {
            co_return make_subscription({encode_justification(4)});
        }));

        CHECK(runner.run(stream.next()).commit.target.number == 3);
        CHECK(runner.run(stream.next()).commit.target.number == 4);
        CHECK(stream.resubscriptions() == 1);
    }

    SECTION("subscription failures propagate") {
        EXPECT_CALL(source, subscribe()).WillOnce(InvokeWithoutArgs([]() -> Task<std::unique_ptr<FinalitySubscription>> {
            throw RelayError{ErrorKind::kTransientNetwork, "connection refused"};
            co_return nullptr;
        }));
        CHECK_THROWS_AS(runner.run(stream.next()), RelayError);
    }
}

}  // namespace trestle::relay

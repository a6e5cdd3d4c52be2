// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "relay_loop.hpp"

#include <vector>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>
#include <catch2/catch.hpp>

#include <trestle/infra/common/decoding_exception.hpp>
#include <trestle/infra/test_util/log.hpp>
#include <trestle/infra/test_util/task_runner.hpp>

namespace trestle::relay {

using namespace std::chrono_literals;

namespace {

    class RecordingRetry : public RetryPolicy {
      public:
        std::chrono::milliseconds delay(size_t attempt) const override {
            attempts.push_back(attempt);
            return 1ms;
        }

        mutable std::vector<size_t> attempts;
    };

}  // namespace

TEST_CASE("Relay loop retries, skips and halts", "[relay][common]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    RecordingRetry retry;
    int iterations{0};

    const auto iteration = [&]() -> Task<void> {
        switch (++iterations) {
            case 1:
                throw boost::system::system_error{boost::asio::error::connection_reset};
            case 2:
                throw RelayError{ErrorKind::kTransactionLost, "lost"};
            case 3:
                throw DecodingException{DecodingError::kInputTooShort, "malformed"};
            case 4:
                co_return;
            case 5:
                throw RelayError{ErrorKind::kCapacityExceeded, "full"};
            default:
                throw RelayError{ErrorKind::kOrderingViolation, "diverged"};
        }
    };

    CHECK(runner.run(run_relay_loop("test", retry, 1ms, iteration)) == ErrorKind::kOrderingViolation);
    CHECK(iterations == 6);
    // a successful iteration resets the attempt counter
    CHECK(retry.attempts == std::vector<size_t>{1, 2, 1});
}

TEST_CASE("Relay loop runs a step until it is done", "[relay][common]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    RecordingRetry retry;
    int steps{0};

    SECTION("done after failures and pending steps") {
        const auto step = [&]() -> Task<bool> {
            switch (++steps) {
                case 1:
                    throw RelayError{ErrorKind::kTransactionLost, "lost"};
                case 2:
                    throw boost::system::system_error{boost::asio::error::connection_reset};
                case 3:
                    co_return false;
                default:
                    co_return true;
            }
        };
        CHECK_FALSE(runner.run(run_until_done("test", retry, 1ms, step)));
        CHECK(steps == 4);
        CHECK(retry.attempts == std::vector<size_t>{1, 2});
    }

    SECTION("halted") {
        const auto step = [&]() -> Task<bool> {
            ++steps;
            throw RelayError{ErrorKind::kFatal, "broken"};
            co_return true;
        };
        CHECK(runner.run(run_until_done("test", retry, 1ms, step)) == ErrorKind::kFatal);
        CHECK(steps == 1);
    }
}

TEST_CASE("Relay loop propagates cancellation", "[relay][common]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    const FixedIntervalRetry retry{1ms};

    const auto cancelled = []() -> Task<void> {
        throw boost::system::system_error{make_error_code(boost::system::errc::operation_canceled)};
        co_return;
    };
    CHECK_THROWS_AS(runner.run(run_relay_loop("test", retry, 1ms, cancelled)), boost::system::system_error);
}

}  // namespace trestle::relay

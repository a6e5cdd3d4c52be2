// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "relay_loop.hpp"

#include <exception>
#include <optional>
#include <type_traits>

#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>
#include <magic_enum.hpp>

#include <trestle/infra/common/log.hpp>
#include <trestle/infra/concurrency/sleep.hpp>

namespace trestle::relay {

namespace {

    //! Runs one iteration, returning the error it failed with. Cancellation is rethrown.
    template <typename T>
    Task<std::exception_ptr> run_iteration(const std::function<Task<T>()>& iteration, T* result) {
        std::exception_ptr error;
        try {
            if constexpr (std::is_void_v<T>) {
                co_await iteration();
            } else {
                *result = co_await iteration();
            }
        } catch (const boost::system::system_error& ex) {
            if (ex.code() == boost::system::errc::operation_canceled) {
                throw;
            }
            error = std::current_exception();
        } catch (const std::exception&) {
            error = std::current_exception();
        }
        co_return error;
    }

    //! Waits before the next attempt, or returns the error kind when it halts the loop
    Task<std::optional<ErrorKind>> back_off(const std::string& component, const RetryPolicy& retry_policy,
                                            std::chrono::milliseconds tick, const std::exception_ptr& error,
                                            size_t failures) {
        const ErrorKind kind{classify(error)};
        const ErrorAction action{action_for(kind)};
        const std::string kind_name{magic_enum::enum_name(kind)};
        switch (action) {
            case ErrorAction::kHalt:
                TRESTLE_ERROR_M("Relay loop halted", {"component", component, "kind", kind_name,
                                                      "error", what(error)});
                co_return kind;
            case ErrorAction::kSkip:
                TRESTLE_WARN_M("Relay iteration skipped", {"component", component, "kind", kind_name,
                                                           "error", what(error)});
                co_await sleep(tick);
                break;
            case ErrorAction::kRetry:
                TRESTLE_WARN_M("Relay iteration failed", {"component", component, "kind", kind_name,
                                                          "attempt", std::to_string(failures), "error", what(error)});
                co_await sleep(retry_policy.delay(failures));
                break;
        }
        co_return std::nullopt;
    }

}  // namespace

Task<ErrorKind> run_relay_loop(std::string component, const RetryPolicy& retry_policy,
                               std::chrono::milliseconds tick, std::function<Task<void>()> iteration) {
    size_t failures{0};
    while (true) {
        const std::exception_ptr error{co_await run_iteration<void>(iteration, nullptr)};
        if (!error) {
            failures = 0;
            co_await sleep(tick);
            continue;
        }
        if (const auto halted{co_await back_off(component, retry_policy, tick, error, ++failures)}) {
            co_return *halted;
        }
    }
}

Task<std::optional<ErrorKind>> run_until_done(std::string component, const RetryPolicy& retry_policy,
                                              std::chrono::milliseconds tick, std::function<Task<bool>()> step) {
    size_t failures{0};
    while (true) {
        bool done{false};
        const std::exception_ptr error{co_await run_iteration<bool>(step, &done)};
        if (!error) {
            if (done) {
                co_return std::nullopt;
            }
            failures = 0;
            co_await sleep(tick);
            continue;
        }
        if (const auto halted{co_await back_off(component, retry_policy, tick, error, ++failures)}) {
            co_return halted;
        }
    }
}

}  // namespace trestle::relay

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "parallel_group_utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/cancellation_condition.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

namespace trestle::concurrency {

using namespace boost::asio;
using namespace boost::asio::experimental;

static bool is_operation_cancelled_error(const std::exception_ptr& ex_ptr) {
    try {
        std::rethrow_exception(ex_ptr);
    } catch (const boost::system::system_error& e) {
        return e.code() == boost::system::errc::operation_canceled;
    } catch (...) {
        return false;
    }
}

void rethrow_first_exception_if_any(const std::vector<std::exception_ptr>& exceptions,
                                    const std::vector<size_t>& order) {
    std::exception_ptr first_cancelled_exception;

    for (size_t i : order) {
        const auto& ex = exceptions[i];
        if (!ex) {
            continue;
        }
        if (!is_operation_cancelled_error(ex)) {
            std::rethrow_exception(ex);
        }
        if (!first_cancelled_exception) {
            first_cancelled_exception = ex;
        }
    }

    if (first_cancelled_exception) {
        std::rethrow_exception(first_cancelled_exception);
    }
}

Task<void> generate_parallel_group_task(size_t count, absl::FunctionRef<Task<void>(size_t)> task_factory) {
    if (count == 0) {
        co_return;
    }

    auto executor = co_await this_coro::executor;

    using OperationType = decltype(co_spawn(executor, ([]() -> Task<void> { co_return; })(), deferred));
    std::vector<OperationType> operations;
    operations.reserve(count);
    for (size_t i{0}; i < count; ++i) {
        operations.push_back(co_spawn(executor, task_factory(i), deferred));
    }

    auto group = make_parallel_group(std::move(operations));
    auto [order, exceptions] = co_await group.async_wait(wait_for_one_error(), use_awaitable);
    rethrow_first_exception_if_any(exceptions, order);
}

}  // namespace trestle::concurrency

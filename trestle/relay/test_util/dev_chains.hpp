// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <future>
#include <initializer_list>
#include <utility>

#include <trestle/dev/dev_chain.hpp>
#include <trestle/infra/concurrency/task.hpp>
#include <trestle/infra/test_util/task_runner.hpp>

namespace trestle::relay::test {

//! Runs the handlers ready to run, without waiting for timers
inline void poll(test_util::TaskRunner& runner) {
    runner.ioc().restart();
    runner.ioc().poll();
}

//! Runs task to completion, producing and finalizing a block on chains as soon as they pool transactions
template <typename TResult>
TResult run_producing_blocks(test_util::TaskRunner& runner, Task<TResult> task,
                             std::initializer_list<dev::DevChain*> chains) {
    using namespace std::chrono_literals;
    auto future{runner.spawn_future(std::move(task))};
    while (future.wait_for(0s) != std::future_status::ready) {
        runner.ioc().restart();
        runner.ioc().run_for(1ms);
        for (dev::DevChain* chain : chains) {
            if (chain->pending_transactions() > 0) {
                chain->produce_and_finalize_block();
            }
        }
    }
    return future.get();
}

}  // namespace trestle::relay::test

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "shutdown_signal.hpp"

#include <iostream>
#include <string>

#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <trestle/infra/common/log.hpp>

namespace trestle::cmd::common {

static void log_signal(int signal_number) {
    std::cout << "\n";
    TRESTLE_INFO_M("Signal caught", {"number", std::to_string(signal_number)});
}

Task<ShutdownSignal::SignalNumber> ShutdownSignal::wait_me() {
    int signal_number = co_await signals_.async_wait(boost::asio::use_awaitable);
    log_signal(signal_number);
    co_return signal_number;
}

Task<ShutdownSignal::SignalNumber> ShutdownSignal::wait() {
    auto executor = co_await boost::asio::this_coro::executor;
    ShutdownSignal signal{executor};
    co_return (co_await signal.wait_me());
}

}  // namespace trestle::cmd::common

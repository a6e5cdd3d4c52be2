// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <trestle/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/signal_set.hpp>

namespace trestle::cmd::common {

//! Waits for SIGINT or SIGTERM
class ShutdownSignal {
  public:
    explicit ShutdownSignal(const boost::asio::any_io_executor& executor)
        : signals_(executor, SIGINT, SIGTERM) {}

    using SignalNumber = int;

    Task<SignalNumber> wait_me();
    static Task<SignalNumber> wait();

  private:
    boost::asio::signal_set signals_;
};

}  // namespace trestle::cmd::common

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>

namespace trestle::relay {

//! Delay before retrying a failed relay iteration
class RetryPolicy {
  public:
    virtual ~RetryPolicy() = default;

    //! \param attempt number of consecutive failures, starting at 1
    virtual std::chrono::milliseconds delay(size_t attempt) const = 0;
};

class FixedIntervalRetry : public RetryPolicy {
  public:
    explicit FixedIntervalRetry(std::chrono::milliseconds interval) : interval_{interval} {}

    std::chrono::milliseconds delay(size_t) const override { return interval_; }

  private:
    std::chrono::milliseconds interval_;
};

}  // namespace trestle::relay

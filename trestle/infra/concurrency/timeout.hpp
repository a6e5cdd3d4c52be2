// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <stdexcept>

#include <trestle/infra/concurrency/task.hpp>

namespace trestle::concurrency {

//! Throws TimeoutExpiredError once duration elapsed, returns silently if cancelled before
Task<void> timeout(std::chrono::milliseconds duration);

class TimeoutExpiredError : public std::runtime_error {
  public:
    TimeoutExpiredError() : std::runtime_error("Timeout has expired") {}
};

}  // namespace trestle::concurrency

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include <trestle/infra/concurrency/task.hpp>
#include <trestle/relay/common/error.hpp>
#include <trestle/relay/common/retry.hpp>

namespace trestle::relay {

//! Runs iteration every tick until cancelled. Failed iterations are retried or skipped as their
//! error kind dictates; an error demanding a halt ends the loop and is returned.
Task<ErrorKind> run_relay_loop(std::string component, const RetryPolicy& retry_policy,
                               std::chrono::milliseconds tick, std::function<Task<void>()> iteration);

//! Runs step every tick until it returns true, handling its failures like run_relay_loop.
//! Returns std::nullopt once done, the error kind when an error halts it.
Task<std::optional<ErrorKind>> run_until_done(std::string component, const RetryPolicy& retry_policy,
                                              std::chrono::milliseconds tick, std::function<Task<bool>()> step);

}  // namespace trestle::relay

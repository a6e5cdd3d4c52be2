// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <vector>

#include <absl/functional/function_ref.h>

#include <trestle/infra/concurrency/task.hpp>

namespace trestle::concurrency {

//! Rethrows the first exception in completion order, preferring real errors over cancellations
void rethrow_first_exception_if_any(const std::vector<std::exception_ptr>& exceptions,
                                    const std::vector<size_t>& order);

//! Runs count tasks in parallel until all complete or one fails, cancelling the others
Task<void> generate_parallel_group_task(size_t count, absl::FunctionRef<Task<void>(size_t)> task_factory);

}  // namespace trestle::concurrency

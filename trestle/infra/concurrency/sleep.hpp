// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>

#include <trestle/infra/concurrency/task.hpp>

namespace trestle {

Task<void> sleep(std::chrono::milliseconds duration);

}  // namespace trestle

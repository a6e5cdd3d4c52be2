// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <trestle/infra/concurrency/task.hpp>
#include <trestle/relay/finality/finality_clients.hpp>

namespace trestle::relay {

enum class InitializationOutcome {
    kInitialized,
    kAlreadyInitialized,
    kDryRun,  // Initialization data prepared, transaction not submitted
};

//! Initializes the light client of source at target with the best finalized header of source.
//! A no-op when target is already initialized. Throws RelayError{kTransactionLost} when the
//! initialization transaction fails.
Task<InitializationOutcome> initialize_bridge(FinalitySource& source, FinalityTarget& target, bool dry_run = false);

}  // namespace trestle::relay

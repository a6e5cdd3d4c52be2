// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace trestle::relay {

enum class ErrorKind {
    kTransientNetwork,   // Node unreachable or timed out
    kDecode,             // Malformed data read from a node
    kNotInitialized,     // Bridge module not initialized at target
    kProofConstruction,  // Proof can't be built at the requested block
    kOrderingViolation,  // Target refuses the nonce or header order
    kCapacityExceeded,   // Target lane can't accept more messages before confirmations
    kPayment,            // Reward payout failed, reward stays credited
    kTransactionLost,    // Submitted transaction dropped or failed
    kFatal,
};

enum class ErrorAction {
    kRetry,  // Retry after the retry interval
    kSkip,   // Drop the item, carry on
    kHalt,   // Stop the pipeline
};

class RelayError : public std::runtime_error {
  public:
    RelayError(ErrorKind kind, const std::string& message) : std::runtime_error{message}, kind_{kind} {}

    ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
};

//! Maps any exception raised by a relay iteration onto the error taxonomy
ErrorKind classify(const std::exception_ptr& error);

ErrorAction action_for(ErrorKind kind);

//! Message of the exception or a placeholder when it carries none
std::string what(const std::exception_ptr& error);

}  // namespace trestle::relay

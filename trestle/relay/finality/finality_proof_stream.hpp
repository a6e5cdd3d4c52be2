// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include <trestle/core/finality/justification.hpp>
#include <trestle/infra/concurrency/task.hpp>
#include <trestle/relay/finality/finality_clients.hpp>

namespace trestle::relay {

//! Endless stream of the justifications a source finalizes. Malformed justifications are skipped,
//! a lost subscription is reopened after reconnecting to the source.
class FinalityProofStream {
  public:
    explicit FinalityProofStream(FinalitySource& source) : source_{source} {}

    //! Network failures of the source propagate, the next call starts over with a new subscription
    Task<finality::Justification> next();

    //! Drops the current subscription
    void reset() { subscription_.reset(); }

    size_t resubscriptions() const noexcept { return resubscriptions_; }

  private:
    FinalitySource& source_;
    std::unique_ptr<FinalitySubscription> subscription_;
    size_t resubscriptions_{0};
};

}  // namespace trestle::relay

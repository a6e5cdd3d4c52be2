// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <utility>

#include <trestle/core/state/kv_store.hpp>
#include <trestle/core/state/state_overlay.hpp>

namespace trestle::ledger {

//! Runs a ledger call on top of an overlay of the given store.
//! Writes reach the store only when the call returns Result::kOk.
template <class Result, class Call>
Result transactional(state::KeyValueStore& store, Call&& call) {
    state::StateOverlay overlay{store};
    const Result result{std::forward<Call>(call)(overlay)};
    if (result == Result::kOk) {
        overlay.commit();
    }
    return result;
}

}  // namespace trestle::ledger

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <utility>

#include <trestle/core/types/lane.hpp>

namespace trestle::ledger {

//! Dispatch origin of a ledger call: the chain governance (root) or a signed account
class Origin {
  public:
    static Origin root() { return Origin{std::nullopt}; }
    static Origin signed_by(const AccountId& account) { return Origin{account}; }

    bool is_root() const noexcept { return !signer_; }
    const std::optional<AccountId>& signer() const noexcept { return signer_; }

  private:
    explicit Origin(std::optional<AccountId> signer) : signer_{std::move(signer)} {}

    std::optional<AccountId> signer_;
};

}  // namespace trestle::ledger

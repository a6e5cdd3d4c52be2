// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <trestle/core/state/kv_store.hpp>
#include <trestle/core/types/lane.hpp>
#include <trestle/ledger/common/origin.hpp>

namespace trestle::ledger {

//! Owner of a ledger module, allowed together with root to change its operating mode
class OwnedModule {
  public:
    explicit OwnedModule(std::string_view module_name) : module_name_{module_name} {}

    const std::string& module_name() const noexcept { return module_name_; }

    std::optional<AccountId> owner(const state::KeyValueStore& store) const;
    void put_owner(state::KeyValueStore& store, const std::optional<AccountId>& owner) const;

    bool is_owner_or_root(const state::KeyValueStore& store, const Origin& origin) const;

  private:
    std::string module_name_;
};

}  // namespace trestle::ledger

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "owned_module.hpp"

#include <trestle/core/common/util.hpp>
#include <trestle/core/state/storage.hpp>
#include <trestle/infra/common/log.hpp>

namespace trestle::ledger {

static state::StorageValue<AccountId> owner_item(const std::string& module_name) {
    return {module_name, "PalletOwner"};
}

std::optional<AccountId> OwnedModule::owner(const state::KeyValueStore& store) const {
    return owner_item(module_name_).get(store);
}

void OwnedModule::put_owner(state::KeyValueStore& store, const std::optional<AccountId>& owner) const {
    if (owner) {
        owner_item(module_name_).put(store, *owner);
    } else {
        owner_item(module_name_).erase(store);
    }
    TRESTLE_INFO_M("Module owner changed",
                   {"module", module_name_, "owner", owner ? to_hex(ByteView{owner->bytes}, true) : "none"});
}

bool OwnedModule::is_owner_or_root(const state::KeyValueStore& store, const Origin& origin) const {
    if (origin.is_root()) {
        return true;
    }
    const auto current_owner{owner(store)};
    return current_owner && *current_owner == *origin.signer();
}

}  // namespace trestle::ledger

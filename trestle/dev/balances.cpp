// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "balances.hpp"

#include <cstring>

#include <magic_enum.hpp>

#include <trestle/core/codec/encode.hpp>
#include <trestle/core/types/hash.hpp>
#include <trestle/infra/common/log.hpp>

#include <trestle/core/state/storage.hpp>

namespace trestle::dev {

namespace {
    constexpr std::string_view kRewardsAccountSeed{"bridge-lane"};
}

AccountId rewards_account(const ledger::RewardsAccountParams& params) {
    Bytes seed{reinterpret_cast<const uint8_t*>(kRewardsAccountSeed.data()), kRewardsAccountSeed.size()};
    codec::encode(seed, params);
    const Hash digest{Hash::of(seed)};
    AccountId account;
    std::memcpy(account.bytes, digest.bytes + (kHashLength - kAddressLength), kAddressLength);
    return account;
}

struct Balances::Storage {
    explicit Storage(const std::string& module) : accounts{module, "Account"}, frozen{module, "Frozen"} {}

    state::StorageMap<AccountId, Balance> accounts;
    state::StorageMap<AccountId, bool> frozen;
};

Balances::Balances(state::KeyValueStore& store, const std::string& module_name)
    : store_{store}, storage_{std::make_unique<Storage>(module_name)} {}

Balances::~Balances() = default;

Balance Balances::balance(const AccountId& account) const {
    return storage_->accounts.get_or_default(store_, account);
}

void Balances::mint(state::KeyValueStore& state, const AccountId& account, const Balance& amount) const {
    const Balance current{storage_->accounts.get_or_default(state, account)};
    const Balance updated{current + amount < current ? ~Balance{0} : current + amount};
    storage_->accounts.put(state, account, updated);
}

TransferResult Balances::transfer(state::KeyValueStore& state, const AccountId& from, const AccountId& to,
                                  const Balance& amount) const {
    if (storage_->frozen.get_or_default(state, to)) {
        return TransferResult::kAccountFrozen;
    }
    const Balance from_balance{storage_->accounts.get_or_default(state, from)};
    if (from_balance < amount) {
        return TransferResult::kInsufficientBalance;
    }
    if (from == to) {
        return TransferResult::kOk;
    }
    if (from_balance == amount) {
        storage_->accounts.erase(state, from);
    } else {
        storage_->accounts.put(state, from, from_balance - amount);
    }
    mint(state, to, amount);
    return TransferResult::kOk;
}

void Balances::set_frozen(state::KeyValueStore& state, const AccountId& account, bool frozen) const {
    if (frozen) {
        storage_->frozen.put(state, account, true);
    } else {
        storage_->frozen.erase(state, account);
    }
}

bool Balances::pay_reward(state::KeyValueStore& state, const AccountId& relayer,
                          const ledger::RewardsAccountParams& params, const Balance& reward,
                          const AccountId& beneficiary) {
    const TransferResult result{transfer(state, rewards_account(params), beneficiary, reward)};
    if (result != TransferResult::kOk) {
        TRESTLE_DEBUG_M("Failed to pay relayer reward", {"relayer", to_hex(ByteView{relayer.bytes}, true),
                                                         "params", ledger::to_string(params),
                                                         "reward", intx::to_string(reward),
                                                         "result", std::string{magic_enum::enum_name(result)}});
        return false;
    }
    return true;
}

}  // namespace trestle::dev

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>

#include <trestle/core/state/kv_store.hpp>
#include <trestle/core/types/lane.hpp>
#include <trestle/ledger/relayers/reward_ledger.hpp>
#include <trestle/ledger/relayers/rewards_account.hpp>

namespace trestle::dev {

//! Account holding the rewards paid to the relayers of one lane
AccountId rewards_account(const ledger::RewardsAccountParams& params);

enum class [[nodiscard]] TransferResult {
    kOk,
    kInsufficientBalance,
    kAccountFrozen,  // Destination account refuses transfers
};

//! Native token balances of the dev chain, paying relayer rewards out of the lane rewards accounts
class Balances : public ledger::PaymentProcedure {
  public:
    explicit Balances(state::KeyValueStore& store, const std::string& module_name = "Balances");
    ~Balances() override;

    Balances(const Balances&) = delete;
    Balances& operator=(const Balances&) = delete;

    Balance balance(const AccountId& account) const;

    void mint(state::KeyValueStore& state, const AccountId& account, const Balance& amount) const;

    TransferResult transfer(state::KeyValueStore& state, const AccountId& from, const AccountId& to,
                            const Balance& amount) const;

    //! Frozen accounts can't receive transfers
    void set_frozen(state::KeyValueStore& state, const AccountId& account, bool frozen) const;

    bool pay_reward(state::KeyValueStore& state, const AccountId& relayer, const ledger::RewardsAccountParams& params,
                    const Balance& reward, const AccountId& beneficiary) override;

  private:
    struct Storage;

    state::KeyValueStore& store_;
    std::unique_ptr<const Storage> storage_;
};

}  // namespace trestle::dev

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <trestle/core/state/kv_store.hpp>
#include <trestle/core/types/lane.hpp>
#include <trestle/ledger/common/origin.hpp>
#include <trestle/ledger/relayers/rewards_account.hpp>

namespace trestle::ledger {

enum class [[nodiscard]] RelayersResult {
    kOk,
    kBadOrigin,
    kNoRewardForRelayer,  // Nothing credited for the relayer and rewards account
    kFailedToPayReward,   // Payment procedure failed, the reward stays credited
};

//! Moves rewards from the rewards account to a beneficiary
class PaymentProcedure {
  public:
    virtual ~PaymentProcedure() = default;

    //! Returns false when the transfer failed
    virtual bool pay_reward(state::KeyValueStore& state, const AccountId& relayer,
                            const RewardsAccountParams& params, const Balance& reward,
                            const AccountId& beneficiary) = 0;
};

struct RelayersConfig {
    std::string module_name{"BridgeRelayers"};
};

//! Rewards relayers earned and have not claimed yet
class RewardLedger {
  public:
    RewardLedger(state::KeyValueStore& store, RelayersConfig config, PaymentProcedure& payment);
    ~RewardLedger();

    RewardLedger(const RewardLedger&) = delete;
    RewardLedger& operator=(const RewardLedger&) = delete;

    //! Adds amount to the reward of relayer, saturating. Zero amounts are ignored.
    void credit(state::KeyValueStore& state, const AccountId& relayer, const RewardsAccountParams& params,
                const Balance& amount) const;

    //! Pays the whole credited reward of relayer to beneficiary. The reward is cleared only when paid.
    RelayersResult payout(state::KeyValueStore& state, const AccountId& relayer, const RewardsAccountParams& params,
                          const AccountId& beneficiary);

    RelayersResult claim_rewards(const Origin& origin, const RewardsAccountParams& params);
    RelayersResult claim_rewards_to(const Origin& origin, const RewardsAccountParams& params,
                                    const AccountId& beneficiary);

    std::optional<Balance> reward(const AccountId& relayer, const RewardsAccountParams& params) const;

    //! Sum of every unclaimed reward
    Balance total_unclaimed_rewards() const;
    //! Sum of every reward paid since construction
    const Balance& total_paid_rewards() const noexcept { return total_paid_; }

  private:
    struct Storage;

    state::KeyValueStore& store_;
    RelayersConfig config_;
    PaymentProcedure& payment_;
    std::unique_ptr<const Storage> storage_;
    Balance total_paid_{0};
};

}  // namespace trestle::ledger

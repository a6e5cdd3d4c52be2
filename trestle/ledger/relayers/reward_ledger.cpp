// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "reward_ledger.hpp"

#include <limits>

#include <magic_enum.hpp>

#include <trestle/core/codec/encode.hpp>
#include <trestle/core/common/util.hpp>
#include <trestle/core/state/storage.hpp>
#include <trestle/infra/common/log.hpp>
#include <trestle/ledger/common/transactional.hpp>

namespace trestle::ledger {

struct RewardLedger::Storage {
    explicit Storage(const std::string& module) : relayer_rewards{module, "RelayerRewards"} {}

    state::StorageMap<RelayerRewardKey, Balance> relayer_rewards;
};

RewardLedger::RewardLedger(state::KeyValueStore& store, RelayersConfig config, PaymentProcedure& payment)
    : store_{store},
      config_{std::move(config)},
      payment_{payment},
      storage_{std::make_unique<Storage>(config_.module_name)} {}

RewardLedger::~RewardLedger() = default;

void RewardLedger::credit(state::KeyValueStore& state, const AccountId& relayer, const RewardsAccountParams& params,
                          const Balance& amount) const {
    if (amount == 0) {
        return;
    }
    const RelayerRewardKey key{relayer, params};
    const Balance current{storage_->relayer_rewards.get_or_default(state, key)};
    const Balance updated{current > std::numeric_limits<Balance>::max() - amount ? std::numeric_limits<Balance>::max()
                                                                                 : current + amount};
    storage_->relayer_rewards.put(state, key, updated);
    TRESTLE_TRACE_M("Relayer reward credited", {"relayer", to_hex(ByteView{relayer.bytes}, true),
                                                "account", to_string(params),
                                                "amount", intx::to_string(amount),
                                                "total", intx::to_string(updated)});
}

RelayersResult RewardLedger::payout(state::KeyValueStore& state, const AccountId& relayer,
                                    const RewardsAccountParams& params, const AccountId& beneficiary) {
    const RelayerRewardKey key{relayer, params};
    const auto reward{storage_->relayer_rewards.get(state, key)};
    if (!reward || *reward == 0) {
        return RelayersResult::kNoRewardForRelayer;
    }
    if (!payment_.pay_reward(state, relayer, params, *reward, beneficiary)) {
        TRESTLE_WARN_M("Failed to pay relayer reward", {"relayer", to_hex(ByteView{relayer.bytes}, true),
                                                        "account", to_string(params),
                                                        "reward", intx::to_string(*reward)});
        return RelayersResult::kFailedToPayReward;
    }
    storage_->relayer_rewards.erase(state, key);
    total_paid_ += *reward;
    TRESTLE_DEBUG_M("Relayer reward paid", {"relayer", to_hex(ByteView{relayer.bytes}, true),
                                            "beneficiary", to_hex(ByteView{beneficiary.bytes}, true),
                                            "account", to_string(params), "reward", intx::to_string(*reward)});
    return RelayersResult::kOk;
}

RelayersResult RewardLedger::claim_rewards(const Origin& origin, const RewardsAccountParams& params) {
    if (origin.is_root()) {
        return RelayersResult::kBadOrigin;
    }
    return claim_rewards_to(origin, params, *origin.signer());
}

RelayersResult RewardLedger::claim_rewards_to(const Origin& origin, const RewardsAccountParams& params,
                                              const AccountId& beneficiary) {
    const Balance paid_before{total_paid_};
    const auto result{transactional<RelayersResult>(store_, [&](state::KeyValueStore& state) {
        if (origin.is_root()) {
            return RelayersResult::kBadOrigin;
        }
        return payout(state, *origin.signer(), params, beneficiary);
    })};
    if (result != RelayersResult::kOk) {
        total_paid_ = paid_before;
        TRESTLE_DEBUG_M("Rejected rewards claim", {"account", to_string(params),
                                                   "result", std::string{magic_enum::enum_name(result)}});
    }
    return result;
}

std::optional<Balance> RewardLedger::reward(const AccountId& relayer, const RewardsAccountParams& params) const {
    return storage_->relayer_rewards.get(store_, RelayerRewardKey{relayer, params});
}

Balance RewardLedger::total_unclaimed_rewards() const {
    Balance total{0};
    storage_->relayer_rewards.for_each(store_, [&](const RelayerRewardKey&, const Balance& reward) {
        total += reward;
    });
    return total;
}

}  // namespace trestle::ledger

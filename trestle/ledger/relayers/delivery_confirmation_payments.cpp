// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "delivery_confirmation_payments.hpp"

#include <algorithm>

#include <magic_enum.hpp>

#include <trestle/core/common/util.hpp>
#include <trestle/infra/common/log.hpp>

namespace trestle::ledger {

std::vector<std::pair<AccountId, MessageNonce>> calc_relayers_rewards(
    const std::deque<UnrewardedRelayer>& messages_relayers, const NonceRange& received_range) {
    std::vector<std::pair<AccountId, MessageNonce>> rewards;
    for (const auto& entry : messages_relayers) {
        const MessageNonce nonce_begin{std::max(entry.messages.begin, received_range.begin)};
        const MessageNonce nonce_end{std::min(entry.messages.end, received_range.end)};
        if (nonce_end < nonce_begin) {
            continue;
        }
        const MessageNonce delivered{nonce_end - nonce_begin + 1};
        auto it{std::ranges::find(rewards, entry.relayer, &std::pair<AccountId, MessageNonce>::first)};
        if (it == rewards.end()) {
            rewards.emplace_back(entry.relayer, delivered);
        } else {
            it->second += delivered;
        }
    }
    return rewards;
}

MessageNonce RewardLedgerPayments::pay_reward(state::KeyValueStore& state, const LaneId& lane,
                                              const std::deque<UnrewardedRelayer>& messages_relayers,
                                              const AccountId& confirmation_relayer,
                                              const NonceRange& received_range) {
    const RewardsAccountParams params{lane, bridged_chain_id_, RewardsAccountOwner::kBridgedChain};
    const auto relayers_rewards{calc_relayers_rewards(messages_relayers, received_range)};
    for (const auto& [relayer, messages] : relayers_rewards) {
        rewards_.credit(state, relayer, params, reward_per_message_ * messages);
        const auto paid{rewards_.payout(state, relayer, params, relayer)};
        if (paid != RelayersResult::kOk) {
            TRESTLE_DEBUG_M("Relayer reward left credited", {"relayer", to_hex(ByteView{relayer.bytes}, true),
                                                             "result", std::string{magic_enum::enum_name(paid)}});
        }
    }
    TRESTLE_TRACE_M("Delivery confirmed", {"lane", trestle::to_string(lane),
                                           "confirmed_by", to_hex(ByteView{confirmation_relayer.bytes}, true),
                                           "rewarded_relayers", std::to_string(relayers_rewards.size())});
    return relayers_rewards.size();
}

}  // namespace trestle::ledger

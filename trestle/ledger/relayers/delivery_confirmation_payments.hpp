// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <deque>
#include <utility>
#include <vector>

#include <trestle/core/types/lane.hpp>
#include <trestle/ledger/messages/message_dispatch.hpp>
#include <trestle/ledger/relayers/reward_ledger.hpp>

namespace trestle::ledger {

//! Number of messages in received_range delivered by each relayer, in order of first delivery
std::vector<std::pair<AccountId, MessageNonce>> calc_relayers_rewards(
    const std::deque<UnrewardedRelayer>& messages_relayers, const NonceRange& received_range);

//! Credits every relayer reward_per_message for each confirmed message it delivered and
//! tries to pay the reward right away
class RewardLedgerPayments : public DeliveryConfirmationPayments {
  public:
    RewardLedgerPayments(RewardLedger& rewards, ChainId bridged_chain_id, Balance reward_per_message)
        : rewards_{rewards}, bridged_chain_id_{bridged_chain_id}, reward_per_message_{reward_per_message} {}

    MessageNonce pay_reward(state::KeyValueStore& state, const LaneId& lane,
                            const std::deque<UnrewardedRelayer>& messages_relayers,
                            const AccountId& confirmation_relayer, const NonceRange& received_range) override;

  private:
    RewardLedger& rewards_;
    ChainId bridged_chain_id_;
    Balance reward_per_message_;
};

}  // namespace trestle::ledger

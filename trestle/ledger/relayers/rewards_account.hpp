// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <string>

#include <trestle/core/codec/decode.hpp>
#include <trestle/core/types/lane.hpp>

namespace trestle::ledger {

//! Four byte identifier of a chain
using ChainId = std::array<uint8_t, 4>;

//! Side of the lane a reward is paid for
enum class RewardsAccountOwner : uint8_t {
    kThisChain,     // Delivering messages from the bridged chain to this chain
    kBridgedChain,  // Confirming delivery of messages sent from this chain
};

//! Identifies the account relayer rewards of one lane are paid from
struct RewardsAccountParams {
    LaneId lane{};
    ChainId bridged_chain_id{};
    RewardsAccountOwner owner{RewardsAccountOwner::kThisChain};

    friend bool operator==(const RewardsAccountParams&, const RewardsAccountParams&) = default;
};

std::string to_string(const RewardsAccountParams& params);

//! Key of the reward a relayer earned in one rewards account
struct RelayerRewardKey {
    AccountId relayer;
    RewardsAccountParams params;

    friend bool operator==(const RelayerRewardKey&, const RelayerRewardKey&) = default;
};

}  // namespace trestle::ledger

namespace trestle::codec {

void encode(Bytes& to, ledger::RewardsAccountOwner owner);
void encode(Bytes& to, const ledger::RewardsAccountParams& params);
void encode(Bytes& to, const ledger::RelayerRewardKey& key);

DecodingResult decode(ByteView& from, ledger::RewardsAccountOwner& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, ledger::RewardsAccountParams& to,
                      Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, ledger::RelayerRewardKey& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace trestle::codec

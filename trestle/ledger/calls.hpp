// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include <trestle/core/codec/decode.hpp>
#include <trestle/core/finality/justification.hpp>
#include <trestle/core/types/header.hpp>
#include <trestle/core/types/lane.hpp>
#include <trestle/core/types/messages_proofs.hpp>
#include <trestle/core/types/parachains.hpp>
#include <trestle/core/types/weight.hpp>
#include <trestle/ledger/common/operating_mode.hpp>
#include <trestle/ledger/header_chain/header_chain_ledger.hpp>
#include <trestle/ledger/relayers/rewards_account.hpp>

namespace trestle::ledger {

struct InitializeCall {
    InitializationData init_data;

    friend bool operator==(const InitializeCall&, const InitializeCall&) = default;
};

struct SubmitFinalityProofCall {
    Header header;
    finality::Justification justification;
    uint64_t current_set_id{0};

    friend bool operator==(const SubmitFinalityProofCall&, const SubmitFinalityProofCall&) = default;
};

struct SubmitParachainHeadsCall {
    HeaderId at_relay_block;
    std::vector<ParaHeadUpdate> parachains;
    ParaHeadsProof proof;

    friend bool operator==(const SubmitParachainHeadsCall&, const SubmitParachainHeadsCall&) = default;
};

struct ReceiveMessagesProofCall {
    AccountId relayer_id_at_bridged_chain;
    MessagesProof proof;
    uint32_t messages_count{0};
    Weight dispatch_weight;

    friend bool operator==(const ReceiveMessagesProofCall&, const ReceiveMessagesProofCall&) = default;
};

struct ReceiveMessagesDeliveryProofCall {
    MessagesDeliveryProof proof;
    UnrewardedRelayersState relayers_state;

    friend bool operator==(const ReceiveMessagesDeliveryProofCall&,
                           const ReceiveMessagesDeliveryProofCall&) = default;
};

struct SetMessagesOperatingModeCall {
    MessagesOperatingMode mode{MessagesOperatingMode::kNormal};

    friend bool operator==(const SetMessagesOperatingModeCall&, const SetMessagesOperatingModeCall&) = default;
};

struct ClaimRewardsCall {
    RewardsAccountParams params;
    //! Account receiving the reward, the signer when empty
    std::optional<AccountId> beneficiary;

    friend bool operator==(const ClaimRewardsCall&, const ClaimRewardsCall&) = default;
};

struct SendMessageCall {
    LaneId lane{};
    Bytes payload;

    friend bool operator==(const SendMessageCall&, const SendMessageCall&) = default;
};

//! Ledger calls a chain accepts in transactions. The alternative index is the encoded call discriminant.
using Call = std::variant<InitializeCall, SubmitFinalityProofCall, SubmitParachainHeadsCall, ReceiveMessagesProofCall,
                          ReceiveMessagesDeliveryProofCall, SetMessagesOperatingModeCall, ClaimRewardsCall,
                          SendMessageCall>;

std::string_view call_name(const Call& call);

struct Transaction {
    AccountId signer;
    Call call;

    friend bool operator==(const Transaction&, const Transaction&) = default;
};

}  // namespace trestle::ledger

namespace trestle::codec {

void encode(Bytes& to, const ledger::Call& call);
void encode(Bytes& to, const ledger::Transaction& transaction);

DecodingResult decode(ByteView& from, ledger::Call& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, ledger::Transaction& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace trestle::codec

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

// Read-only methods a chain serves through state calls. Arguments and results are codec encoded.

#pragma once

#include <string_view>

namespace trestle::ledger::runtime_api {

//! () -> optional<HeaderId>: best header of the bridged chain finalized by the header chain ledger
inline constexpr std::string_view kBestFinalized{"BridgeFinalityApi_best_finalized"};

//! () -> AuthoritySet: authority set the header chain ledger expects the next justification from
inline constexpr std::string_view kBridgedAuthoritySet{"BridgeFinalityApi_authority_set"};

//! () -> AuthoritySet: authorities finalizing the successors of the block the call is made at
inline constexpr std::string_view kGrandpaAuthoritySet{"GrandpaApi_authority_set"};

//! (ParaId) -> optional<HeaderId>: best parachain head imported by the parachains ledger
inline constexpr std::string_view kBestParachainHead{"BridgeParachainsApi_best_parachain_head"};

//! (ParaId) -> optional<ParaInfo>: best parachain head hash and the relay block it was proven at
inline constexpr std::string_view kBestParachainInfo{"BridgeParachainsApi_best_parachain_info"};

//! () -> optional<HeaderId>: best header of the chain bridged by the messages ledger
inline constexpr std::string_view kMessagesBestFinalized{"BridgeMessagesApi_best_finalized_bridged_header"};

//! (vector<Message>) -> vector<Weight>
inline constexpr std::string_view kInboundMessageDetails{"BridgeMessagesApi_inbound_message_details"};

//! (AccountId, RewardsAccountParams) -> optional<Balance>
inline constexpr std::string_view kRelayerReward{"BridgeRelayersApi_reward"};

}  // namespace trestle::ledger::runtime_api

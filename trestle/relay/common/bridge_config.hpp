// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <trestle/core/common/base.hpp>
#include <trestle/core/types/lane.hpp>
#include <trestle/core/types/weight.hpp>

namespace trestle::relay {

enum class HeadersToRelay {
    kAll,        // Any finalized header with a justification
    kMandatory,  // Only headers enacting authority set changes
};

struct MessageLimits {
    MessageNonce max_unrewarded_relayer_entries{8};
    MessageNonce max_unconfirmed_messages{128};
    //! Upper bound of messages per delivery transaction, derived from the weights when zero
    MessageNonce max_messages_in_single_batch{0};
    Weight max_extrinsic_weight{Weight::from_parts(2'000'000'000'000, 5_Mebi)};
    size_t max_extrinsic_size{1_Mebi};

    friend bool operator==(const MessageLimits&, const MessageLimits&) = default;
};

struct LoopTiming {
    //! Interval between two iterations of a relay loop
    std::chrono::milliseconds tick{1000};
    //! Time a submitted transaction may take before the loop gives up waiting
    std::chrono::milliseconds stall_timeout{60'000};
    std::chrono::milliseconds retry_interval{5'000};

    friend bool operator==(const LoopTiming&, const LoopTiming&) = default;
};

//! Bridge between a relay chain with one parachain and a standalone chain
struct BridgeConfig {
    std::string relay_chain{"Rialto"};
    std::string parachain{"RialtoParachain"};
    ParaId para_id{2000};
    std::string bridged_chain{"Millau"};
    std::vector<LaneId> lanes{LaneId{0, 0, 0, 0}};
    MessageLimits limits;
    LoopTiming timing;
    HeadersToRelay headers_to_relay{HeadersToRelay::kAll};
    //! Build transactions without submitting them
    bool dry_run{false};
    AccountId relayer{0x01};
    Balance reward_per_message{1'000'000};
    size_t recent_finality_proofs_limit{256};
    //! Block production interval of the dev chains
    std::chrono::milliseconds block_time{1000};

    friend bool operator==(const BridgeConfig&, const BridgeConfig&) = default;
};

void to_json(nlohmann::json& json, const BridgeConfig& config);
void from_json(const nlohmann::json& json, BridgeConfig& config);

//! Throws std::runtime_error when the file can't be read, nlohmann::json::exception when malformed
BridgeConfig load_bridge_config(const std::filesystem::path& path);

}  // namespace trestle::relay

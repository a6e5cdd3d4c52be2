// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "bridge_config.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include <trestle/core/common/util.hpp>

namespace trestle::relay {

namespace {

    LaneId lane_from_hex(const std::string& hex) {
        const auto bytes{from_hex(hex)};
        if (!bytes || bytes->size() != LaneId{}.size()) {
            throw std::invalid_argument{"invalid lane id " + hex};
        }
        LaneId lane{};
        std::copy(bytes->begin(), bytes->end(), lane.begin());
        return lane;
    }

    AccountId account_from_hex(const std::string& hex) {
        const auto bytes{from_hex(hex)};
        if (!bytes || bytes->size() != kAddressLength) {
            throw std::invalid_argument{"invalid account " + hex};
        }
        AccountId account;
        std::copy(bytes->begin(), bytes->end(), account.bytes);
        return account;
    }

    nlohmann::json weight_to_json(const Weight& weight) {
        return {{"ref_time", weight.ref_time}, {"proof_size", weight.proof_size}};
    }

    Weight weight_from_json(const nlohmann::json& json) {
        return Weight::from_parts(json.at("ref_time").get<uint64_t>(), json.at("proof_size").get<uint64_t>());
    }

    std::chrono::milliseconds millis(const nlohmann::json& json, const char* key, std::chrono::milliseconds fallback) {
        return std::chrono::milliseconds{json.value(key, static_cast<uint64_t>(fallback.count()))};
    }

}  // namespace

void to_json(nlohmann::json& json, const BridgeConfig& config) {
    json["relay_chain"] = config.relay_chain;
    json["parachain"] = config.parachain;
    json["para_id"] = config.para_id;
    json["bridged_chain"] = config.bridged_chain;
    json["lanes"] = nlohmann::json::array();
    for (const auto& lane : config.lanes) {
        json["lanes"].push_back(trestle::to_string(lane));
    }
    json["limits"] = {
        {"max_unrewarded_relayer_entries", config.limits.max_unrewarded_relayer_entries},
        {"max_unconfirmed_messages", config.limits.max_unconfirmed_messages},
        {"max_messages_in_single_batch", config.limits.max_messages_in_single_batch},
        {"max_extrinsic_weight", weight_to_json(config.limits.max_extrinsic_weight)},
        {"max_extrinsic_size", config.limits.max_extrinsic_size},
    };
    json["timing"] = {
        {"tick_ms", config.timing.tick.count()},
        {"stall_timeout_ms", config.timing.stall_timeout.count()},
        {"retry_interval_ms", config.timing.retry_interval.count()},
    };
    json["headers_to_relay"] = config.headers_to_relay == HeadersToRelay::kMandatory ? "mandatory" : "all";
    json["dry_run"] = config.dry_run;
    json["relayer"] = to_hex(ByteView{config.relayer.bytes}, /*with_prefix=*/true);
    json["reward_per_message"] = intx::to_string(config.reward_per_message);
    json["recent_finality_proofs_limit"] = config.recent_finality_proofs_limit;
    json["block_time_ms"] = config.block_time.count();
}

void from_json(const nlohmann::json& json, BridgeConfig& config) {
    const BridgeConfig defaults;
    config.relay_chain = json.value("relay_chain", defaults.relay_chain);
    config.parachain = json.value("parachain", defaults.parachain);
    config.para_id = json.value("para_id", defaults.para_id);
    config.bridged_chain = json.value("bridged_chain", defaults.bridged_chain);
    if (json.contains("lanes")) {
        config.lanes.clear();
        for (const auto& lane : json.at("lanes")) {
            config.lanes.push_back(lane_from_hex(lane.get<std::string>()));
        }
    }
    if (json.contains("limits")) {
        const auto& limits{json.at("limits")};
        config.limits.max_unrewarded_relayer_entries =
            limits.value("max_unrewarded_relayer_entries", defaults.limits.max_unrewarded_relayer_entries);
        config.limits.max_unconfirmed_messages =
            limits.value("max_unconfirmed_messages", defaults.limits.max_unconfirmed_messages);
        config.limits.max_messages_in_single_batch =
            limits.value("max_messages_in_single_batch", defaults.limits.max_messages_in_single_batch);
        config.limits.max_extrinsic_weight = limits.contains("max_extrinsic_weight")
                                                 ? weight_from_json(limits.at("max_extrinsic_weight"))
                                                 : defaults.limits.max_extrinsic_weight;
        config.limits.max_extrinsic_size = limits.value("max_extrinsic_size", defaults.limits.max_extrinsic_size);
    }
    if (json.contains("timing")) {
        const auto& timing{json.at("timing")};
        config.timing.tick = millis(timing, "tick_ms", defaults.timing.tick);
        config.timing.stall_timeout = millis(timing, "stall_timeout_ms", defaults.timing.stall_timeout);
        config.timing.retry_interval = millis(timing, "retry_interval_ms", defaults.timing.retry_interval);
    }
    const auto headers_to_relay{json.value("headers_to_relay", std::string{"all"})};
    if (headers_to_relay == "all") {
        config.headers_to_relay = HeadersToRelay::kAll;
    } else if (headers_to_relay == "mandatory") {
        config.headers_to_relay = HeadersToRelay::kMandatory;
    } else {
        throw std::invalid_argument{"invalid headers_to_relay " + headers_to_relay};
    }
    config.dry_run = json.value("dry_run", defaults.dry_run);
    if (json.contains("relayer")) {
        config.relayer = account_from_hex(json.at("relayer").get<std::string>());
    }
    if (json.contains("reward_per_message")) {
        config.reward_per_message = intx::from_string<Balance>(json.at("reward_per_message").get<std::string>());
    }
    config.recent_finality_proofs_limit =
        json.value("recent_finality_proofs_limit", defaults.recent_finality_proofs_limit);
    config.block_time = millis(json, "block_time_ms", defaults.block_time);
}

BridgeConfig load_bridge_config(const std::filesystem::path& path) {
    std::ifstream file{path};
    if (!file) {
        throw std::runtime_error{"cannot open bridge config " + path.string()};
    }
    return nlohmann::json::parse(file).get<BridgeConfig>();
}

}  // namespace trestle::relay

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "dev_bridge.hpp"

#include <utility>

#include <magic_enum.hpp>

#include <trestle/infra/common/log.hpp>
#include <trestle/infra/concurrency/parallel_group_utils.hpp>
#include <trestle/infra/concurrency/sleep.hpp>
#include <trestle/relay/common/relay_loop.hpp>
#include <trestle/relay/common/retry.hpp>
#include <trestle/relay/finality/bridge_initialization.hpp>
#include <trestle/relay/messages/lane_params.hpp>

namespace trestle::dev {

using namespace relay;

namespace {

    constexpr ledger::ChainId kRelayChainId{'r', 'l', 't', 'o'};
    constexpr ledger::ChainId kParachainId{'r', 'l', 'p', 'c'};
    constexpr ledger::ChainId kBridgedChainId{'m', 'l', 'a', 'u'};

    // finality pipelines, then parachains
    constexpr size_t kRelayFinalityPipeline{0};
    constexpr size_t kParachainsPipeline{1};
    constexpr size_t kBridgedFinalityPipeline{2};
    constexpr size_t kFirstMessagesPipeline{3};

    DevChainConfig chain_config(const BridgeConfig& bridge, std::string name, ledger::ChainId chain_id,
                                ledger::ChainId bridged_chain_id) {
        DevChainConfig config;
        config.name = std::move(name);
        config.runtime.chain_id = chain_id;
        config.runtime.bridged_chain_id = bridged_chain_id;
        config.runtime.reward_per_message = bridge.reward_per_message;
        config.runtime.max_extrinsic_weight = bridge.limits.max_extrinsic_weight;
        config.runtime.max_extrinsic_size = bridge.limits.max_extrinsic_size;
        config.bridge_owner = bridge.relayer;
        return config;
    }

    ledger::MessagesConfig messages_config(const BridgeConfig& bridge) {
        ledger::MessagesConfig config;
        config.active_lanes = bridge.lanes;
        config.inbound_limits.max_unrewarded_relayer_entries = bridge.limits.max_unrewarded_relayer_entries;
        config.inbound_limits.max_unconfirmed_messages = bridge.limits.max_unconfirmed_messages;
        return config;
    }

    //! Relay chain hosting the parachain heads
    DevChainConfig relay_chain_config(const BridgeConfig& bridge) {
        return chain_config(bridge, bridge.relay_chain, kRelayChainId, kBridgedChainId);
    }

    //! Standalone chain following the relay chain and bridged with the parachain
    DevChainConfig bridged_chain_config(const BridgeConfig& bridge) {
        DevChainConfig config{chain_config(bridge, bridge.bridged_chain, kBridgedChainId, kParachainId)};
        config.runtime.header_chain = ledger::HeaderChainConfig{};
        config.runtime.parachains = ledger::ParachainsConfig{};
        config.runtime.parachains->tracked_parachains = {bridge.para_id};
        config.runtime.bridged_parachain = bridge.para_id;
        config.runtime.messages = messages_config(bridge);
        return config;
    }

    //! Parachain following the standalone chain
    DevChainConfig parachain_config(const BridgeConfig& bridge) {
        DevChainConfig config{chain_config(bridge, bridge.parachain, kParachainId, kBridgedChainId)};
        config.runtime.header_chain = ledger::HeaderChainConfig{};
        config.runtime.messages = messages_config(bridge);
        return config;
    }

    MessageLaneParams lane_params(const BridgeConfig& bridge, const ledger::WeightCalibrator& target_weights) {
        MessageLaneParams params{make_message_lane_params(bridge.limits, bridge.timing, target_weights)};
        params.dry_run = bridge.dry_run;
        params.relayer = bridge.relayer;
        return params;
    }

    void log_halted(const std::string& pipeline, ErrorKind kind) {
        TRESTLE_ERROR_M("Relay pipeline halted",
                        {"pipeline", pipeline, "error", std::string{magic_enum::enum_name(kind)}});
    }

}  // namespace

//! Messages relay of one lane in one direction
struct DevBridge::MessagesPipeline {
    MessagesPipeline(ChainClient& source_client, ledger::ChainId source_id, ChainClient& target_client,
                     ledger::ChainId target_id, const ledger::WeightCalibrator& calibrator, const LaneId& lane,
                     const MessageLaneParams& params, Metrics* metrics)
        : source{source_client, LaneEndpoint{lane, "BridgeMessages", target_id, params.relayer}},
          target{target_client, LaneEndpoint{lane, "BridgeMessages", source_id, params.relayer}},
          loop{source, target, calibrator, params, metrics} {}

    ChainMessagesSource source;
    ChainMessagesTarget target;
    MessageLaneLoop loop;
};

DevBridge::DevBridge(const boost::asio::any_io_executor& executor, const DevBridgeSettings& settings)
    : settings_{settings},
      relay_chain_{executor, relay_chain_config(settings.bridge)},
      bridged_chain_{executor, bridged_chain_config(settings.bridge)},
      parachain_{executor, parachain_config(settings.bridge)},
      relay_chain_client_{relay_chain_},
      bridged_chain_client_{bridged_chain_},
      parachain_client_{parachain_},
      relay_headers_{relay_chain_client_},
      relay_headers_at_bridged_{bridged_chain_client_, settings.bridge.relayer},
      relay_finality_{executor, relay_headers_, relay_headers_at_bridged_, finality_params(), &metrics_},
      para_heads_{relay_chain_client_},
      para_heads_at_bridged_{bridged_chain_client_, settings.bridge.relayer},
      parachains_{executor, para_heads_, para_heads_at_bridged_, parachains_params(), &metrics_},
      bridged_headers_{bridged_chain_client_},
      bridged_headers_at_parachain_{parachain_client_, settings.bridge.relayer},
      bridged_finality_{executor, bridged_headers_, bridged_headers_at_parachain_, finality_params(), &metrics_} {
    const BridgeConfig& bridge{settings.bridge};
    for (const LaneId& lane : bridge.lanes) {
        messages_.push_back(std::make_unique<MessagesPipeline>(
            bridged_chain_client_, kBridgedChainId, parachain_client_, kParachainId, parachain_.runtime().weights(),
            lane, lane_params(bridge, parachain_.runtime().weights()), &metrics_));
        messages_.push_back(std::make_unique<MessagesPipeline>(
            parachain_client_, kParachainId, bridged_chain_client_, kBridgedChainId, bridged_chain_.runtime().weights(),
            lane, lane_params(bridge, bridged_chain_.runtime().weights()), &metrics_));
    }
}

DevBridge::~DevBridge() = default;

Task<void> DevBridge::run() {
    const size_t pipelines{kFirstMessagesPipeline + messages_.size()};
    co_await concurrency::generate_parallel_group_task(pipelines + 1, [this, pipelines](size_t index) {
        if (index == pipelines) return produce_blocks();
        return run_pipeline(index);
    });
}

FinalitySyncParams DevBridge::finality_params() const {
    return FinalitySyncParams{
        .timing = settings_.bridge.timing,
        .headers_to_relay = settings_.bridge.headers_to_relay,
        .recent_finality_proofs_limit = settings_.bridge.recent_finality_proofs_limit,
        .dry_run = settings_.bridge.dry_run,
    };
}

ParachainsSyncParams DevBridge::parachains_params() const {
    return ParachainsSyncParams{
        .parachains = {settings_.bridge.para_id},
        .timing = settings_.bridge.timing,
        .dry_run = settings_.bridge.dry_run,
    };
}

Task<void> DevBridge::run_pipeline(size_t index) {
    switch (index) {
        case kRelayFinalityPipeline:
            co_await run_finality(relay_headers_, relay_headers_at_bridged_, relay_finality_);
            break;
        case kParachainsPipeline:
            co_await run_parachains();
            break;
        case kBridgedFinalityPipeline:
            co_await run_finality(bridged_headers_, bridged_headers_at_parachain_, bridged_finality_);
            break;
        default:
            co_await messages_[index - kFirstMessagesPipeline]->loop.run();
            break;
    }
}

// Pipelines never end the bridge: a halted pipeline stays down while the others keep relaying
Task<void> DevBridge::run_finality(FinalitySource& source, FinalityTarget& target, FinalityLoop& loop) {
    const std::string pipeline{"finality " + source.name() + " -> " + target.name()};
    const FixedIntervalRetry retry_policy{settings_.bridge.timing.retry_interval};
    const auto halted{co_await run_until_done(
        "initialization " + source.name() + " -> " + target.name(), retry_policy, settings_.bridge.timing.tick,
        [&]() -> Task<bool> {
            const InitializationOutcome outcome{co_await initialize_bridge(source, target, settings_.bridge.dry_run)};
            TRESTLE_INFO_M("Bridge initialization", {"source", source.name(), "target", target.name(), "outcome",
                                                     std::string{magic_enum::enum_name(outcome)}});
            co_return true;
        })};
    if (halted) {
        log_halted(pipeline, *halted);
        co_return;
    }
    log_halted(pipeline, co_await loop.run());
}

Task<void> DevBridge::run_parachains() {
    // heads are proven against relay blocks known to the relay chain light client at target
    TRESTLE_INFO_M("Waiting for the relay chain light client",
                   {"target", relay_headers_at_bridged_.name(), "para_id", std::to_string(settings_.bridge.para_id)});
    const FixedIntervalRetry retry_policy{settings_.bridge.timing.retry_interval};
    const auto halted{co_await run_until_done("parachains initialization", retry_policy, settings_.bridge.timing.tick,
                                              [this]() -> Task<bool> {
                                                  co_return co_await relay_headers_at_bridged_.is_initialized();
                                              })};
    if (halted) {
        log_halted("parachains", *halted);
        co_return;
    }
    log_halted("parachains", co_await parachains_.run());
}

//! Produces and finalizes a block on every chain each block time, anchoring the parachain in the relay chain
Task<void> DevBridge::produce_blocks() {
    uint64_t round{0};
    while (true) {
        co_await sleep(settings_.bridge.block_time);
        ++round;
        send_messages(bridged_chain_, round);
        send_messages(parachain_, round);

        const Header para_head{parachain_.produce_and_finalize_block()};
        relay_chain_.set_parachain_head(settings_.bridge.para_id, para_head);
        const Header relay_head{relay_chain_.produce_and_finalize_block()};
        const Header bridged_head{bridged_chain_.produce_and_finalize_block()};
        TRESTLE_DEBUG_M("Blocks produced", {relay_chain_.name(), std::to_string(relay_head.number), parachain_.name(),
                                            std::to_string(para_head.number), bridged_chain_.name(),
                                            std::to_string(bridged_head.number)});
    }
}

void DevBridge::send_messages(DevChain& chain, uint64_t round) {
    for (const LaneId& lane : settings_.bridge.lanes) {
        for (uint32_t i{0}; i < settings_.messages_per_block; ++i) {
            const std::string text{"message " + std::to_string(round) + "." + std::to_string(i)};
            const Bytes payload(text.begin(), text.end());
            const auto sent{chain.runtime().messages()->send_message(lane, payload)};
            if (!sent) {
                TRESTLE_WARN_M("Message not sent", {"chain", chain.name(), "lane", trestle::to_string(lane), "error",
                                                    std::string{magic_enum::enum_name(sent.error())}});
            }
        }
    }
}

}  // namespace trestle::dev

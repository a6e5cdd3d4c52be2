// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

#include <trestle/core/types/lane.hpp>
#include <trestle/dev/dev_chain.hpp>
#include <trestle/dev/dev_chain_client.hpp>
#include <trestle/infra/concurrency/task.hpp>
#include <trestle/relay/common/bridge_config.hpp>
#include <trestle/relay/common/metrics.hpp>
#include <trestle/relay/finality/finality_loop.hpp>
#include <trestle/relay/messages/message_lane_loop.hpp>
#include <trestle/relay/messages/messages_clients.hpp>
#include <trestle/relay/parachains/parachains_loop.hpp>

namespace trestle::dev {

struct DevBridgeSettings {
    relay::BridgeConfig bridge;
    //! Messages sent through every lane in both directions at each block, none when zero
    uint32_t messages_per_block{1};
};

//! Dev chains of the bridge and every relay pipeline between them.
//! The relay chain anchors the parachain, the bridged chain follows the relay chain and exchanges
//! messages with the parachain, which follows the bridged chain.
class DevBridge {
  public:
    DevBridge(const boost::asio::any_io_executor& executor, const DevBridgeSettings& settings);
    ~DevBridge();

    DevBridge(const DevBridge&) = delete;
    DevBridge& operator=(const DevBridge&) = delete;

    //! Runs the block production and every pipeline until cancelled
    Task<void> run();

    DevChain& relay_chain() noexcept { return relay_chain_; }
    DevChain& bridged_chain() noexcept { return bridged_chain_; }
    DevChain& parachain() noexcept { return parachain_; }

    const relay::Metrics& metrics() const noexcept { return metrics_; }

  private:
    struct MessagesPipeline;

    relay::FinalitySyncParams finality_params() const;
    relay::ParachainsSyncParams parachains_params() const;

    Task<void> run_pipeline(size_t index);
    Task<void> run_finality(relay::FinalitySource& source, relay::FinalityTarget& target, relay::FinalityLoop& loop);
    Task<void> run_parachains();
    Task<void> produce_blocks();
    void send_messages(DevChain& chain, uint64_t round);

    const DevBridgeSettings& settings_;
    relay::Metrics metrics_;

    DevChain relay_chain_;
    DevChain bridged_chain_;
    DevChain parachain_;
    DevChainClient relay_chain_client_;
    DevChainClient bridged_chain_client_;
    DevChainClient parachain_client_;

    relay::ChainFinalitySource relay_headers_;
    relay::ChainFinalityTarget relay_headers_at_bridged_;
    relay::FinalityLoop relay_finality_;

    relay::ChainParachainsSource para_heads_;
    relay::ChainParachainsTarget para_heads_at_bridged_;
    relay::ParachainsLoop parachains_;

    relay::ChainFinalitySource bridged_headers_;
    relay::ChainFinalityTarget bridged_headers_at_parachain_;
    relay::FinalityLoop bridged_finality_;

    std::vector<std::unique_ptr<MessagesPipeline>> messages_;
};

}  // namespace trestle::dev

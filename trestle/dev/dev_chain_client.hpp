// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <trestle/dev/dev_chain.hpp>
#include <trestle/relay/common/chain_client.hpp>

namespace trestle::dev {

//! Chain client talking to an in-process DevChain. Requests fail with a network error
//! while the chain injects failures.
class DevChainClient : public relay::ChainClient {
  public:
    explicit DevChainClient(DevChain& chain) : chain_{chain} {}

    const std::string& chain_name() const override { return chain_.name(); }

    Task<HeaderId> best_finalized_header_id() override;
    Task<HeaderId> best_header_id() override;
    Task<std::optional<Header>> header_by_hash(const Hash& hash) override;
    Task<std::optional<Header>> header_by_number(BlockNum number) override;
    Task<std::optional<finality::Justification>> justification(BlockNum number) override;

    Task<std::optional<Bytes>> storage_value(const Hash& at, const Bytes& key) override;
    Task<trie::StorageProof> prove_storage(const Hash& at, const std::vector<Bytes>& keys) override;
    Task<Bytes> state_call(const Hash& at, std::string_view method, const Bytes& args) override;

    Task<std::unique_ptr<relay::FinalitySubscription>> subscribe_finality_justifications() override;

    Task<std::unique_ptr<relay::TransactionTracker>> submit_and_watch(const ledger::Transaction& transaction) override;

    Task<void> reconnect() override;

    size_t reconnections() const noexcept { return reconnections_; }

  private:
    //! Throws the network failures injected into the chain
    void check_connection();
    template <class Result>
    Result with_known_block(const std::function<Result()>& read);

    DevChain& chain_;
    size_t reconnections_{0};
};

}  // namespace trestle::dev

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <trestle/core/finality/justification.hpp>
#include <trestle/core/types/header.hpp>
#include <trestle/infra/concurrency/task.hpp>
#include <trestle/ledger/header_chain/header_chain_ledger.hpp>
#include <trestle/relay/common/chain_client.hpp>

namespace trestle::relay {

struct HeaderAndProof {
    Header header;
    //! Persistent justification, if the source kept one for this header
    std::optional<finality::Justification> justification;
};

//! Header enacting an authority set change: the light client can't skip it
inline bool is_mandatory(const Header& header) {
    return header.digest.scheduled_change.has_value();
}

//! Chain whose finalized headers are relayed
class FinalitySource {
  public:
    virtual ~FinalitySource() = default;

    virtual const std::string& name() const = 0;

    virtual Task<BlockNum> best_finalized_number() = 0;

    //! Throws RelayError{kProofConstruction} when the header is unknown
    virtual Task<HeaderAndProof> header_and_proof(BlockNum number) = 0;

    //! Encoded justifications of the headers the source finalizes from now on
    virtual Task<std::unique_ptr<FinalitySubscription>> subscribe() = 0;

    virtual Task<void> reconnect() = 0;

    //! Best finalized header and the authority set finalizing its successors
    virtual Task<ledger::InitializationData> prepare_initialization_data() = 0;
};

//! Chain hosting the light client of the source
class FinalityTarget {
  public:
    virtual ~FinalityTarget() = default;

    virtual const std::string& name() const = 0;

    //! Best source header known to the light client, std::nullopt until initialized
    virtual Task<std::optional<HeaderId>> best_finalized_source_id() = 0;

    virtual Task<std::unique_ptr<TransactionTracker>> initialize(const ledger::InitializationData& data) = 0;

    virtual Task<std::unique_ptr<TransactionTracker>> submit_finality_proof(
        const Header& header, const finality::Justification& justification) = 0;

    Task<bool> is_initialized() {
        const auto best{co_await best_finalized_source_id()};
        co_return best.has_value();
    }
};

//! Finality source backed by the node of the source chain
class ChainFinalitySource : public FinalitySource {
  public:
    explicit ChainFinalitySource(ChainClient& client) : client_{client} {}

    const std::string& name() const override { return client_.chain_name(); }

    Task<BlockNum> best_finalized_number() override;
    Task<HeaderAndProof> header_and_proof(BlockNum number) override;
    Task<std::unique_ptr<FinalitySubscription>> subscribe() override;
    Task<void> reconnect() override;
    Task<ledger::InitializationData> prepare_initialization_data() override;

  private:
    ChainClient& client_;
};

//! Finality target backed by the node of the target chain, signing transactions as relayer
class ChainFinalityTarget : public FinalityTarget {
  public:
    ChainFinalityTarget(ChainClient& client, const AccountId& relayer) : client_{client}, relayer_{relayer} {}

    const std::string& name() const override { return client_.chain_name(); }

    Task<std::optional<HeaderId>> best_finalized_source_id() override;
    Task<std::unique_ptr<TransactionTracker>> initialize(const ledger::InitializationData& data) override;
    Task<std::unique_ptr<TransactionTracker>> submit_finality_proof(
        const Header& header, const finality::Justification& justification) override;

  private:
    ChainClient& client_;
    AccountId relayer_;
};

}  // namespace trestle::relay

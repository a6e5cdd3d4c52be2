// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <trestle/core/common/bytes.hpp>
#include <trestle/core/finality/justification.hpp>
#include <trestle/core/trie/storage_proof.hpp>
#include <trestle/core/types/header.hpp>
#include <trestle/infra/concurrency/task.hpp>
#include <trestle/ledger/calls.hpp>

namespace trestle::relay {

struct TrackedTransactionStatus {
    enum class Kind {
        kFinalized,  // Included into a finalized block and dispatched successfully
        kLost,       // Dropped, invalid or failed
    };

    Kind kind{Kind::kLost};
    std::optional<HeaderId> block;

    bool finalized() const noexcept { return kind == Kind::kFinalized; }

    static TrackedTransactionStatus lost() { return {}; }
    static TrackedTransactionStatus finalized_at(const HeaderId& block) { return {Kind::kFinalized, block}; }
};

//! Follows one submitted transaction until it is finalized or lost
class TransactionTracker {
  public:
    virtual ~TransactionTracker() = default;

    virtual Task<TrackedTransactionStatus> wait() = 0;
};

//! Stream of encoded finality justifications of a chain
class FinalitySubscription {
  public:
    virtual ~FinalitySubscription() = default;

    //! Next encoded justification, std::nullopt once the subscription is lost
    virtual Task<std::optional<Bytes>> next() = 0;
};

//! Capabilities of a chain node a relay needs. Network failures surface as boost::system::system_error.
class ChainClient {
  public:
    virtual ~ChainClient() = default;

    virtual const std::string& chain_name() const = 0;

    virtual Task<HeaderId> best_finalized_header_id() = 0;
    virtual Task<HeaderId> best_header_id() = 0;
    virtual Task<std::optional<Header>> header_by_hash(const Hash& hash) = 0;
    virtual Task<std::optional<Header>> header_by_number(BlockNum number) = 0;
    //! Persistent justification of a finalized header, if the chain kept one
    virtual Task<std::optional<finality::Justification>> justification(BlockNum number) = 0;

    virtual Task<std::optional<Bytes>> storage_value(const Hash& at, const Bytes& key) = 0;
    virtual Task<trie::StorageProof> prove_storage(const Hash& at, const std::vector<Bytes>& keys) = 0;
    virtual Task<Bytes> state_call(const Hash& at, std::string_view method, const Bytes& args) = 0;

    virtual Task<std::unique_ptr<FinalitySubscription>> subscribe_finality_justifications() = 0;

    virtual Task<std::unique_ptr<TransactionTracker>> submit_and_watch(const ledger::Transaction& transaction) = 0;

    //! Drops and reopens the connection to the node
    virtual Task<void> reconnect() = 0;
};

}  // namespace trestle::relay

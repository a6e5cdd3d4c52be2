// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

#include <trestle/core/finality/justification.hpp>
#include <trestle/core/state/memory_kv_store.hpp>
#include <trestle/core/trie/storage_proof.hpp>
#include <trestle/core/types/header.hpp>
#include <trestle/dev/authority_keys.hpp>
#include <trestle/dev/runtime.hpp>
#include <trestle/infra/common/secp256k1_context.hpp>
#include <trestle/infra/concurrency/channel.hpp>
#include <trestle/ledger/calls.hpp>

namespace trestle::dev {

struct DevChainConfig {
    std::string name{"Dev"};
    RuntimeConfig runtime;
    size_t authorities_count{3};
    uint8_t authorities_seed{1};
    //! Every justification_period-th finalized block keeps its justification
    BlockNum justification_period{8};
    //! Historical states served to state reads and proofs
    size_t states_to_keep{256};
    //! Owner of the bridge modules, allowed to initialize them
    std::optional<AccountId> bridge_owner;
    std::vector<std::pair<AccountId, Balance>> endowed_accounts;
    //! Genesis balance of the rewards account of every active lane
    Balance lane_rewards_fund{1'000'000'000'000};
    //! Block weight left to housekeeping
    Weight idle_weight{Weight::from_parts(500'000'000, 0)};
    //! Module storing the heads of the parachains anchored in this chain
    std::string paras_module_name{"Paras"};
    size_t subscription_buffer_size{64};
};

//! Final state of a submitted transaction
struct TransactionOutcome {
    enum class Status {
        kFinalized,  // Included into a finalized block and dispatched successfully
        kLost,       // Rejected by the pool, or failed when dispatched
    };

    Status status{Status::kLost};
    std::optional<HeaderId> block;
    std::string error;
};

using TransactionWatch = std::shared_ptr<concurrency::Channel<TransactionOutcome>>;
struct JustificationSubscriber {
    JustificationSubscriber(const boost::asio::any_io_executor& executor, size_t buffer_size)
        : channel{executor, buffer_size} {}

    concurrency::Channel<Bytes> channel;
    //! Closed by the chain, as opposed to cancelled by the subscriber
    bool dropped{false};
};

using JustificationSubscription = std::shared_ptr<JustificationSubscriber>;

//! Block or state requested from a DevChain is unknown or already pruned
class UnknownBlockError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

//! In-process chain hosting the bridge ledgers. Blocks are produced and finalized on demand,
//! finality is proven by justifications of deterministic authority keys.
class DevChain {
  public:
    DevChain(const boost::asio::any_io_executor& executor, DevChainConfig config);
    ~DevChain();

    DevChain(const DevChain&) = delete;
    DevChain& operator=(const DevChain&) = delete;

    const std::string& name() const noexcept { return config_.name; }
    const DevChainConfig& config() const noexcept { return config_; }

    //! Applies the pooled transactions on top of the best block
    Header produce_block();

    //! Finalizes every block up to number, resolving the watches of their transactions
    void finalize(BlockNum number);

    Header produce_and_finalize_block();

    //! Next block enacts a new authority set of count keys starting at seed
    void schedule_authority_change(size_t count, uint8_t seed);

    //! Stores header as the head of parachain para_id, visible from the next block on
    void set_parachain_head(ParaId para_id, const Header& header);

    HeaderId best_header_id() const;
    HeaderId best_finalized_header_id() const;
    std::optional<Header> header_by_number(BlockNum number) const;
    std::optional<Header> header_by_hash(const Hash& hash) const;
    //! Persistent justification of a finalized block
    std::optional<finality::Justification> justification(BlockNum number) const;

    //! Authority set finalizing the successors of block number
    AuthoritySet authority_set_at(BlockNum number) const;

    std::optional<Bytes> storage_value(const Hash& at, ByteView key) const;
    trie::StorageProof prove_storage(const Hash& at, const std::vector<Bytes>& keys) const;
    Bytes state_call(const Hash& at, std::string_view method, ByteView args) const;

    //! Decodes and validates a transaction, then pools it for the next block.
    //! Throws DecodingException when the transaction can't be decoded.
    TransactionWatch submit(ByteView encoded_transaction);
    size_t pending_transactions() const noexcept { return pool_.size(); }

    //! Encoded justifications of the blocks finalized from now on
    JustificationSubscription subscribe_justifications();

    //! Closes every justification subscription
    void drop_subscriptions();
    void publish_raw_justification(const Bytes& encoded);

    //! The next count requests served through a client fail with a network error
    void fail_next_requests(size_t count) { failing_requests_ += count; }
    bool take_request_failure();

    //! Live state, changes made through it land in the next block
    Runtime& runtime() noexcept { return runtime_; }
    state::MemoryKvStore& state() noexcept { return state_; }

  private:
    struct Block {
        Header header;
        //! Authority set finalizing this block
        uint64_t set_id{0};
        std::shared_ptr<const state::MemoryKvStore> state;
        std::shared_ptr<const trie::MemoryTrie> trie;
        std::optional<finality::Justification> justification;
        std::vector<std::pair<TransactionWatch, DispatchOutcome>> transactions;
    };

    void build_genesis();
    const Block& block_at(const Hash& hash) const;
    const Block& block_with_state(const Hash& hash) const;
    const AuthorityKeys& keys_of(uint64_t set_id) const;
    void publish(const finality::Justification& justification);
    static void resolve(const TransactionWatch& watch, TransactionOutcome outcome);

    boost::asio::any_io_executor executor_;
    DevChainConfig config_;
    SecP256K1Context secp256k1_{/*allow_verify=*/true, /*allow_sign=*/false};
    state::MemoryKvStore state_;
    Runtime runtime_;

    std::vector<Block> blocks_;
    std::unordered_map<Hash, BlockNum> numbers_;
    BlockNum finalized_{0};
    uint64_t round_{0};

    std::vector<std::unique_ptr<AuthorityKeys>> authority_sets_;
    std::optional<std::pair<size_t, uint8_t>> scheduled_change_;

    std::vector<std::pair<ledger::Transaction, TransactionWatch>> pool_;
    std::vector<JustificationSubscription> subscriptions_;
    size_t failing_requests_{0};
};

}  // namespace trestle::dev

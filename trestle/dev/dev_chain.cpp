// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "dev_chain.hpp"

#include <magic_enum.hpp>

#include <trestle/infra/common/decoding_exception.hpp>
#include <trestle/infra/common/ensure.hpp>
#include <trestle/infra/common/log.hpp>
#include <trestle/ledger/runtime_api.hpp>

#include <trestle/core/codec/encode_vector.hpp>
#include <trestle/core/state/storage.hpp>

namespace trestle::dev {

namespace {

    //! Historical state: ledger reads only
    class ReadOnlyStore : public state::KeyValueStore {
      public:
        explicit ReadOnlyStore(const state::KeyValueStore& base) : base_{base} {}

        std::optional<Bytes> get(ByteView key) const override { return base_.get(key); }
        void put(ByteView, ByteView) override { throw std::logic_error{"historical state is read-only"}; }
        void erase(ByteView) override { throw std::logic_error{"historical state is read-only"}; }
        void for_each_with_prefix(ByteView prefix,
                                  const std::function<void(ByteView, ByteView)>& visitor) const override {
            base_.for_each_with_prefix(prefix, visitor);
        }

      private:
        const state::KeyValueStore& base_;
    };

}  // namespace

DevChain::DevChain(const boost::asio::any_io_executor& executor, DevChainConfig config)
    : executor_{executor},
      config_{std::move(config)},
      runtime_{state_, config_.runtime, secp256k1_} {
    ensure(config_.justification_period > 0, "justification period must be positive");
    ensure(config_.states_to_keep > 0, "at least one state must be kept");
    authority_sets_.push_back(std::make_unique<AuthorityKeys>(config_.authorities_count, config_.authorities_seed));
    build_genesis();
}

DevChain::~DevChain() {
    drop_subscriptions();
}

void DevChain::build_genesis() {
    for (const auto& [account, amount] : config_.endowed_accounts) {
        runtime_.balances().mint(state_, account, amount);
    }
    if (auto* messages{runtime_.messages()}) {
        for (const LaneId& lane : messages->config().active_lanes) {
            const ledger::RewardsAccountParams params{lane, config_.runtime.bridged_chain_id,
                                                      ledger::RewardsAccountOwner::kBridgedChain};
            runtime_.balances().mint(state_, rewards_account(params), config_.lane_rewards_fund);
        }
    }
    if (config_.bridge_owner) {
        const auto root{ledger::Origin::root()};
        if (auto* header_chain{runtime_.header_chain()}) {
            ensure(header_chain->set_owner(root, config_.bridge_owner) == ledger::HeaderChainResult::kOk,
                   "cannot set header chain owner");
        }
        if (auto* parachains{runtime_.parachains()}) {
            ensure(parachains->set_owner(root, config_.bridge_owner) == ledger::ParachainsResult::kOk,
                   "cannot set parachains owner");
        }
        if (auto* messages{runtime_.messages()}) {
            ensure(messages->set_owner(root, config_.bridge_owner) == ledger::MessagesResult::kOk,
                   "cannot set messages owner");
        }
    }

    auto snapshot{std::make_shared<const state::MemoryKvStore>(state_)};
    auto trie{std::make_shared<const trie::MemoryTrie>(snapshot->build_trie())};
    Block genesis;
    genesis.header.state_root = trie->root();
    genesis.state = std::move(snapshot);
    genesis.trie = std::move(trie);
    numbers_.emplace(genesis.header.hash(), 0);
    blocks_.push_back(std::move(genesis));
    TRESTLE_INFO_M("Genesis block built", {"chain", config_.name, "hash", blocks_.back().header.hash().to_hex()});
}

Header DevChain::produce_block() {
    const Block& parent{blocks_.back()};
    Block block;
    block.header.parent_hash = parent.header.hash();
    block.header.number = parent.header.number + 1;
    // a block enacting a change is still finalized by the previous set
    block.set_id = parent.header.digest.scheduled_change ? parent.set_id + 1 : parent.set_id;

    Bytes extrinsics;
    codec::encode_compact(extrinsics, pool_.size());
    auto pool{std::move(pool_)};
    pool_.clear();
    for (auto& [transaction, watch] : pool) {
        codec::encode(extrinsics, transaction);
        DispatchOutcome outcome;
        if (const auto validity{runtime_.validate(transaction)}; validity != TransactionValidity::kValid) {
            outcome.error = std::string{magic_enum::enum_name(validity)};
        } else {
            outcome = runtime_.apply(transaction);
        }
        block.transactions.emplace_back(std::move(watch), std::move(outcome));
    }
    [[maybe_unused]] const Weight spent{runtime_.on_idle(block.header.number, config_.idle_weight)};

    if (scheduled_change_) {
        const auto [count, seed]{*scheduled_change_};
        scheduled_change_.reset();
        authority_sets_.push_back(std::make_unique<AuthorityKeys>(count, seed));
        block.header.digest.scheduled_change = ScheduledChange{authority_sets_.back()->authorities(), 0};
    }

    auto snapshot{std::make_shared<const state::MemoryKvStore>(state_)};
    auto trie{std::make_shared<const trie::MemoryTrie>(snapshot->build_trie())};
    block.header.state_root = trie->root();
    block.header.extrinsics_root = Hash::of(extrinsics);
    block.state = std::move(snapshot);
    block.trie = std::move(trie);

    const BlockNum number{block.header.number};
    numbers_.emplace(block.header.hash(), number);
    blocks_.push_back(std::move(block));
    if (number >= config_.states_to_keep) {
        auto& pruned{blocks_[number - config_.states_to_keep]};
        pruned.state.reset();
        pruned.trie.reset();
    }

    TRESTLE_DEBUG_M("Block produced", {"chain", config_.name, "number", std::to_string(number),
                                       "transactions", std::to_string(blocks_.back().transactions.size())});
    return blocks_.back().header;
}

void DevChain::finalize(BlockNum number) {
    ensure(number < blocks_.size(), "cannot finalize unknown block");
    if (number <= finalized_) {
        return;
    }
    for (BlockNum n{finalized_ + 1}; n <= number; ++n) {
        Block& block{blocks_[n]};
        const bool mandatory{block.header.digest.scheduled_change.has_value()};
        const bool persistent{mandatory || n % config_.justification_period == 0};
        if (mandatory || persistent || n == number) {
            const auto justification{keys_of(block.set_id).justify(block.header.id(), ++round_, block.set_id)};
            if (persistent) {
                block.justification = justification;
            }
            if (mandatory || n == number) {
                publish(justification);
            }
        }
        const HeaderId id{block.header.id()};
        for (auto& [watch, outcome] : block.transactions) {
            if (outcome.success) {
                resolve(watch, {TransactionOutcome::Status::kFinalized, id, {}});
            } else {
                resolve(watch, {TransactionOutcome::Status::kLost, id, std::move(outcome.error)});
            }
        }
        block.transactions.clear();
    }
    finalized_ = number;
    TRESTLE_DEBUG_M("Block finalized", {"chain", config_.name, "number", std::to_string(number)});
}

Header DevChain::produce_and_finalize_block() {
    Header header{produce_block()};
    finalize(header.number);
    return header;
}

void DevChain::schedule_authority_change(size_t count, uint8_t seed) {
    scheduled_change_ = std::make_pair(count, seed);
}

void DevChain::set_parachain_head(ParaId para_id, const Header& header) {
    Bytes encoded;
    codec::encode(encoded, header);
    state::StorageMap<ParaId, Bytes>{config_.paras_module_name, "Heads"}.put(state_, para_id, encoded);
}

HeaderId DevChain::best_header_id() const {
    return blocks_.back().header.id();
}

HeaderId DevChain::best_finalized_header_id() const {
    return blocks_[finalized_].header.id();
}

std::optional<Header> DevChain::header_by_number(BlockNum number) const {
    if (number >= blocks_.size()) {
        return std::nullopt;
    }
    return blocks_[number].header;
}

std::optional<Header> DevChain::header_by_hash(const Hash& hash) const {
    const auto it{numbers_.find(hash)};
    if (it == numbers_.end()) {
        return std::nullopt;
    }
    return blocks_[it->second].header;
}

std::optional<finality::Justification> DevChain::justification(BlockNum number) const {
    if (number > finalized_) {
        return std::nullopt;
    }
    return blocks_[number].justification;
}

AuthoritySet DevChain::authority_set_at(BlockNum number) const {
    ensure(number < blocks_.size(), "unknown block");
    const Block& block{blocks_[number]};
    const uint64_t set_id{block.header.digest.scheduled_change ? block.set_id + 1 : block.set_id};
    return keys_of(set_id).authority_set(set_id);
}

const DevChain::Block& DevChain::block_at(const Hash& hash) const {
    const auto it{numbers_.find(hash)};
    if (it == numbers_.end()) {
        throw UnknownBlockError{"unknown block " + hash.to_hex()};
    }
    return blocks_[it->second];
}

const DevChain::Block& DevChain::block_with_state(const Hash& hash) const {
    const Block& block{block_at(hash)};
    if (!block.state) {
        throw UnknownBlockError{"state of block " + std::to_string(block.header.number) + " is pruned"};
    }
    return block;
}

std::optional<Bytes> DevChain::storage_value(const Hash& at, ByteView key) const {
    return block_with_state(at).state->get(key);
}

trie::StorageProof DevChain::prove_storage(const Hash& at, const std::vector<Bytes>& keys) const {
    return block_with_state(at).trie->prove(keys);
}

Bytes DevChain::state_call(const Hash& at, std::string_view method, ByteView args) const {
    const Block& block{block_with_state(at)};
    if (method == ledger::runtime_api::kGrandpaAuthoritySet) {
        Bytes encoded;
        codec::encode(encoded, authority_set_at(block.header.number));
        return encoded;
    }
    ReadOnlyStore store{*block.state};
    const Runtime runtime{store, config_.runtime, secp256k1_};
    return runtime.state_call(method, args);
}

TransactionWatch DevChain::submit(ByteView encoded_transaction) {
    ledger::Transaction transaction;
    success_or_throw(codec::decode(encoded_transaction, transaction), "malformed transaction");

    auto watch{std::make_shared<concurrency::Channel<TransactionOutcome>>(executor_, 1)};
    if (const auto validity{runtime_.validate(transaction)}; validity != TransactionValidity::kValid) {
        TRESTLE_DEBUG_M("Transaction rejected", {"chain", config_.name,
                                                 "call", std::string{ledger::call_name(transaction.call)},
                                                 "validity", std::string{magic_enum::enum_name(validity)}});
        resolve(watch, {TransactionOutcome::Status::kLost, std::nullopt, std::string{magic_enum::enum_name(validity)}});
        return watch;
    }
    TRESTLE_TRACE_M("Transaction pooled", {"chain", config_.name,
                                           "call", std::string{ledger::call_name(transaction.call)}});
    pool_.emplace_back(std::move(transaction), watch);
    return watch;
}

JustificationSubscription DevChain::subscribe_justifications() {
    auto subscription{std::make_shared<JustificationSubscriber>(executor_, config_.subscription_buffer_size)};
    subscriptions_.push_back(subscription);
    return subscription;
}

void DevChain::drop_subscriptions() {
    for (const auto& subscription : subscriptions_) {
        subscription->dropped = true;
        subscription->channel.close();
    }
    subscriptions_.clear();
}

void DevChain::publish_raw_justification(const Bytes& encoded) {
    for (const auto& subscription : subscriptions_) {
        if (!subscription->channel.try_send(encoded)) {
            TRESTLE_WARN_M("Justification subscriber lags behind", {"chain", config_.name});
        }
    }
}

void DevChain::publish(const finality::Justification& justification) {
    Bytes encoded;
    codec::encode(encoded, justification);
    publish_raw_justification(encoded);
}

bool DevChain::take_request_failure() {
    if (failing_requests_ == 0) {
        return false;
    }
    --failing_requests_;
    return true;
}

const AuthorityKeys& DevChain::keys_of(uint64_t set_id) const {
    ensure(set_id < authority_sets_.size(), "unknown authority set");
    return *authority_sets_[set_id];
}

void DevChain::resolve(const TransactionWatch& watch, TransactionOutcome outcome) {
    if (!watch->try_send(std::move(outcome))) {
        TRESTLE_WARN_M("Transaction watch already resolved");
    }
}

}  // namespace trestle::dev

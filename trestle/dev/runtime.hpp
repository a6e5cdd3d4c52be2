// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <trestle/core/common/bytes.hpp>
#include <trestle/core/state/kv_store.hpp>
#include <trestle/dev/balances.hpp>
#include <trestle/dev/message_dispatch.hpp>
#include <trestle/infra/common/secp256k1_context.hpp>
#include <trestle/ledger/calls.hpp>
#include <trestle/ledger/header_chain/header_chain_ledger.hpp>
#include <trestle/ledger/messages/messages_ledger.hpp>
#include <trestle/ledger/messages/weights.hpp>
#include <trestle/ledger/parachains/parachains_ledger.hpp>
#include <trestle/ledger/relayers/delivery_confirmation_payments.hpp>
#include <trestle/ledger/relayers/reward_ledger.hpp>

namespace trestle::dev {

//! Bridge modules hosted by a dev chain. Absent configs leave the module out.
struct RuntimeConfig {
    ledger::ChainId chain_id{};
    ledger::ChainId bridged_chain_id{};
    //! Light client of the bridged chain (or of its relay chain when bridged with a parachain)
    std::optional<ledger::HeaderChainConfig> header_chain;
    //! Parachain heads of the relay chain followed by header_chain
    std::optional<ledger::ParachainsConfig> parachains;
    //! Parachain the message lanes are bridged with, the header_chain chain itself when empty
    std::optional<ParaId> bridged_parachain;
    std::optional<ledger::MessagesConfig> messages;
    ledger::RelayersConfig relayers;
    DispatchConfig dispatch;
    Balance reward_per_message{1'000'000};
    Weight max_extrinsic_weight{Weight::from_parts(2'000'000'000'000, 5_Mebi)};
    size_t max_extrinsic_size{1_Mebi};
};

enum class [[nodiscard]] TransactionValidity {
    kValid,
    kStale,              // Call would not change anything: already imported, delivered or confirmed
    kCallUnavailable,    // Chain does not host the called module
    kExhaustsResources,  // Weight or size above the chain limits
};

//! Result of a transaction included into a block
struct DispatchOutcome {
    bool success{false};
    //! Name of the ledger result when failed
    std::string error;
};

//! State transition function of a dev chain: the bridge ledgers over one key-value store
class Runtime {
  public:
    Runtime(state::KeyValueStore& store, const RuntimeConfig& config, const SecP256K1Context& secp256k1);
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    //! Pre-dispatch checks run before a transaction enters the pool
    TransactionValidity validate(const ledger::Transaction& transaction) const;

    DispatchOutcome apply(const ledger::Transaction& transaction);

    //! Spends remaining block weight on housekeeping. Returns the weight spent.
    Weight on_idle(BlockNum number, const Weight& remaining_weight);

    //! Serves the read methods of ledger::runtime_api. Throws std::invalid_argument for unknown methods
    //! or modules the chain does not host.
    Bytes state_call(std::string_view method, ByteView args) const;

    Balances& balances() noexcept { return balances_; }
    const Balances& balances() const noexcept { return balances_; }
    CountingDispatch& dispatch() noexcept { return dispatch_; }
    ledger::RewardLedger& relayers() noexcept { return relayers_; }
    const ledger::RewardLedger& relayers() const noexcept { return relayers_; }

    ledger::HeaderChainLedger* header_chain() noexcept { return header_chain_.get(); }
    const ledger::HeaderChainLedger* header_chain() const noexcept { return header_chain_.get(); }
    ledger::ParachainsLedger* parachains() noexcept { return parachains_.get(); }
    const ledger::ParachainsLedger* parachains() const noexcept { return parachains_.get(); }
    ledger::MessagesLedger* messages() noexcept { return messages_.get(); }
    const ledger::MessagesLedger* messages() const noexcept { return messages_.get(); }

    const ledger::WeightCalibrator& weights() const noexcept { return weights_; }
    const RuntimeConfig& config() const noexcept { return config_; }

  private:
    static ledger::Origin origin_of(const ledger::Transaction& transaction);

    TransactionValidity validate_call(const ledger::SubmitFinalityProofCall& call) const;
    TransactionValidity validate_call(const ledger::SubmitParachainHeadsCall& call) const;
    TransactionValidity validate_call(const ledger::ReceiveMessagesProofCall& call) const;
    TransactionValidity validate_call(const ledger::ReceiveMessagesDeliveryProofCall& call) const;
    template <class Call>
    TransactionValidity validate_call(const Call& call) const;

    std::string apply_call(const ledger::Origin& origin, const ledger::Call& call);

    const ledger::HeaderChain& messages_bridged_chain() const;

    RuntimeConfig config_;
    ledger::WeightCalibrator weights_;
    Balances balances_;
    CountingDispatch dispatch_;
    ledger::RewardLedger relayers_;
    ledger::RewardLedgerPayments payments_;
    std::unique_ptr<ledger::HeaderChainLedger> header_chain_;
    std::unique_ptr<ledger::ParachainsLedger> parachains_;
    std::unique_ptr<ledger::ParachainsLedger::ParachainHeaderChain> bridged_parachain_;
    std::unique_ptr<ledger::MessagesLedger> messages_;
};

}  // namespace trestle::dev

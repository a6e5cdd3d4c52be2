// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "runtime.hpp"

#include <algorithm>
#include <stdexcept>
#include <type_traits>

#include <absl/strings/str_cat.h>
#include <magic_enum.hpp>

#include <trestle/infra/common/decoding_exception.hpp>
#include <trestle/infra/common/ensure.hpp>
#include <trestle/infra/common/log.hpp>
#include <trestle/ledger/runtime_api.hpp>

#include <trestle/core/codec/encode_vector.hpp>

namespace trestle::dev {

namespace {

    template <class Result>
    std::string error_name(Result result) {
        return result == Result::kOk ? std::string{} : std::string{magic_enum::enum_name(result)};
    }

    template <class T>
    T decode_argument(ByteView& args, std::string_view method) {
        T value{};
        success_or_throw(codec::decode(args, value, codec::Leftover::kAllow),
                         absl::StrCat("invalid arguments of ", method));
        return value;
    }

    template <class T>
    Bytes encode_result(const T& value) {
        Bytes encoded;
        codec::encode(encoded, value);
        return encoded;
    }

    template <class Module>
    const Module& require(const Module* module, std::string_view method) {
        if (!module) {
            throw std::invalid_argument{absl::StrCat("chain does not serve ", method)};
        }
        return *module;
    }

}  // namespace

Runtime::Runtime(state::KeyValueStore& store, const RuntimeConfig& config, const SecP256K1Context& secp256k1)
    : config_{config},
      weights_{ledger::WeightInfo::reference()},
      balances_{store},
      dispatch_{store, config_.dispatch},
      relayers_{store, config_.relayers, balances_},
      payments_{relayers_, config_.bridged_chain_id, config_.reward_per_message} {
    if (config_.header_chain) {
        header_chain_ = std::make_unique<ledger::HeaderChainLedger>(store, *config_.header_chain, secp256k1);
    }
    if (config_.parachains) {
        ensure(header_chain_ != nullptr, "parachains module requires the relay chain header chain module");
        parachains_ = std::make_unique<ledger::ParachainsLedger>(store, *config_.parachains, *header_chain_);
    }
    if (config_.bridged_parachain) {
        ensure(parachains_ != nullptr, "bridged parachain requires the parachains module");
        bridged_parachain_ = std::make_unique<ledger::ParachainsLedger::ParachainHeaderChain>(
            parachains_->header_chain(*config_.bridged_parachain));
    }
    if (config_.messages) {
        ensure(header_chain_ != nullptr, "messages module requires a bridged header chain");
        messages_ = std::make_unique<ledger::MessagesLedger>(store, *config_.messages, messages_bridged_chain(),
                                                             dispatch_, payments_);
    }
}

Runtime::~Runtime() = default;

const ledger::HeaderChain& Runtime::messages_bridged_chain() const {
    if (bridged_parachain_) {
        return *bridged_parachain_;
    }
    return *header_chain_;
}

ledger::Origin Runtime::origin_of(const ledger::Transaction& transaction) {
    return ledger::Origin::signed_by(transaction.signer);
}

TransactionValidity Runtime::validate(const ledger::Transaction& transaction) const {
    Bytes encoded;
    codec::encode(encoded, transaction);
    if (encoded.size() > config_.max_extrinsic_size) {
        return TransactionValidity::kExhaustsResources;
    }
    return std::visit([&](const auto& call) { return validate_call(call); }, transaction.call);
}

template <class Call>
TransactionValidity Runtime::validate_call([[maybe_unused]] const Call& call) const {
    if constexpr (std::is_same_v<Call, ledger::InitializeCall>) {
        return header_chain_ ? TransactionValidity::kValid : TransactionValidity::kCallUnavailable;
    } else if constexpr (std::is_same_v<Call, ledger::ClaimRewardsCall>) {
        return TransactionValidity::kValid;
    } else {
        static_assert(std::is_same_v<Call, ledger::SetMessagesOperatingModeCall> ||
                      std::is_same_v<Call, ledger::SendMessageCall>);
        return messages_ ? TransactionValidity::kValid : TransactionValidity::kCallUnavailable;
    }
}

TransactionValidity Runtime::validate_call(const ledger::SubmitFinalityProofCall& call) const {
    if (!header_chain_) {
        return TransactionValidity::kCallUnavailable;
    }
    if (header_chain_->check_obsolete(call.header.number, call.current_set_id) != ledger::HeaderChainResult::kOk) {
        return TransactionValidity::kStale;
    }
    return TransactionValidity::kValid;
}

TransactionValidity Runtime::validate_call(const ledger::SubmitParachainHeadsCall& call) const {
    if (!parachains_) {
        return TransactionValidity::kCallUnavailable;
    }
    const bool has_new_head{std::ranges::any_of(call.parachains, [&](const ParaHeadUpdate& update) {
        return !parachains_->is_obsolete(update.para_id, call.at_relay_block.number, update.head_hash);
    })};
    return has_new_head ? TransactionValidity::kValid : TransactionValidity::kStale;
}

TransactionValidity Runtime::validate_call(const ledger::ReceiveMessagesProofCall& call) const {
    if (!messages_) {
        return TransactionValidity::kCallUnavailable;
    }
    const NonceRange nonces{call.proof.nonces_start, call.proof.nonces_end};
    if (!nonces.empty() && nonces.end <= messages_->inbound_lane_data(call.proof.lane).last_delivered_nonce()) {
        return TransactionValidity::kStale;
    }
    const Weight weight{weights_.receive_messages_proof_weight(trie::proof_size(call.proof.storage_proof),
                                                               call.messages_count, call.dispatch_weight)};
    if (weight.any_gt(config_.max_extrinsic_weight)) {
        return TransactionValidity::kExhaustsResources;
    }
    return TransactionValidity::kValid;
}

TransactionValidity Runtime::validate_call(const ledger::ReceiveMessagesDeliveryProofCall& call) const {
    if (!messages_) {
        return TransactionValidity::kCallUnavailable;
    }
    const auto outbound{messages_->outbound_lane_data(call.proof.lane)};
    if (call.relayers_state.last_delivered_nonce <= outbound.latest_received_nonce) {
        return TransactionValidity::kStale;
    }
    const size_t size{trie::proof_size(call.proof.storage_proof)};
    const Weight weight{weights_.receive_messages_delivery_proof_weight(size, call.relayers_state)};
    if (weight.any_gt(config_.max_extrinsic_weight)) {
        return TransactionValidity::kExhaustsResources;
    }
    return TransactionValidity::kValid;
}

DispatchOutcome Runtime::apply(const ledger::Transaction& transaction) {
    std::string error{apply_call(origin_of(transaction), transaction.call)};
    if (!error.empty()) {
        TRESTLE_DEBUG_M("Transaction failed", {"call", std::string{ledger::call_name(transaction.call)},
                                               "error", error});
        return {false, std::move(error)};
    }
    return {true, {}};
}

std::string Runtime::apply_call(const ledger::Origin& origin, const ledger::Call& call) {
    static const std::string kCallUnavailable{"kCallUnavailable"};
    return std::visit(
        [&](const auto& c) -> std::string {
            using Call = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<Call, ledger::InitializeCall>) {
                if (!header_chain_) return kCallUnavailable;
                return error_name(header_chain_->initialize(origin, c.init_data));
            } else if constexpr (std::is_same_v<Call, ledger::SubmitFinalityProofCall>) {
                if (!header_chain_) return kCallUnavailable;
                return error_name(
                    header_chain_->submit_finality_proof(origin, c.header, c.justification, c.current_set_id));
            } else if constexpr (std::is_same_v<Call, ledger::SubmitParachainHeadsCall>) {
                if (!parachains_) return kCallUnavailable;
                return error_name(
                    parachains_->submit_parachain_heads(origin, c.at_relay_block, c.parachains, c.proof));
            } else if constexpr (std::is_same_v<Call, ledger::ReceiveMessagesProofCall>) {
                if (!messages_) return kCallUnavailable;
                return error_name(messages_->receive_messages_proof(origin, c.relayer_id_at_bridged_chain, c.proof,
                                                                    c.messages_count, c.dispatch_weight));
            } else if constexpr (std::is_same_v<Call, ledger::ReceiveMessagesDeliveryProofCall>) {
                if (!messages_) return kCallUnavailable;
                return error_name(messages_->receive_messages_delivery_proof(origin, c.proof, c.relayers_state));
            } else if constexpr (std::is_same_v<Call, ledger::SetMessagesOperatingModeCall>) {
                if (!messages_) return kCallUnavailable;
                return error_name(messages_->set_operating_mode(origin, c.mode));
            } else if constexpr (std::is_same_v<Call, ledger::ClaimRewardsCall>) {
                if (c.beneficiary) {
                    return error_name(relayers_.claim_rewards_to(origin, c.params, *c.beneficiary));
                }
                return error_name(relayers_.claim_rewards(origin, c.params));
            } else {
                static_assert(std::is_same_v<Call, ledger::SendMessageCall>);
                if (!messages_) return kCallUnavailable;
                const auto sent{messages_->send_message(c.lane, c.payload)};
                return sent ? std::string{} : error_name(sent.error());
            }
        },
        call);
}

Weight Runtime::on_idle(BlockNum number, const Weight& remaining_weight) {
    if (!messages_) {
        return Weight::zero();
    }
    return messages_->on_idle(number, remaining_weight);
}

Bytes Runtime::state_call(std::string_view method, ByteView args) const {
    namespace api = ledger::runtime_api;

    if (method == api::kBestFinalized) {
        return encode_result(require(header_chain(), method).best_finalized());
    }
    if (method == api::kBridgedAuthoritySet) {
        const auto set{require(header_chain(), method).current_authority_set()};
        return encode_result(set.value_or(AuthoritySet{}));
    }
    if (method == api::kBestParachainHead) {
        const auto para_id{decode_argument<ParaId>(args, method)};
        return encode_result(require(parachains(), method).best_parachain_head_id(para_id));
    }
    if (method == api::kBestParachainInfo) {
        const auto para_id{decode_argument<ParaId>(args, method)};
        return encode_result(require(parachains(), method).best_parachain_info(para_id));
    }
    if (method == api::kMessagesBestFinalized) {
        require(messages(), method);
        return encode_result(messages_bridged_chain().best_finalized());
    }
    if (method == api::kInboundMessageDetails) {
        const auto messages_to_dispatch{decode_argument<std::vector<Message>>(args, method)};
        return encode_result(require(messages(), method).inbound_message_details(messages_to_dispatch));
    }
    if (method == api::kRelayerReward) {
        const auto relayer{decode_argument<AccountId>(args, method)};
        const auto params{decode_argument<ledger::RewardsAccountParams>(args, method)};
        return encode_result(relayers_.reward(relayer, params));
    }
    throw std::invalid_argument{absl::StrCat("unknown runtime method ", method)};
}

}  // namespace trestle::dev

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "parachains_clients.hpp"

#include <absl/strings/str_cat.h>

#include <trestle/infra/common/decoding_exception.hpp>
#include <trestle/ledger/parachains/parachains_ledger.hpp>
#include <trestle/ledger/runtime_api.hpp>
#include <trestle/relay/common/error.hpp>
#include <trestle/relay/common/runtime_call.hpp>

namespace trestle::relay {

namespace {

    Bytes encode_para_id(ParaId para_id) {
        Bytes encoded;
        codec::encode(encoded, para_id);
        return encoded;
    }

}  // namespace

Task<std::optional<ParaHead>> ChainParachainsSource::read_head(const HeaderId& at_relay_block, ParaId para_id) {
    const auto stored{co_await client_.storage_value(
        at_relay_block.hash, ledger::parachain_head_storage_key(paras_module_name_, para_id))};
    if (!stored) {
        co_return std::nullopt;
    }
    ByteView view{*stored};
    ParaHead head;
    success_or_throw(codec::decode(view, head),
                     absl::StrCat("malformed head of parachain ", para_id, " at ", client_.chain_name()));
    co_return head;
}

Task<AvailableHead> ChainParachainsSource::parachain_head(const HeaderId& at_relay_block, ParaId para_id) {
    if (!co_await client_.header_by_hash(at_relay_block.hash)) {
        co_return AvailableHead::unavailable();
    }
    const auto head{co_await read_head(at_relay_block, para_id)};
    if (!head) {
        co_return AvailableHead::missing();
    }
    ByteView view{*head};
    Header header;
    success_or_throw(codec::decode(view, header),
                     absl::StrCat("undecodable head of parachain ", para_id, " at ", client_.chain_name()));
    co_return AvailableHead::available({header.number, Hash::of(*head)});
}

Task<ParaHeadProof> ChainParachainsSource::prove_parachain_head(const HeaderId& at_relay_block, ParaId para_id) {
    const auto head{co_await read_head(at_relay_block, para_id)};
    if (!head) {
        throw RelayError{ErrorKind::kProofConstruction,
                         absl::StrCat("parachain ", para_id, " has no head at ", client_.chain_name(), " block ",
                                      at_relay_block.to_string())};
    }
    auto storage_proof{co_await client_.prove_storage(
        at_relay_block.hash, {ledger::parachain_head_storage_key(paras_module_name_, para_id)})};
    co_return ParaHeadProof{ParaHeadsProof{std::move(storage_proof)}, Hash::of(*head)};
}

Task<std::optional<HeaderId>> ChainParachainsTarget::best_finalized_relay_block() {
    const HeaderId best{co_await client_.best_header_id()};
    const auto relay_block{
        co_await call_runtime<std::optional<HeaderId>>(client_, best.hash, ledger::runtime_api::kBestFinalized)};
    if (!relay_block) {
        throw RelayError{ErrorKind::kNotInitialized,
                         absl::StrCat("PalletNotInitialized: relay chain light client at ", client_.chain_name())};
    }
    co_return relay_block;
}

Task<std::optional<ParaHeadAtTarget>> ChainParachainsTarget::parachain_head(ParaId para_id) {
    const HeaderId best{co_await client_.best_header_id()};
    const Bytes args{encode_para_id(para_id)};
    const auto info{co_await call_runtime<std::optional<ParaInfo>>(client_, best.hash,
                                                                   ledger::runtime_api::kBestParachainInfo, args)};
    const auto head{co_await call_runtime<std::optional<HeaderId>>(client_, best.hash,
                                                                   ledger::runtime_api::kBestParachainHead, args)};
    if (!info || !head) {
        co_return std::nullopt;
    }
    co_return ParaHeadAtTarget{*head, info->best_head_hash.at_relay_block_number};
}

Task<std::unique_ptr<TransactionTracker>> ChainParachainsTarget::submit_head_proof(const HeaderId& at_relay_block,
                                                                                   const ParaHeadUpdate& update,
                                                                                   const ParaHeadsProof& proof) {
    co_return co_await client_.submit_and_watch(
        {relayer_, ledger::SubmitParachainHeadsCall{at_relay_block, {update}, proof}});
}

}  // namespace trestle::relay

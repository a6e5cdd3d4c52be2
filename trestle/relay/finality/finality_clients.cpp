// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "finality_clients.hpp"

#include <absl/strings/str_cat.h>

#include <trestle/ledger/runtime_api.hpp>
#include <trestle/relay/common/error.hpp>
#include <trestle/relay/common/runtime_call.hpp>

namespace trestle::relay {

Task<BlockNum> ChainFinalitySource::best_finalized_number() {
    const HeaderId best{co_await client_.best_finalized_header_id()};
    co_return best.number;
}

Task<HeaderAndProof> ChainFinalitySource::header_and_proof(BlockNum number) {
    auto header{co_await client_.header_by_number(number)};
    if (!header) {
        throw RelayError{ErrorKind::kProofConstruction,
                         absl::StrCat("header ", number, " is unknown to ", client_.chain_name())};
    }
    auto justification{co_await client_.justification(number)};
    co_return HeaderAndProof{std::move(*header), std::move(justification)};
}

Task<std::unique_ptr<FinalitySubscription>> ChainFinalitySource::subscribe() {
    return client_.subscribe_finality_justifications();
}

Task<void> ChainFinalitySource::reconnect() {
    return client_.reconnect();
}

Task<ledger::InitializationData> ChainFinalitySource::prepare_initialization_data() {
    const HeaderId best{co_await client_.best_finalized_header_id()};
    auto header{co_await client_.header_by_hash(best.hash)};
    if (!header) {
        throw RelayError{ErrorKind::kProofConstruction,
                         absl::StrCat("best finalized header ", best.to_string(), " is unknown to ",
                                      client_.chain_name())};
    }
    auto authority_set{
        co_await call_runtime<AuthoritySet>(client_, best.hash, ledger::runtime_api::kGrandpaAuthoritySet)};
    co_return ledger::InitializationData{
        .header = std::move(*header),
        .authority_set = std::move(authority_set),
    };
}

Task<std::optional<HeaderId>> ChainFinalityTarget::best_finalized_source_id() {
    const HeaderId best{co_await client_.best_header_id()};
    co_return co_await call_runtime<std::optional<HeaderId>>(client_, best.hash, ledger::runtime_api::kBestFinalized);
}

Task<std::unique_ptr<TransactionTracker>> ChainFinalityTarget::initialize(const ledger::InitializationData& data) {
    co_return co_await client_.submit_and_watch({relayer_, ledger::InitializeCall{data}});
}

Task<std::unique_ptr<TransactionTracker>> ChainFinalityTarget::submit_finality_proof(
    const Header& header, const finality::Justification& justification) {
    const HeaderId best{co_await client_.best_header_id()};
    const auto authority_set{
        co_await call_runtime<AuthoritySet>(client_, best.hash, ledger::runtime_api::kBridgedAuthoritySet)};
    co_return co_await client_.submit_and_watch(
        {relayer_, ledger::SubmitFinalityProofCall{header, justification, authority_set.set_id}});
}

}  // namespace trestle::relay

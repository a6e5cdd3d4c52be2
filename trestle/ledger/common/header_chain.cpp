// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "header_chain.hpp"

#include <magic_enum.hpp>

#include <trestle/infra/common/log.hpp>

namespace trestle::ledger {

std::optional<Hash> HeaderChain::finalized_state_root(const Hash& header_hash) const {
    const auto header{finalized_header(header_hash)};
    if (!header) {
        return std::nullopt;
    }
    return header->state_root;
}

tl::expected<trie::StorageProofChecker, HeaderChainError> HeaderChain::parse_finalized_storage_proof(
    const Hash& header_hash, const trie::StorageProof& proof) const {
    const auto state_root{finalized_state_root(header_hash)};
    if (!state_root) {
        return tl::unexpected{HeaderChainError::kUnknownHeader};
    }
    auto checker{trie::StorageProofChecker::create(*state_root, proof)};
    if (!checker) {
        TRESTLE_DEBUG_M("Rejected storage proof", {"header", header_hash.to_hex(),
                                                   "error", std::string{magic_enum::enum_name(checker.error())}});
        return tl::unexpected{HeaderChainError::kInvalidStorageProof};
    }
    return std::move(*checker);
}

}  // namespace trestle::ledger

namespace trestle::codec {

void encode(Bytes& to, const ledger::StoredHeaderData& data) {
    encode(to, data.number);
    encode(to, data.state_root);
}

DecodingResult decode(ByteView& from, ledger::StoredHeaderData& to, Leftover mode) noexcept {
    return decode(from, mode, to.number, to.state_root);
}

}  // namespace trestle::codec

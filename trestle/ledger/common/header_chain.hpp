// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <tl/expected.hpp>

#include <trestle/core/codec/decode.hpp>
#include <trestle/core/trie/storage_proof.hpp>
#include <trestle/core/types/hash.hpp>
#include <trestle/core/types/header.hpp>

namespace trestle::ledger {

//! Parts of a finalized bridged header kept to verify proofs of the bridged state
struct StoredHeaderData {
    BlockNum number{0};
    Hash state_root;

    friend bool operator==(const StoredHeaderData&, const StoredHeaderData&) = default;
};

enum class [[nodiscard]] HeaderChainError {
    kUnknownHeader,
    kInvalidStorageProof,
};

//! Finalized headers of a bridged chain as known by this chain
class HeaderChain {
  public:
    virtual ~HeaderChain() = default;

    virtual std::optional<HeaderId> best_finalized() const = 0;

    virtual std::optional<StoredHeaderData> finalized_header(const Hash& header_hash) const = 0;

    std::optional<Hash> finalized_state_root(const Hash& header_hash) const;

    //! Storage proof reader over the state of a finalized bridged header
    tl::expected<trie::StorageProofChecker, HeaderChainError> parse_finalized_storage_proof(
        const Hash& header_hash, const trie::StorageProof& proof) const;
};

}  // namespace trestle::ledger

namespace trestle::codec {

void encode(Bytes& to, const ledger::StoredHeaderData& data);

DecodingResult decode(ByteView& from, ledger::StoredHeaderData& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace trestle::codec

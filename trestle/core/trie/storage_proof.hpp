// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <tl/expected.hpp>

#include <trestle/core/common/bytes.hpp>
#include <trestle/core/types/hash.hpp>

namespace trestle::trie {

//! Unordered list of encoded trie nodes proving a set of storage values
using StorageProof = std::vector<Bytes>;

//! Total bytes of the proof nodes
size_t proof_size(const StorageProof& proof);

enum class [[nodiscard]] ProofError {
    kDuplicateNodesInProof,
    kStorageRootMismatch,
    kStorageValueUnavailable,
    kUnusedNodesInTheProof,
    kInvalidNode,
};

//! Read-only view over the storage of a bridged chain built from a storage proof.
//! Every node of the proof must be touched by some read, otherwise the proof is oversized.
class StorageProofChecker {
  public:
    static tl::expected<StorageProofChecker, ProofError> create(const Hash& root, const StorageProof& proof);

    //! Value stored under key, std::nullopt when the proof shows the key is absent
    tl::expected<std::optional<Bytes>, ProofError> read_value(ByteView key);

    tl::expected<void, ProofError> ensure_no_unused_nodes() const;

  private:
    StorageProofChecker(const Hash& root, std::unordered_map<Hash, Bytes> nodes)
        : root_{root}, nodes_{std::move(nodes)} {}

    tl::expected<ByteView, ProofError> use_node(const Hash& hash);

    Hash root_;
    std::unordered_map<Hash, Bytes> nodes_;
    std::unordered_set<Hash> used_;
};

}  // namespace trestle::trie

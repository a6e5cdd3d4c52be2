// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

#include <trestle/core/common/bytes.hpp>
#include <trestle/core/trie/node.hpp>
#include <trestle/core/trie/storage_proof.hpp>
#include <trestle/core/types/hash.hpp>

namespace trestle::trie {

//! Immutable hexary Merkle-Patricia trie built at once from a key-ordered set of entries.
//! Keeps every node so that storage proofs can be generated for any key.
class MemoryTrie {
  public:
    using Entries = std::vector<std::pair<Bytes, Bytes>>;

    //! \param entries must be sorted by key with no duplicated keys
    explicit MemoryTrie(const Entries& entries);

    const Hash& root() const noexcept { return root_; }

    std::optional<Bytes> get(ByteView key) const;

    //! Nodes on the lookup path of every key (present or absent), each node appearing once
    StorageProof prove(const std::vector<Bytes>& keys) const;

  private:
    struct Entry {
        Bytes nibbles;
        const Bytes* value;
    };

    Hash build(std::span<const Entry> entries, size_t depth);
    Hash store(const Node& node);
    const Node& node_at(const Hash& hash) const;

    std::unordered_map<Hash, std::pair<Bytes, Node>> nodes_;
    Hash root_;
};

}  // namespace trestle::trie

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "storage_proof.hpp"

#include <trestle/core/trie/nibbles.hpp>
#include <trestle/core/trie/node.hpp>

namespace trestle::trie {

size_t proof_size(const StorageProof& proof) {
    size_t size{0};
    for (const auto& node : proof) {
        size += node.size();
    }
    return size;
}

tl::expected<StorageProofChecker, ProofError> StorageProofChecker::create(const Hash& root, const StorageProof& proof) {
    std::unordered_map<Hash, Bytes> nodes;
    nodes.reserve(proof.size());
    for (const auto& node : proof) {
        if (!nodes.emplace(Hash::of(node), node).second) {
            return tl::unexpected{ProofError::kDuplicateNodesInProof};
        }
    }
    if (!nodes.contains(root)) {
        return tl::unexpected{ProofError::kStorageRootMismatch};
    }
    return StorageProofChecker{root, std::move(nodes)};
}

tl::expected<ByteView, ProofError> StorageProofChecker::use_node(const Hash& hash) {
    const auto it{nodes_.find(hash)};
    if (it == nodes_.end()) {
        return tl::unexpected{ProofError::kStorageValueUnavailable};
    }
    used_.insert(hash);
    return ByteView{it->second};
}

tl::expected<std::optional<Bytes>, ProofError> StorageProofChecker::read_value(ByteView key) {
    const Bytes nibbles{unpack_nibbles(key)};
    ByteView remaining{nibbles};
    Hash next{root_};
    while (true) {
        const auto encoded{use_node(next)};
        if (!encoded) {
            return tl::unexpected{encoded.error()};
        }
        const auto node{decode_node(*encoded)};
        if (!node) {
            return tl::unexpected{ProofError::kInvalidNode};
        }

        if (const auto* leaf{std::get_if<LeafNode>(&*node)}) {
            if (remaining == ByteView{leaf->path}) {
                return std::optional<Bytes>{leaf->value};
            }
            return std::optional<Bytes>{};
        }
        if (const auto* extension{std::get_if<ExtensionNode>(&*node)}) {
            if (remaining.substr(0, extension->path.size()) != ByteView{extension->path}) {
                return std::optional<Bytes>{};
            }
            remaining.remove_prefix(extension->path.size());
            next = extension->child;
            continue;
        }
        if (const auto* branch{std::get_if<BranchNode>(&*node)}) {
            if (remaining.empty()) {
                return branch->value;
            }
            const auto& child{branch->children[remaining[0]]};
            if (!child) {
                return std::optional<Bytes>{};
            }
            remaining.remove_prefix(1);
            next = *child;
            continue;
        }
        return std::optional<Bytes>{};
    }
}

tl::expected<void, ProofError> StorageProofChecker::ensure_no_unused_nodes() const {
    if (used_.size() != nodes_.size()) {
        return tl::unexpected{ProofError::kUnusedNodesInTheProof};
    }
    return {};
}

}  // namespace trestle::trie

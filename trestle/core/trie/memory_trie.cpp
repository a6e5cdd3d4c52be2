// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "memory_trie.hpp"

#include <unordered_set>

#include <trestle/core/common/util.hpp>
#include <trestle/core/trie/nibbles.hpp>
#include <trestle/infra/common/ensure.hpp>

namespace trestle::trie {

MemoryTrie::MemoryTrie(const Entries& entries) {
    std::vector<Entry> unpacked;
    unpacked.reserve(entries.size());
    for (const auto& [key, value] : entries) {
        unpacked.push_back(Entry{unpack_nibbles(key), &value});
        if (unpacked.size() > 1) {
            ensure(unpacked[unpacked.size() - 2].nibbles < unpacked.back().nibbles,
                   "MemoryTrie: entries must be sorted by unique keys");
        }
    }
    root_ = build(unpacked, 0);
}

Hash MemoryTrie::store(const Node& node) {
    Bytes encoded{encode_node(node)};
    const Hash hash{Hash::of(encoded)};
    nodes_.try_emplace(hash, std::move(encoded), node);
    return hash;
}

Hash MemoryTrie::build(std::span<const Entry> entries, size_t depth) {
    if (entries.empty()) {
        return store(EmptyNode{});
    }
    if (entries.size() == 1) {
        return store(LeafNode{entries.front().nibbles.substr(depth), *entries.front().value});
    }

    const ByteView first{ByteView{entries.front().nibbles}.substr(depth)};
    const ByteView last{ByteView{entries.back().nibbles}.substr(depth)};
    const size_t common{prefix_length(first, last)};
    if (common > 0) {
        const Hash child{build(entries, depth + common)};
        return store(ExtensionNode{Bytes{first.substr(0, common)}, child});
    }

    BranchNode branch;
    size_t i{0};
    if (first.empty()) {
        branch.value = *entries.front().value;
        i = 1;
    }
    while (i < entries.size()) {
        const uint8_t nibble{entries[i].nibbles[depth]};
        size_t j{i + 1};
        while (j < entries.size() && entries[j].nibbles[depth] == nibble) {
            ++j;
        }
        branch.children[nibble] = build(entries.subspan(i, j - i), depth + 1);
        i = j;
    }
    return store(branch);
}

const Node& MemoryTrie::node_at(const Hash& hash) const {
    const auto it{nodes_.find(hash)};
    ensure_invariant(it != nodes_.end(), [&]() { return "MemoryTrie: missing node " + hash.to_hex(); });
    return it->second.second;
}

std::optional<Bytes> MemoryTrie::get(ByteView key) const {
    const Bytes nibbles{unpack_nibbles(key)};
    ByteView remaining{nibbles};
    const Node* node{&node_at(root_)};
    while (true) {
        if (const auto* leaf{std::get_if<LeafNode>(node)}) {
            if (remaining == ByteView{leaf->path}) {
                return leaf->value;
            }
            return std::nullopt;
        }
        if (const auto* extension{std::get_if<ExtensionNode>(node)}) {
            if (remaining.substr(0, extension->path.size()) != ByteView{extension->path}) {
                return std::nullopt;
            }
            remaining.remove_prefix(extension->path.size());
            node = &node_at(extension->child);
            continue;
        }
        if (const auto* branch{std::get_if<BranchNode>(node)}) {
            if (remaining.empty()) {
                return branch->value;
            }
            const auto& child{branch->children[remaining[0]]};
            if (!child) {
                return std::nullopt;
            }
            remaining.remove_prefix(1);
            node = &node_at(*child);
            continue;
        }
        return std::nullopt;
    }
}

StorageProof MemoryTrie::prove(const std::vector<Bytes>& keys) const {
    StorageProof proof;
    std::unordered_set<Hash> visited;
    const auto visit = [&](const Hash& hash) -> const Node& {
        if (visited.insert(hash).second) {
            proof.push_back(nodes_.at(hash).first);
        }
        return node_at(hash);
    };

    for (const auto& key : keys) {
        const Bytes nibbles{unpack_nibbles(key)};
        ByteView remaining{nibbles};
        const Node* node{&visit(root_)};
        while (node) {
            const Node* next{nullptr};
            if (const auto* extension{std::get_if<ExtensionNode>(node)}) {
                if (remaining.substr(0, extension->path.size()) == ByteView{extension->path}) {
                    remaining.remove_prefix(extension->path.size());
                    next = &visit(extension->child);
                }
            } else if (const auto* branch{std::get_if<BranchNode>(node)}) {
                if (!remaining.empty() && branch->children[remaining[0]]) {
                    const Hash& child{*branch->children[remaining[0]]};
                    remaining.remove_prefix(1);
                    next = &visit(child);
                }
            }
            node = next;
        }
    }
    return proof;
}

}  // namespace trestle::trie

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <optional>
#include <variant>

#include <trestle/core/common/base.hpp>
#include <trestle/core/common/bytes.hpp>
#include <trestle/core/common/decoding_result.hpp>
#include <trestle/core/types/hash.hpp>

namespace trestle::trie {

//! Node of the hexary storage trie. Children are always referenced by their keccak256 hash.
//! Encoding:
//!   empty:     0x00
//!   leaf:      0x01 | path | value
//!   extension: 0x02 | path | child hash
//!   branch:    0x03 | u16 children bitmap | child hash for each set bit | optional value
struct LeafNode {
    Bytes path;  // nibbles
    Bytes value;

    friend bool operator==(const LeafNode&, const LeafNode&) = default;
};

struct ExtensionNode {
    Bytes path;  // nibbles
    Hash child;

    friend bool operator==(const ExtensionNode&, const ExtensionNode&) = default;
};

struct BranchNode {
    std::array<std::optional<Hash>, 16> children;
    std::optional<Bytes> value;

    friend bool operator==(const BranchNode&, const BranchNode&) = default;
};

struct EmptyNode {
    friend bool operator==(const EmptyNode&, const EmptyNode&) = default;
};

using Node = std::variant<EmptyNode, LeafNode, ExtensionNode, BranchNode>;

enum class NodeType : uint8_t {
    kEmpty = 0x00,
    kLeaf = 0x01,
    kExtension = 0x02,
    kBranch = 0x03,
};

Bytes encode_node(const Node& node);

tl::expected<Node, DecodingError> decode_node(ByteView encoded);

//! Root hash of a trie without any entry
const Hash& empty_trie_root();

}  // namespace trestle::trie

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "node.hpp"

#include <trestle/core/codec/decode.hpp>
#include <trestle/core/codec/encode_vector.hpp>
#include <trestle/core/trie/nibbles.hpp>

namespace trestle::trie {

namespace {

    struct NodeEncoder {
        Bytes& out;

        void operator()(const EmptyNode&) const {
            out.push_back(static_cast<uint8_t>(NodeType::kEmpty));
        }
        void operator()(const LeafNode& leaf) const {
            out.push_back(static_cast<uint8_t>(NodeType::kLeaf));
            codec::encode(out, ByteView{encode_path(leaf.path)});
            codec::encode(out, ByteView{leaf.value});
        }
        void operator()(const ExtensionNode& extension) const {
            out.push_back(static_cast<uint8_t>(NodeType::kExtension));
            codec::encode(out, ByteView{encode_path(extension.path)});
            codec::encode(out, extension.child);
        }
        void operator()(const BranchNode& branch) const {
            out.push_back(static_cast<uint8_t>(NodeType::kBranch));
            uint16_t bitmap{0};
            for (size_t i{0}; i < branch.children.size(); ++i) {
                if (branch.children[i]) {
                    bitmap |= static_cast<uint16_t>(1u << i);
                }
            }
            codec::encode(out, bitmap);
            for (const auto& child : branch.children) {
                if (child) {
                    codec::encode(out, *child);
                }
            }
            codec::encode(out, branch.value);
        }
    };

    tl::expected<Bytes, DecodingError> decode_node_path(ByteView& from) {
        Bytes encoded_path;
        if (DecodingResult res{codec::decode(from, encoded_path, codec::Leftover::kAllow)}; !res) {
            return tl::unexpected{res.error()};
        }
        return decode_path(encoded_path);
    }

}  // namespace

Bytes encode_node(const Node& node) {
    Bytes out;
    std::visit(NodeEncoder{out}, node);
    return out;
}

tl::expected<Node, DecodingError> decode_node(ByteView encoded) {
    if (encoded.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    const uint8_t type{encoded[0]};
    encoded.remove_prefix(1);

    switch (static_cast<NodeType>(type)) {
        case NodeType::kEmpty: {
            if (!encoded.empty()) {
                return tl::unexpected{DecodingError::kInputTooLong};
            }
            return EmptyNode{};
        }
        case NodeType::kLeaf: {
            LeafNode leaf;
            auto path{decode_node_path(encoded)};
            if (!path) {
                return tl::unexpected{path.error()};
            }
            leaf.path = std::move(*path);
            if (DecodingResult res{codec::decode(encoded, leaf.value)}; !res) {
                return tl::unexpected{res.error()};
            }
            return leaf;
        }
        case NodeType::kExtension: {
            ExtensionNode extension;
            auto path{decode_node_path(encoded)};
            if (!path) {
                return tl::unexpected{path.error()};
            }
            if (path->empty()) {
                return tl::unexpected{DecodingError::kInvalidNibbles};
            }
            extension.path = std::move(*path);
            if (DecodingResult res{codec::decode(encoded, extension.child)}; !res) {
                return tl::unexpected{res.error()};
            }
            return extension;
        }
        case NodeType::kBranch: {
            BranchNode branch;
            uint16_t bitmap{0};
            if (DecodingResult res{codec::decode(encoded, bitmap, codec::Leftover::kAllow)}; !res) {
                return tl::unexpected{res.error()};
            }
            for (size_t i{0}; i < branch.children.size(); ++i) {
                if (bitmap & (1u << i)) {
                    Hash child;
                    if (DecodingResult res{codec::decode(encoded, child, codec::Leftover::kAllow)}; !res) {
                        return tl::unexpected{res.error()};
                    }
                    branch.children[i] = child;
                }
            }
            if (DecodingResult res{codec::decode(encoded, branch.value)}; !res) {
                return tl::unexpected{res.error()};
            }
            return branch;
        }
    }
    return tl::unexpected{DecodingError::kInvalidNodeType};
}

const Hash& empty_trie_root() {
    static const Hash kEmptyRoot{Hash::of(encode_node(EmptyNode{}))};
    return kEmptyRoot;
}

}  // namespace trestle::trie

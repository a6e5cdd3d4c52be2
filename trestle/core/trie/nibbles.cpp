// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "nibbles.hpp"

namespace trestle::trie {

Bytes pack_nibbles(ByteView unpacked) {
    if (unpacked.empty()) {
        return {};
    }

    const size_t odd{unpacked.size() & 1};
    Bytes out((unpacked.size() + odd) / 2, '\0');
    auto out_it{out.begin()};
    while (unpacked.size() > odd) {
        *out_it++ = static_cast<uint8_t>((unpacked[0] << 4) + unpacked[1]);
        unpacked.remove_prefix(2);
    }
    if (odd) {
        *out_it = static_cast<uint8_t>(unpacked[0] << 4);
    }
    return out;
}

Bytes unpack_nibbles(ByteView data) {
    Bytes out(2 * data.size(), '\0');
    size_t offset{0};
    for (const auto& b : data) {
        out[offset] = b >> 4;
        out[offset + 1] = b & 0x0F;
        offset += 2;
    }
    return out;
}

Bytes encode_path(ByteView nibbles) {
    Bytes out;
    out.reserve(1 + (nibbles.size() + 1) / 2);
    out.push_back(static_cast<uint8_t>(nibbles.size() & 1));
    out.append(pack_nibbles(nibbles));
    return out;
}

tl::expected<Bytes, DecodingError> decode_path(ByteView encoded) {
    if (encoded.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    const uint8_t odd{encoded[0]};
    if (odd > 1) {
        return tl::unexpected{DecodingError::kInvalidNibbles};
    }
    encoded.remove_prefix(1);
    if (odd && encoded.empty()) {
        return tl::unexpected{DecodingError::kInvalidNibbles};
    }
    Bytes nibbles{unpack_nibbles(encoded)};
    if (odd) {
        if (nibbles.back() != 0) {
            return tl::unexpected{DecodingError::kInvalidNibbles};
        }
        nibbles.pop_back();
    }
    return nibbles;
}

}  // namespace trestle::trie

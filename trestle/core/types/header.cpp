// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "header.hpp"

#include <trestle/core/codec/encode_vector.hpp>

namespace trestle {

std::string HeaderId::to_string() const {
    return std::to_string(number) + "/" + hash.to_hex();
}

Hash Header::hash() const {
    Bytes encoded;
    codec::encode(encoded, *this);
    return Hash::of(encoded);
}

namespace codec {

    void encode(Bytes& to, const HeaderId& id) {
        encode(to, id.number);
        encode(to, id.hash);
    }

    void encode(Bytes& to, const ScheduledChange& change) {
        encode(to, change.next_authorities);
        encode(to, change.delay);
    }

    void encode(Bytes& to, const Header& header) {
        encode(to, header.parent_hash);
        encode(to, header.number);
        encode(to, header.state_root);
        encode(to, header.extrinsics_root);
        encode(to, header.digest.scheduled_change);
        encode(to, header.digest.forced_change);
    }

    void encode(Bytes& to, const AuthoritySet& set) {
        encode(to, set.authorities);
        encode(to, set.set_id);
    }

    DecodingResult decode(ByteView& from, HeaderId& to, Leftover mode) noexcept {
        return decode(from, mode, to.number, to.hash);
    }

    DecodingResult decode(ByteView& from, ScheduledChange& to, Leftover mode) noexcept {
        return decode(from, mode, to.next_authorities, to.delay);
    }

    DecodingResult decode(ByteView& from, Header& to, Leftover mode) noexcept {
        return decode(from, mode, to.parent_hash, to.number, to.state_root, to.extrinsics_root,
                      to.digest.scheduled_change, to.digest.forced_change);
    }

    DecodingResult decode(ByteView& from, AuthoritySet& to, Leftover mode) noexcept {
        return decode(from, mode, to.authorities, to.set_id);
    }

}  // namespace codec

}  // namespace trestle

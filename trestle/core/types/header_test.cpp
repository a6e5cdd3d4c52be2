// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "header.hpp"

#include <catch2/catch.hpp>

#include <trestle/core/codec/encode_vector.hpp>
#include <trestle/core/common/util.hpp>

namespace trestle {

static Header sample_header() {
    Header header;
    header.parent_hash = Hash::of(*from_hex("01"));
    header.number = 42;
    header.state_root = Hash::of(*from_hex("02"));
    header.extrinsics_root = Hash::of(*from_hex("03"));
    return header;
}

TEST_CASE("Header encoding", "[types]") {
    Header header{sample_header()};

    SECTION("without digest") {
        Bytes encoded;
        codec::encode(encoded, header);
        CHECK(encoded.size() == 3 * kHashLength + 8 + 2);
        ByteView view{encoded};
        Header decoded;
        REQUIRE(codec::decode(view, decoded));
        CHECK(decoded == header);
        CHECK(decoded.hash() == header.hash());
    }

    SECTION("with scheduled change") {
        AuthorityId authority{};
        authority[0] = 0x02;
        header.digest.scheduled_change = ScheduledChange{{authority, authority}, 0};
        Bytes encoded;
        codec::encode(encoded, header);
        ByteView view{encoded};
        Header decoded;
        REQUIRE(codec::decode(view, decoded));
        CHECK(decoded == header);
        CHECK(header.hash() != sample_header().hash());
    }

    SECTION("truncated") {
        Bytes encoded;
        codec::encode(encoded, header);
        encoded.pop_back();
        ByteView view{encoded};
        Header decoded;
        CHECK(codec::decode(view, decoded).error() == DecodingError::kInputTooShort);
    }
}

TEST_CASE("Header id", "[types]") {
    const Header header{sample_header()};
    const HeaderId id{header.id()};
    CHECK(id.number == 42);
    CHECK(id.hash == header.hash());
    CHECK(id.to_string().starts_with("42/0x"));
}

}  // namespace trestle

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "nibbles.hpp"

#include <string>
#include <utility>
#include <vector>

#include <catch2/catch.hpp>

#include <trestle/core/common/util.hpp>

namespace trestle::trie {

TEST_CASE("Nibbles", "[trie]") {
    const std::vector<std::pair<std::string, std::string>> test_cases = {
        // Bytes -> Nibbles
        {"00", "0000"},                          //
        {"0f", "000f"},                          //
        {"f011", "0f000101"},                    //
        {"123456789a", "0102030405060708090a"},  //
    };

    CHECK(pack_nibbles({}).empty());
    CHECK(unpack_nibbles({}).empty());

    for (const auto& [packed_hex, unpacked_hex] : test_cases) {
        const auto packed{from_hex(packed_hex)};
        const auto unpacked{from_hex(unpacked_hex)};
        REQUIRE((packed.has_value() && unpacked.has_value()));
        CHECK(to_hex(unpack_nibbles(*packed)) == unpacked_hex);
        CHECK(to_hex(pack_nibbles(*unpacked)) == packed_hex);
    }

    const Bytes odd_input{1u, 2u, 3u};
    CHECK(to_hex(pack_nibbles(odd_input)) == "1230");
}

TEST_CASE("Partial paths", "[trie]") {
    SECTION("even") {
        const Bytes nibbles{0x1, 0x2, 0x3, 0x4};
        const Bytes encoded{encode_path(nibbles)};
        CHECK(to_hex(encoded) == "001234");
        CHECK(decode_path(encoded) == nibbles);
    }
    SECTION("odd") {
        const Bytes nibbles{0x1, 0x2, 0x3};
        const Bytes encoded{encode_path(nibbles)};
        CHECK(to_hex(encoded) == "011230");
        CHECK(decode_path(encoded) == nibbles);
    }
    SECTION("empty") {
        const Bytes encoded{encode_path({})};
        CHECK(to_hex(encoded) == "00");
        CHECK(decode_path(encoded)->empty());
    }
    SECTION("malformed") {
        CHECK(decode_path(*from_hex("02")).error() == DecodingError::kInvalidNibbles);
        CHECK(decode_path(*from_hex("01")).error() == DecodingError::kInvalidNibbles);
        CHECK(decode_path(*from_hex("011231")).error() == DecodingError::kInvalidNibbles);
        CHECK(decode_path({}).error() == DecodingError::kInputTooShort);
    }
}

}  // namespace trestle::trie

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include <trestle/core/codec/decode.hpp>
#include <trestle/core/common/base.hpp>
#include <trestle/core/common/bytes.hpp>
#include <trestle/core/types/hash.hpp>

namespace trestle {

//! Compressed secp256k1 public key of a finality authority
using AuthorityId = std::array<uint8_t, 33>;

//! Compact ECDSA signature
using AuthoritySignature = std::array<uint8_t, 64>;

struct HeaderId {
    BlockNum number{0};
    Hash hash;

    std::string to_string() const;

    friend bool operator==(const HeaderId&, const HeaderId&) = default;
};

//! Authority set change announced by a header, enacted after delay blocks
struct ScheduledChange {
    std::vector<AuthorityId> next_authorities;
    BlockNum delay{0};

    friend bool operator==(const ScheduledChange&, const ScheduledChange&) = default;
};

struct HeaderDigest {
    std::optional<ScheduledChange> scheduled_change;
    //! Changes forced by the chain governance, never accepted by light clients
    std::optional<ScheduledChange> forced_change;

    friend bool operator==(const HeaderDigest&, const HeaderDigest&) = default;
};

struct Header {
    Hash parent_hash;
    BlockNum number{0};
    Hash state_root;
    Hash extrinsics_root;
    HeaderDigest digest;

    //! keccak256 of the encoded header
    Hash hash() const;

    HeaderId id() const { return {number, hash()}; }

    friend bool operator==(const Header&, const Header&) = default;
};

struct AuthoritySet {
    std::vector<AuthorityId> authorities;
    uint64_t set_id{0};

    friend bool operator==(const AuthoritySet&, const AuthoritySet&) = default;
};

namespace codec {
    void encode(Bytes& to, const HeaderId& id);
    void encode(Bytes& to, const ScheduledChange& change);
    void encode(Bytes& to, const Header& header);
    void encode(Bytes& to, const AuthoritySet& set);

    DecodingResult decode(ByteView& from, HeaderId& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, ScheduledChange& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, Header& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, AuthoritySet& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace codec

}  // namespace trestle

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstring>
#include <optional>
#include <string>

#include <evmc/evmc.hpp>

#include <trestle/core/common/assert.hpp>
#include <trestle/core/common/base.hpp>
#include <trestle/core/common/bytes.hpp>
#include <trestle/core/common/util.hpp>

namespace trestle {

class Hash : public evmc::bytes32 {
  public:
    using evmc::bytes32::bytes32;

    Hash() = default;
    explicit Hash(ByteView bv) {
        TRESTLE_ASSERT(bv.size() == size());
        std::memcpy(bytes, bv.data(), size());
    }

    static constexpr size_t size() { return sizeof(evmc::bytes32); }

    std::string to_hex() const { return trestle::to_hex(*this, /*with_prefix=*/true); }
    static std::optional<Hash> from_hex(const std::string& hex) { return evmc::from_hex<Hash>(hex); }

    //! keccak256 digest of the given data
    static Hash of(ByteView data) {
        const ethash::hash256 digest{keccak256(data)};
        return Hash{ByteView{digest.bytes}};
    }

    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    operator ByteView() const { return ByteView{bytes}; }

    static_assert(sizeof(evmc::bytes32) == 32);
};

}  // namespace trestle

namespace std {

template <>
struct hash<trestle::Hash> : public std::hash<evmc::bytes32>  // to use Hash with std::unordered_set/map
{};

}  // namespace std

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <trestle/core/common/bytes.hpp>

namespace trestle::state {

//! Length of a storage item prefix: keccak128(module) ++ keccak128(item)
inline constexpr size_t kStoragePrefixLength{32};

//! Length of the hash part of a hashed map key
inline constexpr size_t kKeyHashLength{16};

//! Key prefix shared by every entry of a storage item of a ledger module
Bytes storage_prefix(std::string_view module, std::string_view item);

//! Map entry key: prefix ++ keccak128(encoded_key) ++ encoded_key.
//! The plain key suffix allows entries to be decoded back while iterating the map.
Bytes storage_map_key(std::string_view module, std::string_view item, ByteView encoded_key);

//! Double map entry key: the map key of key1 followed by keccak128(encoded_key2) ++ encoded_key2
Bytes storage_double_map_key(std::string_view module, std::string_view item, ByteView encoded_key1,
                             ByteView encoded_key2);

}  // namespace trestle::state

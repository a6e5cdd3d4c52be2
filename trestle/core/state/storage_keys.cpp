// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "storage_keys.hpp"

#include <trestle/core/common/util.hpp>

namespace trestle::state {

static ByteView as_bytes(std::string_view str) {
    return {reinterpret_cast<const uint8_t*>(str.data()), str.size()};
}

Bytes storage_prefix(std::string_view module, std::string_view item) {
    Bytes prefix{keccak128(as_bytes(module))};
    prefix.append(keccak128(as_bytes(item)));
    return prefix;
}

Bytes storage_map_key(std::string_view module, std::string_view item, ByteView encoded_key) {
    Bytes key{storage_prefix(module, item)};
    key.append(keccak128(encoded_key));
    key.append(encoded_key);
    return key;
}

Bytes storage_double_map_key(std::string_view module, std::string_view item, ByteView encoded_key1,
                             ByteView encoded_key2) {
    Bytes key{storage_map_key(module, item, encoded_key1)};
    key.append(keccak128(encoded_key2));
    key.append(encoded_key2);
    return key;
}

}  // namespace trestle::state

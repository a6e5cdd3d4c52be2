// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

// Encoding of optional values and sequences.
// Include after the headers declaring the overloads of the encoded item types.

#pragma once

#include <optional>
#include <vector>

#include <trestle/core/codec/encode.hpp>

namespace trestle::codec {

template <class T>
void encode(Bytes& to, const std::optional<T>& value) {
    if (!value) {
        to.push_back(0);
        return;
    }
    to.push_back(1);
    encode(to, *value);
}

template <class T>
void encode(Bytes& to, const std::vector<T>& items) {
    encode_compact(to, items.size());
    for (const T& item : items) {
        encode(to, item);
    }
}

}  // namespace trestle::codec

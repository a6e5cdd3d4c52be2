// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <optional>

#include <trestle/core/common/bytes.hpp>

namespace trestle::state {

//! Byte oriented storage backing the on-chain ledgers
class KeyValueStore {
  public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<Bytes> get(ByteView key) const = 0;
    virtual void put(ByteView key, ByteView value) = 0;
    virtual void erase(ByteView key) = 0;

    bool contains(ByteView key) const { return get(key).has_value(); }

    //! Visits all entries whose key starts with prefix, in key order
    virtual void for_each_with_prefix(ByteView prefix,
                                      const std::function<void(ByteView key, ByteView value)>& visitor) const = 0;
};

}  // namespace trestle::state

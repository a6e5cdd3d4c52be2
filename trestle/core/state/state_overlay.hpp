// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <absl/container/btree_map.h>

#include <trestle/core/state/kv_store.hpp>

namespace trestle::state {

//! Buffers the writes of one call on top of a base store.
//! Nothing reaches the base store unless commit() is called, so failed calls leave no partial writes.
class StateOverlay : public KeyValueStore {
  public:
    explicit StateOverlay(KeyValueStore& base) : base_{base} {}

    std::optional<Bytes> get(ByteView key) const override;
    void put(ByteView key, ByteView value) override;
    void erase(ByteView key) override;
    void for_each_with_prefix(ByteView prefix,
                              const std::function<void(ByteView key, ByteView value)>& visitor) const override;

    //! Applies the buffered writes to the base store
    void commit();

    //! Drops the buffered writes
    void discard() { changes_.clear(); }

    bool has_changes() const noexcept { return !changes_.empty(); }

  private:
    KeyValueStore& base_;
    // std::nullopt marks an erased key
    absl::btree_map<Bytes, std::optional<Bytes>> changes_;
};

}  // namespace trestle::state

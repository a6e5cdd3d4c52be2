// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <absl/container/btree_map.h>

#include <trestle/core/state/kv_store.hpp>
#include <trestle/core/trie/memory_trie.hpp>

namespace trestle::state {

//! Ordered in-memory store, copyable to take snapshots of chain state
class MemoryKvStore : public KeyValueStore {
  public:
    std::optional<Bytes> get(ByteView key) const override;
    void put(ByteView key, ByteView value) override;
    void erase(ByteView key) override;
    void for_each_with_prefix(ByteView prefix,
                              const std::function<void(ByteView key, ByteView value)>& visitor) const override;

    size_t size() const noexcept { return entries_.size(); }

    //! Storage trie over all entries
    trie::MemoryTrie build_trie() const;

  private:
    absl::btree_map<Bytes, Bytes> entries_;
};

}  // namespace trestle::state

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "memory_kv_store.hpp"

namespace trestle::state {

std::optional<Bytes> MemoryKvStore::get(ByteView key) const {
    const auto it{entries_.find(Bytes{key})};
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryKvStore::put(ByteView key, ByteView value) {
    entries_.insert_or_assign(Bytes{key}, Bytes{value});
}

void MemoryKvStore::erase(ByteView key) {
    entries_.erase(Bytes{key});
}

void MemoryKvStore::for_each_with_prefix(ByteView prefix,
                                         const std::function<void(ByteView key, ByteView value)>& visitor) const {
    for (auto it{entries_.lower_bound(Bytes{prefix})}; it != entries_.end(); ++it) {
        if (!ByteView{it->first}.starts_with(prefix)) {
            break;
        }
        visitor(it->first, it->second);
    }
}

trie::MemoryTrie MemoryKvStore::build_trie() const {
    return trie::MemoryTrie{trie::MemoryTrie::Entries{entries_.begin(), entries_.end()}};
}

}  // namespace trestle::state

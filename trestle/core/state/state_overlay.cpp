// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "state_overlay.hpp"

namespace trestle::state {

std::optional<Bytes> StateOverlay::get(ByteView key) const {
    const auto it{changes_.find(Bytes{key})};
    if (it != changes_.end()) {
        return it->second;
    }
    return base_.get(key);
}

void StateOverlay::put(ByteView key, ByteView value) {
    changes_.insert_or_assign(Bytes{key}, Bytes{value});
}

void StateOverlay::erase(ByteView key) {
    changes_.insert_or_assign(Bytes{key}, std::nullopt);
}

void StateOverlay::for_each_with_prefix(ByteView prefix,
                                        const std::function<void(ByteView key, ByteView value)>& visitor) const {
    absl::btree_map<Bytes, Bytes> merged;
    base_.for_each_with_prefix(prefix, [&](ByteView key, ByteView value) {
        merged.emplace(Bytes{key}, Bytes{value});
    });
    for (auto it{changes_.lower_bound(Bytes{prefix})}; it != changes_.end(); ++it) {
        if (!ByteView{it->first}.starts_with(prefix)) {
            break;
        }
        if (it->second) {
            merged.insert_or_assign(it->first, *it->second);
        } else {
            merged.erase(it->first);
        }
    }
    for (const auto& [key, value] : merged) {
        visitor(key, value);
    }
}

void StateOverlay::commit() {
    for (const auto& [key, value] : changes_) {
        if (value) {
            base_.put(key, *value);
        } else {
            base_.erase(key);
        }
    }
    changes_.clear();
}

}  // namespace trestle::state

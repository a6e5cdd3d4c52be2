// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "message_dispatch.hpp"

#include <utility>

#include <trestle/infra/common/log.hpp>

#include <trestle/core/state/storage.hpp>

namespace trestle::dev {

struct CountingDispatch::Storage {
    explicit Storage(const std::string& module) : dispatched{module, "Dispatched"}, failed{module, "Failed"} {}

    state::StorageValue<uint64_t> dispatched;
    state::StorageValue<uint64_t> failed;
};

CountingDispatch::CountingDispatch(state::KeyValueStore& store, DispatchConfig config)
    : store_{store}, config_{std::move(config)}, storage_{std::make_unique<Storage>(config_.module_name)} {}

CountingDispatch::~CountingDispatch() = default;

Weight CountingDispatch::dispatch_weight(const Message& message) const {
    return config_.base_weight.saturating_add(config_.weight_per_byte.saturating_mul(message.payload.size()));
}

bool CountingDispatch::dispatch(state::KeyValueStore& state, const Message& message) {
    const bool success{message.payload.empty() || message.payload[0] != kFailingPayloadMarker};
    const auto& counter{success ? storage_->dispatched : storage_->failed};
    counter.put(state, counter.get_or_default(state) + 1);
    TRESTLE_TRACE_M("Dispatched message", {"lane", trestle::to_string(message.key.lane_id),
                                           "nonce", std::to_string(message.key.nonce),
                                           "success", success ? "true" : "false"});
    return success;
}

uint64_t CountingDispatch::dispatched_messages() const { return storage_->dispatched.get_or_default(store_); }

uint64_t CountingDispatch::failed_messages() const { return storage_->failed.get_or_default(store_); }

}  // namespace trestle::dev

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>

#include <trestle/core/state/kv_store.hpp>
#include <trestle/core/types/weight.hpp>
#include <trestle/ledger/messages/message_dispatch.hpp>

namespace trestle::dev {

//! First payload byte marking a message whose dispatch fails
inline constexpr uint8_t kFailingPayloadMarker{0xff};

struct DispatchConfig {
    std::string module_name{"Dispatch"};
    Weight base_weight{Weight::from_parts(5'000'000, 1'000)};
    Weight weight_per_byte{Weight::from_parts(2'000, 1)};
};

//! Dev chain interpreter of received messages: counts them, failing those marked with kFailingPayloadMarker
class CountingDispatch : public ledger::MessageDispatch {
  public:
    explicit CountingDispatch(state::KeyValueStore& store, DispatchConfig config = {});
    ~CountingDispatch() override;

    CountingDispatch(const CountingDispatch&) = delete;
    CountingDispatch& operator=(const CountingDispatch&) = delete;

    bool is_active() const override { return active_; }
    void set_active(bool active) { active_ = active; }

    Weight dispatch_weight(const Message& message) const override;

    bool dispatch(state::KeyValueStore& state, const Message& message) override;

    uint64_t dispatched_messages() const;
    uint64_t failed_messages() const;

  private:
    struct Storage;

    state::KeyValueStore& store_;
    DispatchConfig config_;
    std::unique_ptr<const Storage> storage_;
    bool active_{true};
};

}  // namespace trestle::dev

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "message_lane_loop.hpp"

#include <utility>

#include <trestle/infra/common/log.hpp>
#include <trestle/infra/concurrency/parallel_group_utils.hpp>
#include <trestle/relay/common/relay_loop.hpp>
#include <trestle/relay/common/retry.hpp>

namespace trestle::relay {

MessageLaneLoop::MessageLaneLoop(MessagesSource& source, MessagesTarget& target,
                                 const ledger::WeightCalibrator& calibrator, MessageLaneParams params,
                                 Metrics* metrics)
    : source_{source},
      target_{target},
      params_{std::move(params)},
      delivery_{source, target, calibrator, params_, metrics},
      confirmation_{source, target, calibrator, params_, metrics} {}

Task<void> MessageLaneLoop::run() {
    TRESTLE_INFO_M("Starting messages relay", {"lane", trestle::to_string(source_.lane()), "source", source_.name(),
                                               "target", target_.name(),
                                               "max_messages_in_batch",
                                               std::to_string(params_.delivery_limits.max_messages_in_single_batch)});
    co_await concurrency::generate_parallel_group_task(2, [this](size_t index) { return run_race(index); });
}

Task<void> MessageLaneLoop::run_race(size_t index) {
    const FixedIntervalRetry retry_policy{params_.timing.retry_interval};
    if (index == 0) {
        delivery_halted_ = co_await run_relay_loop("messages-delivery", retry_policy, params_.timing.tick,
                                                   [this]() -> Task<void> { co_await delivery_.run_iteration(); });
    } else {
        confirmation_halted_ =
            co_await run_relay_loop("messages-confirmation", retry_policy, params_.timing.tick,
                                    [this]() -> Task<void> { co_await confirmation_.run_iteration(); });
    }
}

}  // namespace trestle::relay

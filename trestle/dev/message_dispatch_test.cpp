// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "message_dispatch.hpp"

#include <catch2/catch.hpp>

#include <trestle/core/state/memory_kv_store.hpp>
#include <trestle/infra/test_util/log.hpp>

namespace trestle::dev {

TEST_CASE("CountingDispatch", "[dev][dispatch]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    state::MemoryKvStore store;
    CountingDispatch dispatch{store, DispatchConfig{.module_name = "TestDispatch",
                                                    .base_weight = Weight::from_parts(100, 10),
                                                    .weight_per_byte = Weight::from_parts(2, 1)}};
    const Message message{{{0, 0, 0, 1}, 1}, Bytes{0x01, 0x02, 0x03}};
    const Message failing{{{0, 0, 0, 1}, 2}, Bytes{kFailingPayloadMarker}};

    CHECK(dispatch.dispatch_weight(message) == Weight::from_parts(106, 13));
    CHECK(dispatch.dispatch_weight({{{0, 0, 0, 1}, 3}, {}}) == Weight::from_parts(100, 10));

    CHECK(dispatch.dispatch(store, message));
    CHECK(dispatch.dispatch(store, {{{0, 0, 0, 1}, 3}, {}}));
    CHECK_FALSE(dispatch.dispatch(store, failing));
    CHECK(dispatch.dispatched_messages() == 2);
    CHECK(dispatch.failed_messages() == 1);

    CHECK(dispatch.is_active());
    dispatch.set_active(false);
    CHECK_FALSE(dispatch.is_active());
}

}  // namespace trestle::dev

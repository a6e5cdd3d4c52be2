// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <trestle/core/common/bytes.hpp>
#include <trestle/core/types/lane.hpp>

namespace trestle::ledger {

//! Storage key of an outbound message payload in the messages module named module_name
Bytes message_storage_key(std::string_view module_name, const LaneId& lane, MessageNonce nonce);

Bytes outbound_lane_data_key(std::string_view module_name, const LaneId& lane);

Bytes inbound_lane_data_key(std::string_view module_name, const LaneId& lane);

}  // namespace trestle::ledger

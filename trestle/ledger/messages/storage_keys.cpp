// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "storage_keys.hpp"

#include <trestle/core/state/storage_keys.hpp>

namespace trestle::ledger {

Bytes message_storage_key(std::string_view module_name, const LaneId& lane, MessageNonce nonce) {
    Bytes encoded_key;
    codec::encode(encoded_key, MessageKey{lane, nonce});
    return state::storage_map_key(module_name, "OutboundMessages", encoded_key);
}

Bytes outbound_lane_data_key(std::string_view module_name, const LaneId& lane) {
    Bytes encoded_lane;
    codec::encode(encoded_lane, lane);
    return state::storage_map_key(module_name, "OutboundLanes", encoded_lane);
}

Bytes inbound_lane_data_key(std::string_view module_name, const LaneId& lane) {
    Bytes encoded_lane;
    codec::encode(encoded_lane, lane);
    return state::storage_map_key(module_name, "InboundLanes", encoded_lane);
}

}  // namespace trestle::ledger

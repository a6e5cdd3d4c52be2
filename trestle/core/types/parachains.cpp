// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "parachains.hpp"

#include <trestle/core/codec/encode.hpp>

namespace trestle::codec {

void encode(Bytes& to, const BestParaHeadHash& best) {
    encode(to, best.at_relay_block_number);
    encode(to, best.head_hash);
}

void encode(Bytes& to, const ParaInfo& info) {
    encode(to, info.best_head_hash);
    encode(to, info.next_imported_hash_position);
}

void encode(Bytes& to, const ParaStoredHeaderData& data) {
    encode(to, data.number);
    encode(to, data.state_root);
}

void encode(Bytes& to, const ParaHeadUpdate& update) {
    encode(to, update.para_id);
    encode(to, update.head_hash);
}

DecodingResult decode(ByteView& from, BestParaHeadHash& to, Leftover mode) noexcept {
    return decode(from, mode, to.at_relay_block_number, to.head_hash);
}

DecodingResult decode(ByteView& from, ParaInfo& to, Leftover mode) noexcept {
    return decode(from, mode, to.best_head_hash, to.next_imported_hash_position);
}

DecodingResult decode(ByteView& from, ParaStoredHeaderData& to, Leftover mode) noexcept {
    return decode(from, mode, to.number, to.state_root);
}

DecodingResult decode(ByteView& from, ParaHeadUpdate& to, Leftover mode) noexcept {
    return decode(from, mode, to.para_id, to.head_hash);
}

}  // namespace trestle::codec

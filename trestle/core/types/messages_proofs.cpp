// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "messages_proofs.hpp"

#include <trestle/core/codec/encode_vector.hpp>

namespace trestle::codec {

void encode(Bytes& to, const MessagesProof& proof) {
    encode(to, proof.bridged_header_hash);
    encode(to, proof.storage_proof);
    encode(to, proof.lane);
    encode(to, proof.nonces_start);
    encode(to, proof.nonces_end);
}

void encode(Bytes& to, const MessagesDeliveryProof& proof) {
    encode(to, proof.bridged_header_hash);
    encode(to, proof.storage_proof);
    encode(to, proof.lane);
}

DecodingResult decode(ByteView& from, MessagesProof& to, Leftover mode) noexcept {
    return decode(from, mode, to.bridged_header_hash, to.storage_proof, to.lane, to.nonces_start, to.nonces_end);
}

DecodingResult decode(ByteView& from, MessagesDeliveryProof& to, Leftover mode) noexcept {
    return decode(from, mode, to.bridged_header_hash, to.storage_proof, to.lane);
}

}  // namespace trestle::codec

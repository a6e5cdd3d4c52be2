// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <trestle/core/codec/decode.hpp>
#include <trestle/core/trie/storage_proof.hpp>
#include <trestle/core/types/hash.hpp>
#include <trestle/core/types/lane.hpp>

namespace trestle {

//! Proof of messages [nonces_start, nonces_end] stored in the outbound lane of the bridged chain
struct MessagesProof {
    //! Finalized bridged header whose state root the proof is checked against
    Hash bridged_header_hash;
    trie::StorageProof storage_proof;
    LaneId lane{};
    MessageNonce nonces_start{0};
    MessageNonce nonces_end{0};

    friend bool operator==(const MessagesProof&, const MessagesProof&) = default;
};

//! Proof of the inbound lane state at the bridged chain, confirming deliveries
struct MessagesDeliveryProof {
    Hash bridged_header_hash;
    trie::StorageProof storage_proof;
    LaneId lane{};

    friend bool operator==(const MessagesDeliveryProof&, const MessagesDeliveryProof&) = default;
};

namespace codec {
    void encode(Bytes& to, const MessagesProof& proof);
    void encode(Bytes& to, const MessagesDeliveryProof& proof);

    DecodingResult decode(ByteView& from, MessagesProof& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, MessagesDeliveryProof& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace codec

}  // namespace trestle

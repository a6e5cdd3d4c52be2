// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <trestle/core/codec/decode.hpp>
#include <trestle/core/common/base.hpp>
#include <trestle/core/trie/storage_proof.hpp>
#include <trestle/core/types/hash.hpp>
#include <trestle/core/types/header.hpp>

namespace trestle {

//! Encoded parachain header as stored by the relay chain
using ParaHead = Bytes;

//! Best known head of a parachain and the relay block it has been read at
struct BestParaHeadHash {
    BlockNum at_relay_block_number{0};
    Hash head_hash;

    friend bool operator==(const BestParaHeadHash&, const BestParaHeadHash&) = default;
};

struct ParaInfo {
    BestParaHeadHash best_head_hash;
    //! Next slot of the imported heads ring buffer
    uint32_t next_imported_hash_position{0};

    friend bool operator==(const ParaInfo&, const ParaInfo&) = default;
};

//! Parts of an imported parachain header needed to verify proofs of its state
struct ParaStoredHeaderData {
    BlockNum number{0};
    Hash state_root;

    friend bool operator==(const ParaStoredHeaderData&, const ParaStoredHeaderData&) = default;
};

struct ParaHeadUpdate {
    ParaId para_id{0};
    Hash head_hash;

    friend bool operator==(const ParaHeadUpdate&, const ParaHeadUpdate&) = default;
};

//! Proof of parachain heads stored by the relay chain at a given relay block
struct ParaHeadsProof {
    trie::StorageProof storage_proof;

    friend bool operator==(const ParaHeadsProof&, const ParaHeadsProof&) = default;
};

namespace codec {
    void encode(Bytes& to, const BestParaHeadHash& best);
    void encode(Bytes& to, const ParaInfo& info);
    void encode(Bytes& to, const ParaStoredHeaderData& data);
    void encode(Bytes& to, const ParaHeadUpdate& update);

    DecodingResult decode(ByteView& from, BestParaHeadHash& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, ParaInfo& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, ParaStoredHeaderData& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, ParaHeadUpdate& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace codec

}  // namespace trestle

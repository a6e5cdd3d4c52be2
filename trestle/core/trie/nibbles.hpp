// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <trestle/core/common/base.hpp>
#include <trestle/core/common/bytes.hpp>
#include <trestle/core/common/decoding_result.hpp>

namespace trestle::trie {

//! \brief Transforms a string of Nibbles into a string of Bytes, an odd trailing nibble is padded with zero
//! \def A Nibble's value is [0..16)
Bytes pack_nibbles(ByteView unpacked);

//! \brief Transforms a string of bytes into a string of Nibbles
//! \def A Nibble's value is [0..16)
Bytes unpack_nibbles(ByteView data);

//! \brief Encodes a partial path of nibbles: one byte odd-length flag followed by the packed nibbles
Bytes encode_path(ByteView nibbles);

//! \brief Inverse of encode_path, rejects unknown flags and non zero padding
tl::expected<Bytes, DecodingError> decode_path(ByteView encoded);

}  // namespace trestle::trie

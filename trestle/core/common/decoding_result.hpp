// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tl/expected.hpp>

namespace trestle {

// Error codes for the binary codec, trie nodes and proofs
enum class [[nodiscard]] DecodingError {
    kOverflow,
    kInputTooShort,
    kInputTooLong,
    kNonCanonicalSize,
    kUnexpectedLength,
    kInvalidVariant,       // unknown enum or variant discriminant
    kInvalidBool,          // boolean byte other than 0 or 1
    kInvalidOptionTag,     // option tag other than 0 or 1
    kInvalidNodeType,      // trie::Node decoding
    kInvalidNibbles,       // trie::Node partial key decoding
};

using DecodingResult = tl::expected<void, DecodingError>;

}  // namespace trestle

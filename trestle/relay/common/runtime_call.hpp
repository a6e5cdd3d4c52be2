// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>

#include <absl/strings/str_cat.h>

#include <trestle/core/codec/decode.hpp>
#include <trestle/infra/common/decoding_exception.hpp>
#include <trestle/relay/common/chain_client.hpp>

namespace trestle::relay {

//! Calls a runtime method at block and decodes its result. Throws DecodingException on malformed results.
template <class Result>
Task<Result> call_runtime(ChainClient& client, const Hash& at, std::string_view method, const Bytes& args = {}) {
    const Bytes encoded{co_await client.state_call(at, method, args)};
    ByteView view{encoded};
    Result result{};
    success_or_throw(codec::decode(view, result),
                     absl::StrCat("malformed result of ", method, " from ", client.chain_name()));
    co_return result;
}

}  // namespace trestle::relay

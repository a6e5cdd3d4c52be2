// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "rewards_account.hpp"

#include <absl/strings/str_cat.h>
#include <magic_enum.hpp>

#include <trestle/core/codec/encode.hpp>
#include <trestle/core/common/util.hpp>

namespace trestle::ledger {

std::string to_string(const RewardsAccountParams& params) {
    return absl::StrCat(trestle::to_string(params.lane), "/", to_hex(ByteView{params.bridged_chain_id.data(), 4}),
                        "/", magic_enum::enum_name(params.owner));
}

}  // namespace trestle::ledger

namespace trestle::codec {

void encode(Bytes& to, ledger::RewardsAccountOwner owner) { to.push_back(static_cast<uint8_t>(owner)); }

void encode(Bytes& to, const ledger::RewardsAccountParams& params) {
    encode(to, params.lane);
    encode(to, params.bridged_chain_id);
    encode(to, params.owner);
}

void encode(Bytes& to, const ledger::RelayerRewardKey& key) {
    encode(to, key.relayer);
    encode(to, key.params);
}

DecodingResult decode(ByteView& from, ledger::RewardsAccountOwner& to, Leftover mode) noexcept {
    uint8_t value{0};
    if (DecodingResult res{decode(from, value, Leftover::kAllow)}; !res) {
        return res;
    }
    const auto owner{magic_enum::enum_cast<ledger::RewardsAccountOwner>(value)};
    if (!owner) {
        return tl::unexpected{DecodingError::kInvalidVariant};
    }
    to = *owner;
    return check_leftover(from, mode);
}

DecodingResult decode(ByteView& from, ledger::RewardsAccountParams& to, Leftover mode) noexcept {
    return decode(from, mode, to.lane, to.bridged_chain_id, to.owner);
}

DecodingResult decode(ByteView& from, ledger::RelayerRewardKey& to, Leftover mode) noexcept {
    return decode(from, mode, to.relayer, to.params);
}

}  // namespace trestle::codec

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "calls.hpp"

#include <iterator>

#include <trestle/core/codec/encode_vector.hpp>

namespace trestle::ledger {

std::string_view call_name(const Call& call) {
    static constexpr std::string_view kNames[]{
        "initialize",
        "submit_finality_proof",
        "submit_parachain_heads",
        "receive_messages_proof",
        "receive_messages_delivery_proof",
        "set_operating_mode",
        "claim_rewards",
        "send_message",
    };
    static_assert(std::size(kNames) == std::variant_size_v<Call>);
    return kNames[call.index()];
}

}  // namespace trestle::ledger

namespace trestle::codec {

namespace {

    void encode_fields(Bytes& to, const ledger::InitializeCall& call) { encode(to, call.init_data); }

    void encode_fields(Bytes& to, const ledger::SubmitFinalityProofCall& call) {
        encode(to, call.header);
        encode(to, call.justification);
        encode(to, call.current_set_id);
    }

    void encode_fields(Bytes& to, const ledger::SubmitParachainHeadsCall& call) {
        encode(to, call.at_relay_block);
        encode(to, call.parachains);
        encode(to, call.proof.storage_proof);
    }

    void encode_fields(Bytes& to, const ledger::ReceiveMessagesProofCall& call) {
        encode(to, call.relayer_id_at_bridged_chain);
        encode(to, call.proof);
        encode(to, call.messages_count);
        encode(to, call.dispatch_weight);
    }

    void encode_fields(Bytes& to, const ledger::ReceiveMessagesDeliveryProofCall& call) {
        encode(to, call.proof);
        encode(to, call.relayers_state);
    }

    void encode_fields(Bytes& to, const ledger::SetMessagesOperatingModeCall& call) { encode(to, call.mode); }

    void encode_fields(Bytes& to, const ledger::ClaimRewardsCall& call) {
        encode(to, call.params);
        encode(to, call.beneficiary);
    }

    void encode_fields(Bytes& to, const ledger::SendMessageCall& call) {
        encode(to, call.lane);
        encode(to, ByteView{call.payload});
    }

    DecodingResult decode_fields(ByteView& from, ledger::InitializeCall& to) {
        return decode(from, to.init_data, Leftover::kAllow);
    }

    DecodingResult decode_fields(ByteView& from, ledger::SubmitFinalityProofCall& to) {
        return decode_items(from, to.header, to.justification, to.current_set_id);
    }

    DecodingResult decode_fields(ByteView& from, ledger::SubmitParachainHeadsCall& to) {
        return decode_items(from, to.at_relay_block, to.parachains, to.proof.storage_proof);
    }

    DecodingResult decode_fields(ByteView& from, ledger::ReceiveMessagesProofCall& to) {
        return decode_items(from, to.relayer_id_at_bridged_chain, to.proof, to.messages_count, to.dispatch_weight);
    }

    DecodingResult decode_fields(ByteView& from, ledger::ReceiveMessagesDeliveryProofCall& to) {
        return decode_items(from, to.proof, to.relayers_state);
    }

    DecodingResult decode_fields(ByteView& from, ledger::SetMessagesOperatingModeCall& to) {
        return decode(from, to.mode, Leftover::kAllow);
    }

    DecodingResult decode_fields(ByteView& from, ledger::ClaimRewardsCall& to) {
        return decode_items(from, to.params, to.beneficiary);
    }

    DecodingResult decode_fields(ByteView& from, ledger::SendMessageCall& to) {
        return decode_items(from, to.lane, to.payload);
    }

    template <size_t Index>
    DecodingResult decode_alternative(ByteView& from, size_t index, ledger::Call& to) {
        if constexpr (Index < std::variant_size_v<ledger::Call>) {
            if (index == Index) {
                return decode_fields(from, to.emplace<Index>());
            }
            return decode_alternative<Index + 1>(from, index, to);
        } else {
            return tl::unexpected{DecodingError::kInvalidVariant};
        }
    }

}  // namespace

void encode(Bytes& to, const ledger::Call& call) {
    to.push_back(static_cast<uint8_t>(call.index()));
    std::visit([&](const auto& alternative) { encode_fields(to, alternative); }, call);
}

void encode(Bytes& to, const ledger::Transaction& transaction) {
    encode(to, transaction.signer);
    encode(to, transaction.call);
}

DecodingResult decode(ByteView& from, ledger::Call& to, Leftover mode) noexcept {
    if (from.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    const size_t index{from[0]};
    from.remove_prefix(1);
    if (DecodingResult res{decode_alternative<0>(from, index, to)}; !res) {
        return res;
    }
    return check_leftover(from, mode);
}

DecodingResult decode(ByteView& from, ledger::Transaction& to, Leftover mode) noexcept {
    return decode(from, mode, to.signer, to.call);
}

}  // namespace trestle::codec

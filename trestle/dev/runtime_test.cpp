// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "runtime.hpp"

#include <stdexcept>

#include <catch2/catch.hpp>

#include <trestle/core/state/memory_kv_store.hpp>
#include <trestle/infra/common/decoding_exception.hpp>
#include <trestle/infra/test_util/log.hpp>
#include <trestle/ledger/runtime_api.hpp>

#include <trestle/core/codec/encode_vector.hpp>

namespace trestle::dev {

namespace api = ledger::runtime_api;

namespace {

    const AccountId kSigner{0x42};
    const LaneId kLane{0, 0, 0, 1};

    template <class T>
    T decode_result(const Bytes& encoded) {
        ByteView view{encoded};
        T value{};
        REQUIRE(codec::decode(view, value));
        return value;
    }

    RuntimeConfig messages_runtime() {
        RuntimeConfig config;
        config.chain_id = {'m', 'l', 'a', 'u'};
        config.bridged_chain_id = {'r', 'l', 't', 'o'};
        config.header_chain = ledger::HeaderChainConfig{};
        config.messages = ledger::MessagesConfig{};
        config.messages->active_lanes = {kLane};
        config.max_extrinsic_size = 1024;
        return config;
    }

    struct RuntimeFixture {
        explicit RuntimeFixture(RuntimeConfig config = messages_runtime()) : runtime{store, config, secp256k1} {}

        test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
        state::MemoryKvStore store;
        SecP256K1Context secp256k1{/*allow_verify=*/true, /*allow_sign=*/false};
        Runtime runtime;
    };

}  // namespace

TEST_CASE("Runtime hosts the configured modules", "[dev][runtime]") {
    RuntimeFixture plain{RuntimeConfig{}};
    CHECK_FALSE(plain.runtime.header_chain());
    CHECK_FALSE(plain.runtime.parachains());
    CHECK_FALSE(plain.runtime.messages());

    RuntimeFixture fixture;
    CHECK(fixture.runtime.header_chain());
    CHECK(fixture.runtime.messages());

    RuntimeConfig parachains_without_relay;
    parachains_without_relay.parachains = ledger::ParachainsConfig{};
    CHECK_THROWS(RuntimeFixture{parachains_without_relay});
}

TEST_CASE("Runtime validates transactions", "[dev][runtime]") {
    RuntimeFixture plain{RuntimeConfig{}};
    const ledger::Transaction send{kSigner, ledger::SendMessageCall{kLane, Bytes{0x01}}};
    CHECK(plain.runtime.validate(send) == TransactionValidity::kCallUnavailable);
    CHECK(plain.runtime.validate({kSigner, ledger::InitializeCall{}}) == TransactionValidity::kCallUnavailable);

    RuntimeFixture fixture;
    CHECK(fixture.runtime.validate(send) == TransactionValidity::kValid);
    CHECK(fixture.runtime.validate({kSigner, ledger::SendMessageCall{kLane, Bytes(2048, 0x01)}}) ==
          TransactionValidity::kExhaustsResources);

    // nothing delivered yet, so a confirmation of nonce 0 changes nothing
    const ledger::ReceiveMessagesDeliveryProofCall confirmation{MessagesDeliveryProof{{}, {}, kLane}, {}};
    CHECK(fixture.runtime.validate({kSigner, confirmation}) == TransactionValidity::kStale);
}

TEST_CASE("Runtime applies transactions", "[dev][runtime]") {
    RuntimeFixture fixture;

    const DispatchOutcome sent{fixture.runtime.apply({kSigner, ledger::SendMessageCall{kLane, Bytes{0x01, 0x02}}})};
    CHECK(sent.success);
    CHECK(fixture.runtime.messages()->outbound_lane_data(kLane).latest_generated_nonce == 1);

    const DispatchOutcome inactive{
        fixture.runtime.apply({kSigner, ledger::SendMessageCall{LaneId{0, 0, 0, 9}, Bytes{0x01}}})};
    CHECK_FALSE(inactive.success);
    CHECK(inactive.error == "kInactiveOutboundLane");

    // the header chain has no owner, only root may initialize it
    const DispatchOutcome initialized{fixture.runtime.apply({kSigner, ledger::InitializeCall{}})};
    CHECK_FALSE(initialized.success);
    CHECK(initialized.error == "kBadOrigin");
}

TEST_CASE("Runtime serves state calls", "[dev][runtime]") {
    RuntimeFixture fixture;
    REQUIRE(fixture.runtime.apply({kSigner, ledger::SendMessageCall{kLane, Bytes{0x01, 0x02, 0x03}}}).success);

    CHECK_FALSE(decode_result<std::optional<HeaderId>>(fixture.runtime.state_call(api::kBestFinalized, {})));
    CHECK_FALSE(decode_result<std::optional<HeaderId>>(fixture.runtime.state_call(api::kMessagesBestFinalized, {})));

    Bytes messages;
    codec::encode(messages, std::vector<Message>{{{kLane, 1}, Bytes(10, 0x01)}});
    const auto weights{
        decode_result<std::vector<Weight>>(fixture.runtime.state_call(api::kInboundMessageDetails, messages))};
    REQUIRE(weights.size() == 1);
    CHECK(weights[0] == fixture.runtime.dispatch().dispatch_weight({{kLane, 1}, Bytes(10, 0x01)}));

    Bytes reward_args;
    codec::encode(reward_args, kSigner);
    codec::encode(reward_args, ledger::RewardsAccountParams{kLane, {'r', 'l', 't', 'o'},
                                                            ledger::RewardsAccountOwner::kBridgedChain});
    CHECK_FALSE(decode_result<std::optional<Balance>>(fixture.runtime.state_call(api::kRelayerReward, reward_args)));

    Bytes para_id;
    codec::encode(para_id, ParaId{2000});
    CHECK_THROWS_AS(fixture.runtime.state_call(api::kBestParachainInfo, para_id), std::invalid_argument);
    CHECK_THROWS_AS(fixture.runtime.state_call("Unknown_method", {}), std::invalid_argument);
    CHECK_THROWS_AS(fixture.runtime.state_call("BridgeMessagesApi_outbound_message_details", {}),
                    std::invalid_argument);
    CHECK_THROWS_AS(fixture.runtime.state_call(api::kInboundMessageDetails, Bytes{0x04}), DecodingException);
}

}  // namespace trestle::dev

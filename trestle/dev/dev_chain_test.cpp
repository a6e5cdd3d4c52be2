// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "dev_chain.hpp"

#include <catch2/catch.hpp>

#include <trestle/core/state/storage.hpp>
#include <trestle/infra/common/decoding_exception.hpp>
#include <trestle/infra/test_util/log.hpp>
#include <trestle/infra/test_util/task_runner.hpp>

#include <trestle/core/codec/encode_vector.hpp>

namespace trestle::dev {

namespace {

    const AccountId kSigner{0x42};
    const LaneId kLane{0, 0, 0, 1};

    DevChainConfig messages_chain() {
        DevChainConfig config;
        config.name = "Messages";
        config.runtime.header_chain = ledger::HeaderChainConfig{};
        config.runtime.messages = ledger::MessagesConfig{};
        config.runtime.messages->active_lanes = {kLane};
        return config;
    }

    Bytes encode_transaction(const ledger::Transaction& transaction) {
        Bytes encoded;
        codec::encode(encoded, transaction);
        return encoded;
    }

    struct DevChainFixture : public test_util::TaskRunner {
        explicit DevChainFixture(DevChainConfig config = {}) : chain{executor(), std::move(config)} {}

        test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
        SecP256K1Context secp256k1{/*allow_verify=*/true, /*allow_sign=*/false};
        DevChain chain;
    };

}  // namespace

TEST_CASE("DevChain produces and finalizes blocks", "[dev][chain]") {
    DevChainFixture fixture;
    DevChain& chain{fixture.chain};

    const HeaderId genesis{chain.best_header_id()};
    CHECK(genesis.number == 0);
    CHECK(chain.best_finalized_header_id() == genesis);

    for (int i{0}; i < 10; ++i) {
        chain.produce_block();
    }
    CHECK(chain.best_header_id().number == 10);
    CHECK(chain.best_finalized_header_id() == genesis);
    CHECK(chain.header_by_number(10)->parent_hash == chain.header_by_number(9)->hash());
    CHECK(chain.header_by_hash(chain.best_header_id().hash)->number == 10);
    CHECK_FALSE(chain.header_by_number(11));
    CHECK_FALSE(chain.header_by_hash(Hash{}));

    chain.finalize(9);
    CHECK(chain.best_finalized_header_id().number == 9);
    // only every 8th block keeps its justification
    const auto justification{chain.justification(8)};
    REQUIRE(justification);
    CHECK(finality::verify_justification(chain.header_by_number(8)->id(), chain.authority_set_at(7), *justification,
                                         fixture.secp256k1));
    CHECK_FALSE(chain.justification(9));
    CHECK_FALSE(chain.justification(10));

    // finalizing an older block changes nothing
    chain.finalize(5);
    CHECK(chain.best_finalized_header_id().number == 9);
    CHECK_THROWS_AS(chain.finalize(11), std::logic_error);
}

TEST_CASE("DevChain enacts authority set changes", "[dev][chain]") {
    DevChainFixture fixture;
    DevChain& chain{fixture.chain};

    chain.produce_block();
    chain.schedule_authority_change(4, 11);
    const Header enacting{chain.produce_block()};
    REQUIRE(enacting.digest.scheduled_change);
    CHECK(enacting.digest.scheduled_change->next_authorities.size() == 4);
    const Header next{chain.produce_block()};
    chain.finalize(next.number);

    // the enacting block is mandatory: it keeps a justification of the old set
    const auto mandatory{chain.justification(enacting.number)};
    REQUIRE(mandatory);
    CHECK(finality::verify_justification(enacting.id(), chain.authority_set_at(enacting.number - 1), *mandatory,
                                         fixture.secp256k1));
    const AuthoritySet new_set{chain.authority_set_at(enacting.number)};
    CHECK(new_set.set_id == 1);
    CHECK(new_set.authorities.size() == 4);
    CHECK(chain.authority_set_at(next.number) == new_set);
}

TEST_CASE("DevChain serves state and proofs", "[dev][chain]") {
    DevChainConfig config;
    config.states_to_keep = 2;
    DevChainFixture fixture{config};
    DevChain& chain{fixture.chain};
    const state::StorageMap<ParaId, Bytes> heads{"Paras", "Heads"};

    Header para_head;
    para_head.number = 42;
    chain.set_parachain_head(2000, para_head);
    CHECK_FALSE(chain.storage_value(chain.best_header_id().hash, heads.key(2000)));

    const Header block{chain.produce_block()};
    const auto stored{chain.storage_value(block.hash(), heads.key(2000))};
    REQUIRE(stored);

    const trie::StorageProof proof{chain.prove_storage(block.hash(), {heads.key(2000)})};
    auto checker{trie::StorageProofChecker::create(block.state_root, proof)};
    REQUIRE(checker);
    CHECK(checker->read_value(heads.key(2000)) == stored);
    CHECK(checker->ensure_no_unused_nodes());

    CHECK_THROWS_AS(chain.storage_value(Hash{}, heads.key(2000)), UnknownBlockError);
    chain.produce_block();
    chain.produce_block();
    CHECK_THROWS_AS(chain.storage_value(block.hash(), heads.key(2000)), UnknownBlockError);
    CHECK(chain.storage_value(chain.best_header_id().hash, heads.key(2000)) == stored);
}

TEST_CASE("DevChain resolves transaction watches", "[dev][chain]") {
    DevChainFixture fixture{messages_chain()};
    DevChain& chain{fixture.chain};

    SECTION("finalized") {
        const auto watch{chain.submit(encode_transaction({kSigner, ledger::SendMessageCall{kLane, Bytes{0x01}}}))};
        CHECK(chain.pending_transactions() == 1);
        const Header block{chain.produce_block()};
        CHECK(chain.pending_transactions() == 0);
        CHECK_FALSE(watch->try_receive());

        chain.finalize(block.number);
        const auto outcome{watch->try_receive()};
        REQUIRE(outcome);
        CHECK(outcome->status == TransactionOutcome::Status::kFinalized);
        CHECK(outcome->block == block.id());
        CHECK(chain.runtime().messages()->outbound_lane_data(kLane).latest_generated_nonce == 1);
    }

    SECTION("failed when dispatched") {
        const auto watch{
            chain.submit(encode_transaction({kSigner, ledger::SendMessageCall{LaneId{0, 0, 0, 7}, Bytes{0x01}}}))};
        chain.produce_and_finalize_block();
        const auto outcome{watch->try_receive()};
        REQUIRE(outcome);
        CHECK(outcome->status == TransactionOutcome::Status::kLost);
        CHECK(outcome->error == "kInactiveOutboundLane");
    }

    SECTION("rejected by the pool") {
        const auto watch{chain.submit(encode_transaction({kSigner, ledger::SendMessageCall{kLane, Bytes(2_Mebi, 0)}}))};
        CHECK(chain.pending_transactions() == 0);
        const auto outcome{watch->try_receive()};
        REQUIRE(outcome);
        CHECK(outcome->status == TransactionOutcome::Status::kLost);
        CHECK(outcome->error == "kExhaustsResources");
    }

    SECTION("malformed") {
        CHECK_THROWS_AS(chain.submit(Bytes{0xff, 0xff}), DecodingException);
    }
}

TEST_CASE("DevChain publishes justifications", "[dev][chain]") {
    DevChainFixture fixture;
    DevChain& chain{fixture.chain};
    const JustificationSubscription subscription{chain.subscribe_justifications()};

    const Header header{chain.produce_and_finalize_block()};
    const auto encoded{subscription->channel.try_receive()};
    REQUIRE(encoded);
    ByteView view{*encoded};
    finality::Justification justification;
    REQUIRE(codec::decode(view, justification));
    CHECK(justification.commit.target == header.id());

    chain.drop_subscriptions();
    CHECK(subscription->dropped);
    chain.produce_and_finalize_block();
    CHECK_FALSE(subscription->channel.try_receive());
}

TEST_CASE("DevChain injects request failures", "[dev][chain]") {
    DevChainFixture fixture;
    CHECK_FALSE(fixture.chain.take_request_failure());
    fixture.chain.fail_next_requests(2);
    CHECK(fixture.chain.take_request_failure());
    CHECK(fixture.chain.take_request_failure());
    CHECK_FALSE(fixture.chain.take_request_failure());
}

}  // namespace trestle::dev

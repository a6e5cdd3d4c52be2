// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "parachains_ledger.hpp"

#include <catch2/catch.hpp>

#include <trestle/core/state/memory_kv_store.hpp>
#include <trestle/dev/authority_keys.hpp>
#include <trestle/infra/test_util/log.hpp>
#include <trestle/ledger/header_chain/header_chain_ledger.hpp>

#include <trestle/core/codec/encode_vector.hpp>
#include <trestle/core/state/storage.hpp>

namespace trestle::ledger {

namespace {

    const AccountId kRelayer{0x01};
    constexpr ParaId kParaId{2000};
    constexpr ParaId kOtherParaId{2001};

    ParaHead make_para_head(BlockNum number) {
        Header header;
        header.number = number;
        header.state_root = Hash::of(Bytes(2, static_cast<uint8_t>(number)));
        Bytes encoded;
        codec::encode(encoded, header);
        return encoded;
    }

    struct ParachainsFixture {
        test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
        dev::AuthorityKeys keys{3};
        state::MemoryKvStore store;
        HeaderChainLedger relay_chain{store, HeaderChainConfig{.module_name = "TestRelayFinality"}, keys.secp256k1()};
        ParachainsLedger ledger;

        // State of the bridged relay chain
        state::MemoryKvStore relay_state;
        state::StorageMap<ParaId, Bytes> relay_heads{"Paras", "Heads"};
        std::vector<Header> relay_headers;

        explicit ParachainsFixture(uint32_t heads_to_keep = 64)
            : ledger{store, ParachainsConfig{.module_name = "TestParachains", .heads_to_keep = heads_to_keep},
                     relay_chain} {}

        //! Produces a relay header committing to the current relay state
        Header produce_relay_header() {
            Header header;
            header.number = relay_headers.empty() ? 0 : relay_headers.back().number + 1;
            header.parent_hash = relay_headers.empty() ? Hash{} : relay_headers.back().hash();
            header.state_root = relay_state.build_trie().root();
            relay_headers.push_back(header);
            return header;
        }

        void import_relay_header(const Header& header) {
            if (header.number == 0) {
                REQUIRE(relay_chain.initialize(Origin::root(), {header, keys.authority_set(0)}) ==
                        HeaderChainResult::kOk);
            } else {
                REQUIRE(relay_chain.submit_finality_proof(Origin::signed_by(kRelayer), header,
                                                          keys.justify(header.id(), 1, 0), 0) ==
                        HeaderChainResult::kOk);
            }
        }

        ParaHeadsProof prove(const std::vector<ParaId>& para_ids) const {
            std::vector<Bytes> keys_to_prove;
            for (const ParaId para_id : para_ids) {
                keys_to_prove.push_back(parachain_head_storage_key("Paras", para_id));
            }
            return {relay_state.build_trie().prove(keys_to_prove)};
        }

        ParachainsResult submit(const Header& relay_header, const std::vector<ParaHeadUpdate>& updates,
                                const ParaHeadsProof& proof) {
            return ledger.submit_parachain_heads(Origin::signed_by(kRelayer), relay_header.id(), updates, proof);
        }
    };

}  // namespace

TEST_CASE("ParachainsLedger rejects calls", "[ledger][parachains]") {
    ParachainsFixture fixture;
    const ParaHead head{make_para_head(1)};
    fixture.relay_heads.put(fixture.relay_state, kParaId, head);
    const Header relay0{fixture.produce_relay_header()};
    const auto proof{fixture.prove({kParaId})};
    const std::vector<ParaHeadUpdate> updates{{kParaId, Hash::of(head)}};

    SECTION("relay chain light client not initialized") {
        CHECK(fixture.submit(relay0, updates, proof) == ParachainsResult::kNotInitialized);
    }

    fixture.import_relay_header(relay0);

    SECTION("unknown relay block") {
        CHECK(fixture.ledger.submit_parachain_heads(Origin::signed_by(kRelayer), {0, Hash::of(head)}, updates,
                                                    proof) == ParachainsResult::kUnknownRelayChainBlock);
    }

    SECTION("relay block number mismatch") {
        CHECK(fixture.ledger.submit_parachain_heads(Origin::signed_by(kRelayer), {5, relay0.hash()}, updates,
                                                    proof) == ParachainsResult::kInvalidRelayChainBlockNumber);
    }

    SECTION("halted") {
        REQUIRE(fixture.ledger.set_operating_mode(Origin::root(), BasicOperatingMode::kHalted) ==
                ParachainsResult::kOk);
        CHECK(fixture.submit(relay0, updates, proof) == ParachainsResult::kHalted);
        CHECK_FALSE(fixture.ledger.best_parachain_info(kParaId));
    }

    SECTION("duplicate proof nodes") {
        auto duplicated{proof};
        duplicated.storage_proof.push_back(duplicated.storage_proof.front());
        CHECK(fixture.submit(relay0, updates, duplicated) == ParachainsResult::kInvalidStorageProof);
    }

    SECTION("unused proof nodes") {
        fixture.relay_heads.put(fixture.relay_state, kOtherParaId, make_para_head(7));
        const Header relay1{fixture.produce_relay_header()};
        fixture.import_relay_header(relay1);

        // the proof covers two parachains while a single one is submitted
        const auto oversized{fixture.prove({kParaId, kOtherParaId})};
        CHECK(fixture.submit(relay1, updates, oversized) == ParachainsResult::kInvalidStorageProof);
        CHECK_FALSE(fixture.ledger.best_parachain_info(kParaId));
    }
}

TEST_CASE("ParachainsLedger imports heads", "[ledger][parachains]") {
    ParachainsFixture fixture;
    const ParaHead head1{make_para_head(1)};
    fixture.relay_heads.put(fixture.relay_state, kParaId, head1);
    const Header relay0{fixture.produce_relay_header()};
    fixture.import_relay_header(relay0);
    const auto proof{fixture.prove({kParaId})};

    SECTION("valid head") {
        CHECK(fixture.submit(relay0, {{kParaId, Hash::of(head1)}}, proof) == ParachainsResult::kOk);
        const auto info{fixture.ledger.best_parachain_info(kParaId)};
        REQUIRE(info);
        CHECK(info->best_head_hash == BestParaHeadHash{0, Hash::of(head1)});
        CHECK(info->next_imported_hash_position == 1);
        CHECK(fixture.ledger.best_parachain_head_id(kParaId) == HeaderId{1, Hash::of(head1)});

        const auto para_chain{fixture.ledger.header_chain(kParaId)};
        CHECK(para_chain.best_finalized() == HeaderId{1, Hash::of(head1)});
        CHECK(para_chain.finalized_state_root(Hash::of(head1)) == Hash::of(Bytes(2, 1)));
    }

    SECTION("re-submission is a no-op") {
        REQUIRE(fixture.submit(relay0, {{kParaId, Hash::of(head1)}}, proof) == ParachainsResult::kOk);
        const size_t entries{fixture.store.size()};
        const auto info{fixture.ledger.best_parachain_info(kParaId)};
        CHECK(fixture.ledger.is_obsolete(kParaId, 0, Hash::of(head1)));
        CHECK(fixture.submit(relay0, {{kParaId, Hash::of(head1)}}, proof) == ParachainsResult::kOk);
        CHECK(fixture.store.size() == entries);
        CHECK(fixture.ledger.best_parachain_info(kParaId) == info);
    }

    SECTION("mismatching head hash is skipped") {
        CHECK(fixture.submit(relay0, {{kParaId, Hash::of(make_para_head(2))}}, proof) == ParachainsResult::kOk);
        CHECK_FALSE(fixture.ledger.best_parachain_info(kParaId));
    }

    SECTION("head missing at the relay chain is skipped") {
        const auto absence_proof{fixture.prove({kOtherParaId})};
        CHECK(fixture.submit(relay0, {{kOtherParaId, Hash::of(head1)}}, absence_proof) == ParachainsResult::kOk);
        CHECK_FALSE(fixture.ledger.best_parachain_info(kOtherParaId));
    }
}

TEST_CASE("ParachainsLedger head updates", "[ledger][parachains]") {
    ParachainsFixture fixture{/*heads_to_keep=*/2};
    std::vector<ParaHead> heads;
    std::vector<Header> relay_blocks;
    for (BlockNum number{1}; number <= 3; ++number) {
        heads.push_back(make_para_head(number));
        fixture.relay_heads.put(fixture.relay_state, kParaId, heads.back());
        relay_blocks.push_back(fixture.produce_relay_header());
        fixture.import_relay_header(relay_blocks.back());
    }
    const auto& relay2{relay_blocks[2]};
    const auto proof2{fixture.prove({kParaId})};

    SECTION("older relay block after newer one is skipped") {
        REQUIRE(fixture.submit(relay2, {{kParaId, Hash::of(heads[2])}}, proof2) == ParachainsResult::kOk);
        CHECK(fixture.ledger.is_obsolete(kParaId, 1, Hash::of(heads[1])));
        CHECK(fixture.ledger.best_parachain_head_id(kParaId) == HeaderId{3, Hash::of(heads[2])});
    }

    SECTION("ring buffer prunes old heads") {
        // relay state only keeps the latest head, rebuild earlier states to prove older heads
        state::MemoryKvStore relay_state_at1;
        fixture.relay_heads.put(relay_state_at1, kParaId, heads[0]);
        const auto proof0{relay_state_at1.build_trie().prove({parachain_head_storage_key("Paras", kParaId)})};
        state::MemoryKvStore relay_state_at2;
        fixture.relay_heads.put(relay_state_at2, kParaId, heads[1]);
        const auto proof1{relay_state_at2.build_trie().prove({parachain_head_storage_key("Paras", kParaId)})};

        REQUIRE(fixture.submit(relay_blocks[0], {{kParaId, Hash::of(heads[0])}}, {proof0}) == ParachainsResult::kOk);
        REQUIRE(fixture.submit(relay_blocks[1], {{kParaId, Hash::of(heads[1])}}, {proof1}) == ParachainsResult::kOk);
        REQUIRE(fixture.submit(relay2, {{kParaId, Hash::of(heads[2])}}, proof2) == ParachainsResult::kOk);

        CHECK_FALSE(fixture.ledger.parachain_head(kParaId, Hash::of(heads[0])));
        CHECK(fixture.ledger.parachain_head(kParaId, Hash::of(heads[1])));
        CHECK(fixture.ledger.parachain_head(kParaId, Hash::of(heads[2])));
        CHECK(fixture.ledger.best_parachain_info(kParaId)->next_imported_hash_position == 1);
    }
}

TEST_CASE("ParachainsLedger tracked parachains", "[ledger][parachains]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    dev::AuthorityKeys keys{1};
    state::MemoryKvStore store;
    HeaderChainLedger relay_chain{store, HeaderChainConfig{}, keys.secp256k1()};
    ParachainsLedger ledger{store, ParachainsConfig{.tracked_parachains = {kOtherParaId}}, relay_chain};

    state::MemoryKvStore relay_state;
    const ParaHead head{make_para_head(1)};
    state::StorageMap<ParaId, Bytes>{"Paras", "Heads"}.put(relay_state, kParaId, head);
    Header relay0;
    relay0.state_root = relay_state.build_trie().root();
    REQUIRE(relay_chain.initialize(Origin::root(), {relay0, keys.authority_set(0)}) == HeaderChainResult::kOk);

    const ParaHeadsProof proof{relay_state.build_trie().prove({parachain_head_storage_key("Paras", kParaId)})};
    CHECK(ledger.submit_parachain_heads(Origin::signed_by(kRelayer), relay0.id(), {{kParaId, Hash::of(head)}},
                                        proof) == ParachainsResult::kOk);
    CHECK_FALSE(ledger.best_parachain_info(kParaId));
}

}  // namespace trestle::ledger

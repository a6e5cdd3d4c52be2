// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "justification.hpp"

#include <catch2/catch.hpp>

#include <trestle/core/codec/encode_vector.hpp>

namespace trestle::finality {

namespace {

    Bytes private_key(uint8_t seed) {
        Bytes key(32, 0);
        key[31] = seed;
        return key;
    }

    struct Authorities {
        SecP256K1Context secp256k1{/*allow_verify=*/true, /*allow_sign=*/true};
        std::vector<Bytes> keys;
        AuthoritySet set;

        explicit Authorities(size_t count, uint64_t set_id = 0) {
            set.set_id = set_id;
            for (size_t i{0}; i < count; ++i) {
                keys.push_back(private_key(static_cast<uint8_t>(i + 1)));
                AuthorityId id{};
                const Bytes public_key{*secp256k1.public_key_of(keys.back())};
                std::copy(public_key.begin(), public_key.end(), id.begin());
                set.authorities.push_back(id);
            }
        }

        SignedPrecommit sign(size_t index, const HeaderId& target, uint64_t round) {
            SignedPrecommit precommit;
            precommit.target = target;
            precommit.authority = set.authorities[index];
            const Hash digest{precommit_signing_digest(target, round, set.set_id)};
            const Bytes signature{*secp256k1.sign_digest(digest, keys[index])};
            std::copy(signature.begin(), signature.end(), precommit.signature.begin());
            return precommit;
        }

        Justification justify(const HeaderId& target, size_t signers, uint64_t round = 1) {
            Justification justification{round, Commit{target, {}}};
            for (size_t i{0}; i < signers; ++i) {
                justification.commit.precommits.push_back(sign(i, target, round));
            }
            return justification;
        }
    };

    HeaderId target_id() {
        Header header;
        header.number = 10;
        return header.id();
    }

}  // namespace

TEST_CASE("Votes threshold", "[finality]") {
    CHECK(votes_threshold(1) == 1);
    CHECK(votes_threshold(3) == 3);
    CHECK(votes_threshold(4) == 3);
    CHECK(votes_threshold(7) == 5);
    CHECK(votes_threshold(10) == 7);
}

TEST_CASE("Justification verification", "[finality]") {
    Authorities authorities{4, 7};
    const HeaderId target{target_id()};

    SECTION("super-majority") {
        CHECK(verify_justification(target, authorities.set, authorities.justify(target, 3), authorities.secp256k1));
        CHECK(verify_justification(target, authorities.set, authorities.justify(target, 4), authorities.secp256k1));
    }

    SECTION("not enough votes") {
        const auto res{verify_justification(target, authorities.set, authorities.justify(target, 2), authorities.secp256k1)};
        CHECK(res.error() == JustificationError::kTooLowCumulativeWeight);
    }

    SECTION("wrong target") {
        HeaderId other{target};
        other.number = 11;
        const auto res{verify_justification(other, authorities.set, authorities.justify(target, 4), authorities.secp256k1)};
        CHECK(res.error() == JustificationError::kInvalidTarget);
    }

    SECTION("duplicate vote") {
        auto justification{authorities.justify(target, 2)};
        justification.commit.precommits.push_back(justification.commit.precommits.front());
        const auto res{verify_justification(target, authorities.set, justification, authorities.secp256k1)};
        CHECK(res.error() == JustificationError::kDuplicateAuthorityVote);
    }

    SECTION("unknown authority") {
        Authorities strangers{5};
        auto justification{authorities.justify(target, 3)};
        justification.commit.precommits.push_back(strangers.sign(4, target, 1));
        const auto res{verify_justification(target, authorities.set, justification, authorities.secp256k1)};
        CHECK(res.error() == JustificationError::kUnknownAuthority);
    }

    SECTION("signature for another set") {
        AuthoritySet next_set{authorities.set};
        next_set.set_id = 8;
        const auto res{verify_justification(target, next_set, authorities.justify(target, 4), authorities.secp256k1)};
        CHECK(res.error() == JustificationError::kInvalidSignature);
    }

    SECTION("precommit for another header") {
        auto justification{authorities.justify(target, 3)};
        HeaderId other{target};
        other.number = 9;
        justification.commit.precommits.back() = authorities.sign(3, other, 1);
        const auto res{verify_justification(target, authorities.set, justification, authorities.secp256k1)};
        CHECK(res.error() == JustificationError::kPrecommitIsNotCommitDescendant);
    }
}

TEST_CASE("Justification encoding", "[finality]") {
    Authorities authorities{2};
    const Justification justification{authorities.justify(target_id(), 2, 3)};
    Bytes encoded;
    codec::encode(encoded, justification);
    ByteView view{encoded};
    Justification decoded;
    REQUIRE(codec::decode(view, decoded));
    CHECK(decoded == justification);
}

}  // namespace trestle::finality

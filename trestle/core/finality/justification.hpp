// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <tl/expected.hpp>

#include <trestle/core/codec/decode.hpp>
#include <trestle/core/types/header.hpp>
#include <trestle/infra/common/secp256k1_context.hpp>

namespace trestle::finality {

struct SignedPrecommit {
    HeaderId target;
    AuthoritySignature signature{};
    AuthorityId authority{};

    friend bool operator==(const SignedPrecommit&, const SignedPrecommit&) = default;
};

//! Commit of a finality round: every precommit must vote for the commit target
struct Commit {
    HeaderId target;
    std::vector<SignedPrecommit> precommits;

    friend bool operator==(const Commit&, const Commit&) = default;
};

//! Finality proof of a header, signed by a super-majority of the authority set
struct Justification {
    uint64_t round{0};
    Commit commit;

    friend bool operator==(const Justification&, const Justification&) = default;
};

enum class [[nodiscard]] JustificationError {
    kInvalidTarget,
    kPrecommitIsNotCommitDescendant,
    kUnknownAuthority,
    kDuplicateAuthorityVote,
    kInvalidSignature,
    kTooLowCumulativeWeight,
};

//! Minimum number of distinct authority votes finalizing a header: more than 2/3 of the set
size_t votes_threshold(size_t authorities_count) noexcept;

//! Digest signed by authorities when precommitting a target in a given round and set
Hash precommit_signing_digest(const HeaderId& target, uint64_t round, uint64_t set_id);

//! Checks the justification finalizes exactly the given header under the given authority set
tl::expected<void, JustificationError> verify_justification(
    const HeaderId& finalized_target,
    const AuthoritySet& authority_set,
    const Justification& justification,
    const SecP256K1Context& secp256k1);

}  // namespace trestle::finality

namespace trestle::codec {

void encode(Bytes& to, const finality::SignedPrecommit& precommit);
void encode(Bytes& to, const finality::Justification& justification);

DecodingResult decode(ByteView& from, finality::SignedPrecommit& to, Leftover mode = Leftover::kProhibit) noexcept;
DecodingResult decode(ByteView& from, finality::Justification& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace trestle::codec

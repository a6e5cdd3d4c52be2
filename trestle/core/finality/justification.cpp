// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "justification.hpp"

#include <algorithm>
#include <set>

#include <trestle/core/codec/encode_vector.hpp>

namespace trestle::finality {

size_t votes_threshold(size_t authorities_count) noexcept {
    if (authorities_count == 0) {
        return 1;
    }
    return authorities_count - (authorities_count - 1) / 3;
}

Hash precommit_signing_digest(const HeaderId& target, uint64_t round, uint64_t set_id) {
    Bytes payload;
    codec::encode(payload, target);
    codec::encode(payload, round);
    codec::encode(payload, set_id);
    return Hash::of(payload);
}

tl::expected<void, JustificationError> verify_justification(
    const HeaderId& finalized_target,
    const AuthoritySet& authority_set,
    const Justification& justification,
    const SecP256K1Context& secp256k1) {
    if (justification.commit.target != finalized_target) {
        return tl::unexpected{JustificationError::kInvalidTarget};
    }

    const Hash digest{precommit_signing_digest(finalized_target, justification.round, authority_set.set_id)};
    std::set<AuthorityId> voters;
    for (const auto& precommit : justification.commit.precommits) {
        if (precommit.target != justification.commit.target) {
            return tl::unexpected{JustificationError::kPrecommitIsNotCommitDescendant};
        }
        if (std::ranges::find(authority_set.authorities, precommit.authority) == authority_set.authorities.end()) {
            return tl::unexpected{JustificationError::kUnknownAuthority};
        }
        if (!voters.insert(precommit.authority).second) {
            return tl::unexpected{JustificationError::kDuplicateAuthorityVote};
        }
        if (!secp256k1.verify_digest(digest, precommit.signature, precommit.authority)) {
            return tl::unexpected{JustificationError::kInvalidSignature};
        }
    }

    if (voters.size() < votes_threshold(authority_set.authorities.size())) {
        return tl::unexpected{JustificationError::kTooLowCumulativeWeight};
    }
    return {};
}

}  // namespace trestle::finality

namespace trestle::codec {

void encode(Bytes& to, const finality::SignedPrecommit& precommit) {
    encode(to, precommit.target);
    encode(to, precommit.signature);
    encode(to, precommit.authority);
}

void encode(Bytes& to, const finality::Justification& justification) {
    encode(to, justification.round);
    encode(to, justification.commit.target);
    encode(to, justification.commit.precommits);
}

DecodingResult decode(ByteView& from, finality::SignedPrecommit& to, Leftover mode) noexcept {
    return decode(from, mode, to.target, to.signature, to.authority);
}

DecodingResult decode(ByteView& from, finality::Justification& to, Leftover mode) noexcept {
    return decode(from, mode, to.round, to.commit.target, to.commit.precommits);
}

}  // namespace trestle::codec

// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "authority_keys.hpp"

#include <algorithm>

#include <trestle/infra/common/ensure.hpp>

namespace trestle::dev {

AuthorityKeys::AuthorityKeys(size_t count, uint8_t first_seed) {
    ensure(first_seed > 0 && count <= 256u - first_seed, "invalid authority key seeds");
    for (size_t i{0}; i < count; ++i) {
        Bytes private_key(32, 0);
        private_key[31] = static_cast<uint8_t>(first_seed + i);
        const auto public_key{secp256k1_.public_key_of(private_key)};
        ensure(public_key && public_key->size() == SecP256K1Context::kPublicKeySizeCompressed,
               "cannot derive authority public key");
        AuthorityId id{};
        std::copy(public_key->begin(), public_key->end(), id.begin());
        private_keys_.push_back(std::move(private_key));
        authorities_.push_back(id);
    }
}

finality::SignedPrecommit AuthorityKeys::sign(size_t index, const HeaderId& target, uint64_t round,
                                              uint64_t set_id) const {
    ensure(index < private_keys_.size(), "authority index out of range");
    const Hash digest{finality::precommit_signing_digest(target, round, set_id)};
    const auto signature{secp256k1_.sign_digest(digest, private_keys_[index])};
    ensure(signature && signature->size() == SecP256K1Context::kSignatureSize, "cannot sign precommit");

    finality::SignedPrecommit precommit;
    precommit.target = target;
    precommit.authority = authorities_[index];
    std::copy(signature->begin(), signature->end(), precommit.signature.begin());
    return precommit;
}

finality::Justification AuthorityKeys::justify(const HeaderId& target, uint64_t round, uint64_t set_id,
                                               std::optional<size_t> signers) const {
    finality::Justification justification{round, finality::Commit{target, {}}};
    const size_t count{std::min(signers.value_or(size()), size())};
    for (size_t i{0}; i < count; ++i) {
        justification.commit.precommits.push_back(sign(i, target, round, set_id));
    }
    return justification;
}

}  // namespace trestle::dev

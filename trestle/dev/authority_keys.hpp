// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <trestle/core/finality/justification.hpp>
#include <trestle/core/types/header.hpp>
#include <trestle/infra/common/secp256k1_context.hpp>

namespace trestle::dev {

//! Deterministic private keys of a development authority set, able to sign finality justifications
class AuthorityKeys {
  public:
    //! \param first_seed seed of the first key, following keys use consecutive seeds
    explicit AuthorityKeys(size_t count, uint8_t first_seed = 1);

    AuthorityKeys(const AuthorityKeys&) = delete;
    AuthorityKeys& operator=(const AuthorityKeys&) = delete;

    size_t size() const noexcept { return private_keys_.size(); }

    const std::vector<AuthorityId>& authorities() const noexcept { return authorities_; }

    AuthoritySet authority_set(uint64_t set_id) const { return {authorities_, set_id}; }

    finality::SignedPrecommit sign(size_t index, const HeaderId& target, uint64_t round, uint64_t set_id) const;

    //! Justification signed by the first `signers` authorities, all of them by default
    finality::Justification justify(const HeaderId& target, uint64_t round, uint64_t set_id,
                                    std::optional<size_t> signers = std::nullopt) const;

    const SecP256K1Context& secp256k1() const noexcept { return secp256k1_; }

  private:
    SecP256K1Context secp256k1_{/*allow_verify=*/true, /*allow_sign=*/true};
    std::vector<Bytes> private_keys_;
    std::vector<AuthorityId> authorities_;
};

}  // namespace trestle::dev

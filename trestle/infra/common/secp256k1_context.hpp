// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <secp256k1.h>

#include <optional>

#include <gsl/pointers>

#include <trestle/core/common/base.hpp>
#include <trestle/core/common/bytes.hpp>

namespace trestle {

//! RAII wrapper of a libsecp256k1 context exposing the ECDSA operations used by authority sets
class SecP256K1Context final {
  public:
    explicit SecP256K1Context(bool allow_verify = true, bool allow_sign = false)
        : context_(secp256k1_context_create(SecP256K1Context::flags(allow_verify, allow_sign))) {}

    ~SecP256K1Context() {
        secp256k1_context_destroy(context_);
    }

    SecP256K1Context(const SecP256K1Context&) = delete;
    SecP256K1Context& operator=(const SecP256K1Context&) = delete;

    bool verify_private_key_data(ByteView data) const {
        return data.size() == 32 && secp256k1_ec_seckey_verify(context_, data.data());
    }

    //! Compressed (33 bytes) public key of the given private key
    std::optional<Bytes> public_key_of(ByteView private_key) const;

    //! Compact 64 bytes ECDSA signature of a 32 bytes digest
    std::optional<Bytes> sign_digest(ByteView digest, ByteView private_key) const;

    //! Checks a compact 64 bytes signature of a 32 bytes digest against a serialized public key
    bool verify_digest(ByteView digest, ByteView signature, ByteView public_key) const;

    static constexpr size_t kPublicKeySizeCompressed{33};
    static constexpr size_t kSignatureSize{64};

  private:
    static unsigned int flags(bool allow_verify, bool allow_sign);

    gsl::owner<secp256k1_context*> context_;
};

}  // namespace trestle

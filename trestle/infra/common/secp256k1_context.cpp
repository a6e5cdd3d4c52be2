// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

#include "secp256k1_context.hpp"

namespace trestle {

std::optional<Bytes> SecP256K1Context::public_key_of(ByteView private_key) const {
    if (!verify_private_key_data(private_key)) {
        return std::nullopt;
    }
    secp256k1_pubkey public_key;
    if (!secp256k1_ec_pubkey_create(context_, &public_key, private_key.data())) {
        return std::nullopt;
    }
    size_t data_size{kPublicKeySizeCompressed};
    Bytes data(data_size, 0);
    secp256k1_ec_pubkey_serialize(context_, data.data(), &data_size, &public_key, SECP256K1_EC_COMPRESSED);
    data.resize(data_size);
    return data;
}

std::optional<Bytes> SecP256K1Context::sign_digest(ByteView digest, ByteView private_key) const {
    if (digest.size() != 32 || !verify_private_key_data(private_key)) {
        return std::nullopt;
    }
    secp256k1_ecdsa_signature signature;
    if (!secp256k1_ecdsa_sign(context_, &signature, digest.data(), private_key.data(), nullptr, nullptr)) {
        return std::nullopt;
    }
    Bytes data(kSignatureSize, 0);
    secp256k1_ecdsa_signature_serialize_compact(context_, data.data(), &signature);
    return data;
}

bool SecP256K1Context::verify_digest(ByteView digest, ByteView signature, ByteView public_key) const {
    if (digest.size() != 32 || signature.size() != kSignatureSize) {
        return false;
    }
    secp256k1_pubkey parsed_key;
    if (!secp256k1_ec_pubkey_parse(context_, &parsed_key, public_key.data(), public_key.size())) {
        return false;
    }
    secp256k1_ecdsa_signature parsed_signature;
    if (!secp256k1_ecdsa_signature_parse_compact(context_, &parsed_signature, signature.data())) {
        return false;
    }
    // High-S (malleated) signatures are rejected
    secp256k1_ecdsa_signature normalized;
    if (secp256k1_ecdsa_signature_normalize(context_, &normalized, &parsed_signature)) {
        return false;
    }
    return secp256k1_ecdsa_verify(context_, &parsed_signature, digest.data(), &parsed_key) == 1;
}

unsigned int SecP256K1Context::flags(bool allow_verify, bool allow_sign) {
    unsigned int value = SECP256K1_CONTEXT_NONE;
    if (allow_verify) {
        value |= SECP256K1_CONTEXT_VERIFY;
    }
    if (allow_sign) {
        value |= SECP256K1_CONTEXT_SIGN;
    }
    return value;
}

}  // namespace trestle

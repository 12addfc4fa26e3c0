// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "secp256k1_context.hpp"

#include <cstring>

#include <quarry/core/common/util.hpp>

namespace quarry {

const size_t SecP256K1Context::kPublicKeySizeCompressed = 33;
const size_t SecP256K1Context::kPublicKeySizeUncompressed = 65;

bool is_valid_signature(const intx::uint256& r, const intx::uint256& s) noexcept {
    if (!r || !s) {
        return false;
    }
    if (r >= kSecp256k1n || s >= kSecp256k1n) {
        return false;
    }
    // https://eips.ethereum.org/EIPS/eip-2
    return s <= kSecp256k1Halfn;
}

Bytes SecP256K1Context::serialize_public_key(const secp256k1_pubkey* public_key, bool is_compressed) const {
    size_t data_size = is_compressed ? kPublicKeySizeCompressed : kPublicKeySizeUncompressed;
    Bytes data(data_size, 0);
    unsigned int flags = is_compressed ? SECP256K1_EC_COMPRESSED : SECP256K1_EC_UNCOMPRESSED;
    secp256k1_ec_pubkey_serialize(context_, data.data(), &data_size, public_key, flags);
    data.resize(data_size);
    return data;
}

std::pair<Bytes, uint8_t> SecP256K1Context::serialize_recoverable_signature(
    const secp256k1_ecdsa_recoverable_signature* signature) const {
    Bytes data(64, 0);
    int recovery_id{0};
    secp256k1_ecdsa_recoverable_signature_serialize_compact(context_, data.data(), &recovery_id, signature);
    return {data, static_cast<uint8_t>(recovery_id)};
}

std::optional<evmc::address> SecP256K1Context::recover_address(ByteView data_hash, ByteView signature,
                                                               uint8_t recovery_id) const {
    if (data_hash.size() != 32 || signature.size() != 64 || recovery_id > 3) {
        return std::nullopt;
    }
    secp256k1_ecdsa_recoverable_signature sig;
    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(context_, &sig, signature.data(),
                                                             static_cast<int>(recovery_id))) {
        return std::nullopt;
    }
    secp256k1_pubkey public_key;
    if (!secp256k1_ecdsa_recover(context_, &public_key, &sig, data_hash.data())) {
        return std::nullopt;
    }
    return public_key_to_address(&public_key);
}

evmc::address SecP256K1Context::public_key_to_address(const secp256k1_pubkey* public_key) const {
    const Bytes serialized{serialize_public_key(public_key, /*is_compressed=*/false)};
    // Skip the 0x04 prefix of the uncompressed form
    const ethash::hash256 key_hash{keccak256(ByteView{serialized}.substr(1))};
    evmc::address out;
    std::memcpy(out.bytes, key_hash.bytes + kHashLength - kAddressLength, kAddressLength);
    return out;
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

}  // namespace quarry

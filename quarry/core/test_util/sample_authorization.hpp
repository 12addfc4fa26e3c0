// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

#include <quarry/core/common/util.hpp>
#include <quarry/core/crypto/secp256k1_context.hpp>
#include <quarry/core/types/transaction.hpp>

namespace quarry::test_util {

using evmc::literals::operator""_address;

//! \brief Private key of the EIP-155 example, whose address is kSampleAuthority
inline constexpr std::string_view kSampleAuthorityKey{
    "0x4646464646464646464646464646464646464646464646464646464646464646"};
inline constexpr evmc::address kSampleAuthority{0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f_address};

//! \brief An authorization delegating kSampleAuthority to target, signed with kSampleAuthorityKey
inline Authorization sample_authorization(const evmc::address& target, const intx::uint256& chain_id = 1,
                                          uint64_t nonce = 0) {
    Authorization authorization{.chain_id = chain_id, .address = target, .nonce = nonce};

    const SecP256K1Context context{/*allow_verify=*/true, /*allow_sign=*/true};
    const Bytes private_key{*from_hex(kSampleAuthorityKey)};
    const evmc::bytes32 hash{authorization.signing_hash()};
    secp256k1_ecdsa_recoverable_signature signature;
    if (!context.sign_recoverable(&signature, hash.bytes, private_key)) {
        return authorization;
    }
    const auto [compact, recovery_id]{context.serialize_recoverable_signature(&signature)};
    authorization.r = intx::be::unsafe::load<intx::uint256>(compact.data());
    authorization.s = intx::be::unsafe::load<intx::uint256>(compact.data() + kHashLength);
    authorization.y_parity = recovery_id;
    return authorization;
}

}  // namespace quarry::test_util

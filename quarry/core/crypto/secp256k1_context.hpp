// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <secp256k1.h>

#include <optional>
#include <utility>

#include <evmc/evmc.hpp>
#include <gsl/pointers>
#include <intx/intx.hpp>
#include <secp256k1_recovery.h>

#include <quarry/core/common/base.hpp>

namespace quarry {

// See Appendix F "Signing Transactions" of the Yellow Paper.
inline constexpr intx::uint256 kSecp256k1n{
    intx::from_string<intx::uint256>("0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141")};

inline constexpr intx::uint256 kSecp256k1Halfn{kSecp256k1n >> 1};

//! \brief Checks r and s are in [1, n) and s is in the lower half of the curve order (EIP-2)
bool is_valid_signature(const intx::uint256& r, const intx::uint256& s) noexcept;

class SecP256K1Context final {
  public:
    explicit SecP256K1Context(bool allow_verify = true, bool allow_sign = false)
        : context_(secp256k1_context_create(SecP256K1Context::flags(allow_verify, allow_sign))) {}

    ~SecP256K1Context() {
        secp256k1_context_destroy(context_);
    }

    SecP256K1Context(const SecP256K1Context&) = delete;
    SecP256K1Context& operator=(const SecP256K1Context&) = delete;

    bool create_public_key(secp256k1_pubkey* public_key, ByteView private_key) const {
        return secp256k1_ec_pubkey_create(context_, public_key, private_key.data());
    }

    Bytes serialize_public_key(const secp256k1_pubkey* public_key, bool is_compressed) const;

    bool sign_recoverable(secp256k1_ecdsa_recoverable_signature* signature, ByteView data_hash, ByteView private_key) const {
        if (data_hash.size() != 32) {
            return false;
        }
        return secp256k1_ecdsa_sign_recoverable(context_, signature, data_hash.data(), private_key.data(), nullptr, nullptr);
    }

    //! \brief Serializes a recoverable signature into its 64 bytes compact form plus the recovery id
    std::pair<Bytes, uint8_t> serialize_recoverable_signature(const secp256k1_ecdsa_recoverable_signature* signature) const;

    //! \brief Tries to recover the address which signed the message hash
    //! \param [in] data_hash : the 32 bytes signed message hash
    //! \param [in] signature : the 64 bytes compact signature (r || s)
    //! \param [in] recovery_id : the recovery id (0 or 1)
    //! \return The signer address or std::nullopt if recovery fails
    std::optional<evmc::address> recover_address(ByteView data_hash, ByteView signature, uint8_t recovery_id) const;

    //! \brief Derives the account address from a public key: the last 20 bytes of its keccak hash
    evmc::address public_key_to_address(const secp256k1_pubkey* public_key) const;

    static const size_t kPublicKeySizeCompressed;
    static const size_t kPublicKeySizeUncompressed;

  private:
    static unsigned int flags(bool allow_verify, bool allow_sign);

    gsl::owner<secp256k1_context*> context_;
};

}  // namespace quarry

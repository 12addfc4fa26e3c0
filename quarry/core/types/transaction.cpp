// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <algorithm>

#include <quarry/core/common/util.hpp>
#include <quarry/core/crypto/secp256k1_context.hpp>
#include <quarry/core/rlp/encode.hpp>
#include <quarry/core/types/evmc_bytes32.hpp>

namespace quarry {

// EIP-7702 authorization signature prefix
static constexpr uint8_t kSetCodeMagic{0x05};

evmc::bytes32 Authorization::signing_hash() const {
    Bytes rlp{};
    rlp::encode_for_signing(rlp, *this);
    const ethash::hash256 hash{keccak256(rlp)};
    return to_bytes32(hash.bytes);
}

std::optional<evmc::address> Authorization::recover_authority() const {
    if (y_parity > 1) {
        return std::nullopt;
    }
    static const SecP256K1Context context;
    uint8_t signature[kHashLength * 2];
    intx::be::unsafe::store(signature, r);
    intx::be::unsafe::store(signature + kHashLength, s);
    const evmc::bytes32 hash{signing_hash()};
    return context.recover_address(hash.bytes, signature, y_parity);
}

bool is_valid_transaction_type(uint8_t type) noexcept {
    switch (static_cast<TransactionType>(type)) {
        case TransactionType::kLegacy:
        case TransactionType::kAccessList:
        case TransactionType::kDynamicFee:
        case TransactionType::kBlob:
        case TransactionType::kSetCode:
        case TransactionType::kFeeDelegateDynamicFee:
            return true;
    }
    return false;
}

bool Transaction::is_fee_market() const noexcept {
    return type == TransactionType::kDynamicFee || type == TransactionType::kBlob ||
           type == TransactionType::kSetCode || type == TransactionType::kFeeDelegateDynamicFee;
}

intx::uint256 Transaction::effective_gas_price(const std::optional<intx::uint256>& base_fee_per_gas) const {
    if (!is_fee_market() || !base_fee_per_gas) {
        return max_fee_per_gas;
    }
    return std::min(*base_fee_per_gas + max_priority_fee_per_gas, max_fee_per_gas);
}

namespace rlp {

    void encode(Bytes& to, const AccessListEntry& entry) {
        Bytes payload;
        encode(payload, entry.account);
        encode(payload, entry.storage_keys);
        encode_list(to, payload);
    }

    void encode(Bytes& to, const Authorization& authorization) {
        Bytes payload;
        encode(payload, authorization.chain_id);
        encode(payload, authorization.address);
        encode(payload, authorization.nonce);
        encode(payload, authorization.y_parity);
        encode(payload, authorization.r);
        encode(payload, authorization.s);
        encode_list(to, payload);
    }

    void encode_for_signing(Bytes& to, const Authorization& authorization) {
        to.push_back(kSetCodeMagic);
        Bytes payload;
        encode(payload, authorization.chain_id);
        encode(payload, authorization.address);
        encode(payload, authorization.nonce);
        encode_list(to, payload);
    }

    void encode(Bytes& to, const Transaction& txn) {
        Bytes payload;
        encode(payload, static_cast<uint8_t>(txn.type));
        encode(payload, txn.hash);
        encode(payload, txn.chain_id);
        encode(payload, txn.nonce);
        encode(payload, txn.from);
        encode(payload, txn.to);
        encode(payload, txn.value);
        encode(payload, txn.gas_limit);
        encode(payload, txn.max_priority_fee_per_gas);
        encode(payload, txn.max_fee_per_gas);
        encode(payload, ByteView{txn.data});
        encode(payload, txn.odd_y_parity);
        encode(payload, txn.r);
        encode(payload, txn.s);

        Bytes access_list;
        for (const auto& entry : txn.access_list) {
            encode(access_list, entry);
        }
        encode_list(payload, access_list);

        encode(payload, txn.max_fee_per_blob_gas);
        encode(payload, txn.blob_versioned_hashes);

        Bytes authorizations;
        for (const auto& authorization : txn.authorizations) {
            encode(authorizations, authorization);
        }
        encode_list(payload, authorizations);

        encode(payload, txn.fee_payer);
        encode_list(to, payload);
    }

    void encode(Bytes& to, const TransactionLocation& location) {
        Bytes payload;
        encode(payload, location.block_num);
        encode(payload, location.block_hash);
        encode(payload, location.tx_index);
        encode_list(to, payload);
    }

    DecodingResult decode(ByteView& from, AccessListEntry& to, Leftover mode) noexcept {
        auto payload{decode_list(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        if (DecodingResult res{decode_items(*payload, to.account, to.storage_keys)}; !res) {
            return res;
        }
        return finalize_list(*payload, from, mode);
    }

    DecodingResult decode(ByteView& from, Authorization& to, Leftover mode) noexcept {
        auto payload{decode_list(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        if (DecodingResult res{decode_items(*payload, to.chain_id, to.address, to.nonce, to.y_parity, to.r, to.s)};
            !res) {
            return res;
        }
        return finalize_list(*payload, from, mode);
    }

    DecodingResult decode(ByteView& from, Transaction& to, Leftover mode) noexcept {
        auto payload{decode_list(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        uint8_t type{0};
        if (DecodingResult res{decode(*payload, type, Leftover::kAllow)}; !res) {
            return res;
        }
        if (!is_valid_transaction_type(type)) {
            return tl::unexpected{DecodingError::kUnsupportedTransactionType};
        }
        to.type = static_cast<TransactionType>(type);
        if (DecodingResult res{decode_items(*payload, to.hash, to.chain_id, to.nonce, to.from, to.to, to.value,
                                            to.gas_limit, to.max_priority_fee_per_gas, to.max_fee_per_gas, to.data,
                                            to.odd_y_parity, to.r, to.s)};
            !res) {
            return res;
        }

        auto access_list{decode_list(*payload)};
        if (!access_list) {
            return tl::unexpected{access_list.error()};
        }
        to.access_list.clear();
        while (!access_list->empty()) {
            if (DecodingResult res{decode(*access_list, to.access_list.emplace_back(), Leftover::kAllow)}; !res) {
                return res;
            }
        }

        if (DecodingResult res{decode_items(*payload, to.max_fee_per_blob_gas, to.blob_versioned_hashes)}; !res) {
            return res;
        }

        auto authorizations{decode_list(*payload)};
        if (!authorizations) {
            return tl::unexpected{authorizations.error()};
        }
        to.authorizations.clear();
        while (!authorizations->empty()) {
            if (DecodingResult res{decode(*authorizations, to.authorizations.emplace_back(), Leftover::kAllow)}; !res) {
                return res;
            }
        }

        if (DecodingResult res{decode(*payload, to.fee_payer, Leftover::kAllow)}; !res) {
            return res;
        }
        return finalize_list(*payload, from, mode);
    }

    DecodingResult decode(ByteView& from, TransactionLocation& to, Leftover mode) noexcept {
        auto payload{decode_list(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        if (DecodingResult res{decode_items(*payload, to.block_num, to.block_hash, to.tx_index)}; !res) {
            return res;
        }
        return finalize_list(*payload, from, mode);
    }

}  // namespace rlp

}  // namespace quarry

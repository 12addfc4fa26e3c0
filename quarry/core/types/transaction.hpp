// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quarry/core/common/base.hpp>
#include <quarry/core/rlp/decode.hpp>

namespace quarry {

// EIP-2930: Optional access lists
struct AccessListEntry {
    evmc::address account{};
    std::vector<evmc::bytes32> storage_keys{};

    friend bool operator==(const AccessListEntry&, const AccessListEntry&) = default;
};

// EIP-7702 Authorization
struct Authorization {
    intx::uint256 chain_id;
    evmc::address address;
    uint64_t nonce{};
    uint8_t y_parity{};
    intx::uint256 r;
    intx::uint256 s;

    friend bool operator==(const Authorization&, const Authorization&) = default;

    //! \brief The hash signed by the authority: keccak256(0x05 || rlp([chain_id, address, nonce]))
    evmc::bytes32 signing_hash() const;

    //! \brief Authority recovered from the signature, std::nullopt if recovery fails
    std::optional<evmc::address> recover_authority() const;
};

// EIP-2718 transaction type
enum class TransactionType : uint8_t {
    kLegacy = 0,
    kAccessList = 1,  // EIP-2930
    kDynamicFee = 2,  // EIP-1559
    kBlob = 3,        // EIP-4844
    kSetCode = 4,     // EIP-7702

    // Dynamic fee transaction whose fee is paid by a separate fee payer account
    kFeeDelegateDynamicFee = 0x16,
};

bool is_valid_transaction_type(uint8_t type) noexcept;

//! \brief A transaction as delivered by the node: sender and hash are already known
struct Transaction {
    TransactionType type{TransactionType::kLegacy};
    evmc::bytes32 hash;

    std::optional<intx::uint256> chain_id{std::nullopt};  // nullopt means a pre-EIP-155 transaction

    uint64_t nonce{0};
    evmc::address from;
    std::optional<evmc::address> to{std::nullopt};  // nullopt means contract creation
    intx::uint256 value{0};
    uint64_t gas_limit{0};

    // Legacy and access-list transactions carry their gas price in both fee fields
    intx::uint256 max_priority_fee_per_gas{0};
    intx::uint256 max_fee_per_gas{0};

    Bytes data{};

    bool odd_y_parity{false};
    intx::uint256 r{0}, s{0};

    std::vector<AccessListEntry> access_list{};

    // EIP-4844
    intx::uint256 max_fee_per_blob_gas{0};
    std::vector<evmc::bytes32> blob_versioned_hashes{};

    // EIP-7702
    std::vector<Authorization> authorizations{};

    std::optional<evmc::address> fee_payer{std::nullopt};

    friend bool operator==(const Transaction&, const Transaction&) = default;

    bool is_contract_creation() const noexcept { return !to.has_value(); }

    //! \brief Whether the fee is computed with EIP-1559 rules (base fee + capped tip)
    bool is_fee_market() const noexcept;

    //! \brief The price actually paid per unit of gas
    //! \details min(base_fee + max_priority_fee, max_fee) for fee market transactions in blocks having a base fee,
    //! the plain gas price otherwise
    intx::uint256 effective_gas_price(const std::optional<intx::uint256>& base_fee_per_gas) const;

    intx::uint256 gas_price() const { return max_fee_per_gas; }
};

//! \brief Where a transaction lives in the canonical chain
struct TransactionLocation {
    BlockNum block_num{0};
    evmc::bytes32 block_hash;
    uint32_t tx_index{0};

    friend bool operator==(const TransactionLocation&, const TransactionLocation&) = default;
};

namespace rlp {
    void encode(Bytes& to, const AccessListEntry&);
    void encode(Bytes& to, const Authorization&);
    void encode_for_signing(Bytes& to, const Authorization&);
    void encode(Bytes& to, const Transaction&);
    void encode(Bytes& to, const TransactionLocation&);

    DecodingResult decode(ByteView& from, AccessListEntry& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, Authorization& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, Transaction& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, TransactionLocation& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace rlp

}  // namespace quarry

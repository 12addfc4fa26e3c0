// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quarry/core/common/base.hpp>
#include <quarry/core/rlp/decode.hpp>
#include <quarry/core/types/transaction.hpp>

namespace quarry {

struct BlockHeader {
    evmc::bytes32 hash;
    evmc::bytes32 parent_hash;
    BlockNum number{0};
    BlockTime timestamp{0};
    evmc::address beneficiary;  // miner

    uint64_t gas_limit{0};
    uint64_t gas_used{0};

    std::optional<intx::uint256> base_fee_per_gas{std::nullopt};  // EIP-1559
    std::optional<uint64_t> blob_gas_used{std::nullopt};          // EIP-4844
    std::optional<uint64_t> excess_blob_gas{std::nullopt};        // EIP-4844

    Bytes extra_data;

    friend bool operator==(const BlockHeader&, const BlockHeader&) = default;
};

//! \brief A canonical block: transactions are ordered and their position is the transaction index
struct Block {
    BlockHeader header;
    std::vector<Transaction> transactions;
    std::vector<evmc::bytes32> ommer_hashes;

    friend bool operator==(const Block&, const Block&) = default;

    std::vector<evmc::bytes32> transaction_hashes() const;
};

//! \brief The persisted shape of a block, transactions are referenced by hash
struct BlockForStorage {
    BlockHeader header;
    std::vector<evmc::bytes32> transaction_hashes;
    std::vector<evmc::bytes32> ommer_hashes;
};

namespace rlp {
    void encode(Bytes& to, const BlockHeader&);
    void encode(Bytes& to, const BlockForStorage&);

    DecodingResult decode(ByteView& from, BlockHeader& to, Leftover mode = Leftover::kProhibit) noexcept;
    DecodingResult decode(ByteView& from, BlockForStorage& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace rlp

}  // namespace quarry

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quarry/core/common/base.hpp>
#include <quarry/core/rlp/decode.hpp>
#include <quarry/core/types/log.hpp>
#include <quarry/core/types/transaction.hpp>

namespace quarry {

inline constexpr size_t kBloomByteLength{256};

using Bloom = std::array<uint8_t, kBloomByteLength>;

struct Receipt {
    evmc::bytes32 tx_hash;
    TransactionType type{TransactionType::kLegacy};
    bool success{false};
    uint64_t cumulative_gas_used{0};
    Bloom bloom{};
    std::vector<Log> logs;
    std::optional<evmc::address> contract_address;

    BlockNum block_num{0};
    evmc::bytes32 block_hash;
    uint32_t tx_index{0};

    // Derived at read time from the previous receipt and the transaction, never persisted
    uint64_t gas_used{0};
    intx::uint256 effective_gas_price{0};
};

//! \brief Fills gas_used for receipts sorted by tx_index
//! \details gas_used[0] = cumulative[0], gas_used[i] = cumulative[i] - cumulative[i-1]
void derive_gas_used(std::vector<Receipt>& receipts);

namespace rlp {
    //! \brief Encodes the persisted part of a receipt, derived fields are left out
    void encode(Bytes& to, const Receipt&);
    DecodingResult decode(ByteView& from, Receipt& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace rlp

}  // namespace quarry

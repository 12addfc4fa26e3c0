// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quarry/core/types/receipt.hpp>
#include <quarry/core/types/transaction.hpp>
#include <quarry/db/index/records.hpp>

namespace quarry::index {

//! \brief Source of absolute balances, typically a node queried over RPC
//! \return std::nullopt if the balance of the address at the block is unknown
using BalanceProvider = std::function<std::optional<intx::uint256>(const evmc::address&, BlockNum)>;

//! \brief Sequence of the snapshot seeding an address, ahead of every delta of its block
inline constexpr uint32_t kBalanceSnapshotSequence{0};

//! \brief Balance deltas implied by one transaction
//! \details The sender pays value and fee, unless a distinct fee payer sponsors the fee. The value reaches the
//! recipient, or the created contract. Value only moves when the transaction succeeded while the fee is always
//! paid. Debits use sequence 1 + 2 * tx_index and credits 2 + 2 * tx_index so that the entries of a block replay
//! in transaction order. Zero amounts produce no entry.
//! \param receipt a receipt with derived gas used and effective gas price
std::vector<db::BalanceEntry> make_balance_deltas(const Transaction& transaction, const Receipt& receipt);

//! \brief The snapshot seeding address at block_num with its balance right before the block
db::BalanceEntry make_balance_snapshot(const evmc::address& address, BlockNum block_num,
                                       const intx::uint256& balance);

}  // namespace quarry::index

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "balance.hpp"

namespace quarry::index {

namespace {

    void add_delta(std::vector<db::BalanceEntry>& entries, const evmc::address& address, const Receipt& receipt,
                   uint32_t sequence, bool negative, const intx::uint256& amount) {
        if (amount == 0) {
            return;
        }
        entries.push_back(db::BalanceEntry{
            .address = address,
            .block_num = receipt.block_num,
            .sequence = sequence,
            .kind = db::BalanceEntry::Kind::kDelta,
            .negative = negative,
            .amount = amount,
            .tx_hash = receipt.tx_hash,
        });
    }

}  // namespace

std::vector<db::BalanceEntry> make_balance_deltas(const Transaction& transaction, const Receipt& receipt) {
    const uint32_t debit_sequence{1 + 2 * receipt.tx_index};
    const uint32_t credit_sequence{2 + 2 * receipt.tx_index};

    const intx::uint256 fee{intx::uint256{receipt.gas_used} * receipt.effective_gas_price};
    const intx::uint256 value{receipt.success ? transaction.value : intx::uint256{0}};

    std::vector<db::BalanceEntry> entries;
    if (transaction.fee_payer && *transaction.fee_payer != transaction.from) {
        add_delta(entries, transaction.from, receipt, debit_sequence, /*negative=*/true, value);
        add_delta(entries, *transaction.fee_payer, receipt, debit_sequence, /*negative=*/true, fee);
    } else {
        add_delta(entries, transaction.from, receipt, debit_sequence, /*negative=*/true, value + fee);
    }

    const std::optional<evmc::address> receiver{transaction.to ? transaction.to : receipt.contract_address};
    if (receiver) {
        add_delta(entries, *receiver, receipt, credit_sequence, /*negative=*/false, value);
    }
    return entries;
}

db::BalanceEntry make_balance_snapshot(const evmc::address& address, BlockNum block_num,
                                       const intx::uint256& balance) {
    return db::BalanceEntry{
        .address = address,
        .block_num = block_num,
        .sequence = kBalanceSnapshotSequence,
        .kind = db::BalanceEntry::Kind::kSnapshot,
        .amount = balance,
    };
}

}  // namespace quarry::index

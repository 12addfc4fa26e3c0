// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <quarry/db/index/capabilities.hpp>

namespace quarry::db {

//! \brief Balance history kept as signed deltas plus optional absolute snapshots
//! \details Balances are summed in 256 bit two's complement. A result with the sign bit set means deltas are missing
//! (no seeding snapshot for an address funded before indexing began) and is reported as zero
class MdbxBalanceIndex : public BalanceIndexReader, public BalanceIndexWriter {
  public:
    explicit MdbxBalanceIndex(::mdbx::env env) : env_{env} {}

    intx::uint256 get_balance(const OperationContext& ctx, const evmc::address& address,
                              BlockNum block_num) const override;
    std::vector<BalanceSnapshot> get_balance_history(const OperationContext& ctx, const evmc::address& address,
                                                     BlockNumRange range, const PageRequest& page) const override;
    uint64_t count_balance_history(const OperationContext& ctx, const evmc::address& address,
                                   BlockNumRange range) const override;

    bool has_balance_history(ROTxn& txn, const evmc::address& address) const override;
    void put_balance_entry(RWTxn& txn, const BalanceEntry& entry) override;
    void erase_balance_entries(RWTxn& txn, const evmc::address& address, BlockNum block_num) override;

  private:
    mutable ::mdbx::env env_;
};

}  // namespace quarry::db

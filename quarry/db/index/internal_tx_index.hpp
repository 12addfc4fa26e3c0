// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <quarry/db/index/capabilities.hpp>

namespace quarry::db {

class MdbxInternalTransactionIndex : public InternalTransactionIndexReader, public InternalTransactionIndexWriter {
  public:
    explicit MdbxInternalTransactionIndex(::mdbx::env env) : env_{env} {}

    std::vector<InternalTransaction> get_internal_transactions(const OperationContext& ctx,
                                                               const evmc::bytes32& tx_hash) const override;
    std::vector<InternalTransaction> get_internal_transactions_by_address(const OperationContext& ctx,
                                                                          const evmc::address& address,
                                                                          const PageRequest& page) const override;
    uint64_t count_internal_transactions_by_address(const OperationContext& ctx,
                                                    const evmc::address& address) const override;

    void save_internal_transactions(const OperationContext& ctx, const evmc::bytes32& tx_hash,
                                    std::vector<InternalTransaction> traces) override;
    void erase_internal_transactions(RWTxn& txn, const evmc::bytes32& tx_hash) override;

  private:
    mutable ::mdbx::env env_;
};

}  // namespace quarry::db

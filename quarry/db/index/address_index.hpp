// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <quarry/db/index/capabilities.hpp>

namespace quarry::db {

class MdbxAddressIndex : public AddressIndexReader, public AddressIndexWriter {
  public:
    explicit MdbxAddressIndex(::mdbx::env env) : env_{env} {}

    std::vector<AddressTransaction> get_address_transactions(const OperationContext& ctx,
                                                             const evmc::address& address,
                                                             const PageRequest& page) const override;
    uint64_t count_address_transactions(const OperationContext& ctx, const evmc::address& address) const override;

    void put_address_transaction(RWTxn& txn, const AddressTransaction& entry) override;
    void erase_address_transaction(RWTxn& txn, const AddressTransaction& entry) override;

  private:
    mutable ::mdbx::env env_;
};

}  // namespace quarry::db

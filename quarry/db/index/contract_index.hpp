// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <quarry/db/index/capabilities.hpp>

namespace quarry::db {

class MdbxContractIndex : public ContractIndexReader, public ContractIndexWriter {
  public:
    explicit MdbxContractIndex(::mdbx::env env) : env_{env} {}

    std::optional<ContractCreation> get_contract_creation(const OperationContext& ctx,
                                                          const evmc::address& contract) const override;
    std::vector<ContractCreation> get_contracts_by_creator(const OperationContext& ctx, const evmc::address& creator,
                                                           const PageRequest& page) const override;
    uint64_t count_contracts_by_creator(const OperationContext& ctx, const evmc::address& creator) const override;
    std::optional<ContractVerification> get_contract_verification(const OperationContext& ctx,
                                                                  const evmc::address& contract) const override;

    void put_contract_creation(RWTxn& txn, const ContractCreation& creation) override;
    void erase_contract_creation(RWTxn& txn, const ContractCreation& creation) override;
    void set_contract_verification(const OperationContext& ctx, const ContractVerification& verification) override;
    bool delete_contract_verification(const OperationContext& ctx, const evmc::address& contract) override;

  private:
    mutable ::mdbx::env env_;
};

}  // namespace quarry::db

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <quarry/db/index/capabilities.hpp>

namespace quarry::db {

class MdbxSetCodeIndex : public SetCodeIndexReader, public SetCodeIndexWriter {
  public:
    explicit MdbxSetCodeIndex(::mdbx::env env) : env_{env} {}

    std::optional<SetCodeAuthorizationRecord> get_set_code_authorization(const OperationContext& ctx,
                                                                         const evmc::bytes32& tx_hash,
                                                                         uint32_t auth_index) const override;
    std::vector<SetCodeAuthorizationRecord> get_set_code_authorizations(const OperationContext& ctx,
                                                                        const evmc::bytes32& tx_hash) const override;
    std::vector<SetCodeAuthorizationRecord> get_set_code_authorizations_by_target(
        const OperationContext& ctx, const evmc::address& target, const PageRequest& page) const override;
    std::vector<SetCodeAuthorizationRecord> get_set_code_authorizations_by_authority(
        const OperationContext& ctx, const evmc::address& authority, const PageRequest& page) const override;
    uint64_t count_set_code_authorizations_by_target(const OperationContext& ctx,
                                                     const evmc::address& target) const override;
    uint64_t count_set_code_authorizations_by_authority(const OperationContext& ctx,
                                                        const evmc::address& authority) const override;
    std::optional<AddressDelegationState> get_delegation_state(const OperationContext& ctx,
                                                               const evmc::address& address) const override;
    AddressSetCodeStats get_set_code_stats(const OperationContext& ctx, const evmc::address& address) const override;

    void put_set_code_authorization(RWTxn& txn, const SetCodeAuthorizationRecord& record) override;
    void erase_set_code_authorization(RWTxn& txn, const SetCodeAuthorizationRecord& record) override;

  private:
    mutable ::mdbx::env env_;
};

}  // namespace quarry::db

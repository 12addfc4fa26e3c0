// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <quarry/db/index/capabilities.hpp>

namespace quarry::db {

//! \brief WBFT block records, epoch validator sets and per validator signing counters
class MdbxWbftIndex : public WbftIndexReader, public WbftIndexWriter {
  public:
    explicit MdbxWbftIndex(::mdbx::env env) : env_{env} {}

    std::optional<WbftBlockRecord> get_wbft_block(const OperationContext& ctx, BlockNum block_num) const override;
    std::optional<EpochInfo> get_epoch_info(const OperationContext& ctx, uint64_t epoch_num) const override;
    std::optional<EpochInfo> get_latest_epoch_info(const OperationContext& ctx) const override;
    std::optional<ValidatorSigningStats> get_validator_stats(const OperationContext& ctx,
                                                             const evmc::address& validator) const override;
    std::vector<ValidatorSigningStats> get_all_validator_stats(const OperationContext& ctx) const override;
    std::vector<ValidatorSigningActivity> get_validator_activity(const OperationContext& ctx,
                                                                 const evmc::address& validator, BlockNumRange range,
                                                                 const PageRequest& page) const override;
    uint64_t count_validator_activity(const OperationContext& ctx, const evmc::address& validator,
                                      BlockNumRange range) const override;

    std::optional<EpochInfo> find_epoch_in_force(ROTxn& txn, BlockNum block_num,
                                                 uint64_t epoch_length) const override;
    void put_wbft_block(RWTxn& txn, const WbftBlockRecord& record) override;
    void put_epoch_info(RWTxn& txn, const EpochInfo& info) override;
    void put_signing_activity(RWTxn& txn, const ValidatorSigningActivity& activity) override;
    void erase_wbft_block(RWTxn& txn, BlockNum block_num, uint64_t epoch_length) override;

  private:
    mutable ::mdbx::env env_;
};

}  // namespace quarry::db

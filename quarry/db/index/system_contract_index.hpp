// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <quarry/db/index/capabilities.hpp>

namespace quarry::db {

//! \brief Events of the native coin and governance system contracts together with the state they drive
class MdbxSystemContractIndex : public SystemContractIndexReader, public SystemContractIndexWriter {
  public:
    explicit MdbxSystemContractIndex(::mdbx::env env) : env_{env} {}

    intx::uint256 get_total_supply(const OperationContext& ctx) const override;
    std::vector<MinterInfo> get_active_minters(const OperationContext& ctx) const override;
    std::optional<intx::uint256> get_minter_allowance(const OperationContext& ctx,
                                                      const evmc::address& minter) const override;
    std::optional<BlacklistStatus> get_blacklist_status(const OperationContext& ctx,
                                                        const evmc::address& account) const override;
    std::optional<Proposal> get_proposal(const OperationContext& ctx, const evmc::address& contract,
                                         const intx::uint256& proposal_id) const override;
    std::vector<Proposal> get_proposals(const OperationContext& ctx, const evmc::address& contract,
                                        std::optional<ProposalStatus> status,
                                        const PageRequest& page) const override;
    uint64_t count_proposals(const OperationContext& ctx, const evmc::address& contract,
                             std::optional<ProposalStatus> status) const override;
    std::vector<SystemContractEvent> get_system_events(const OperationContext& ctx, SystemEventKind kind,
                                                       BlockNumRange range, const PageRequest& page) const override;
    std::vector<SystemContractEvent> get_system_events_by_account(const OperationContext& ctx,
                                                                  const evmc::address& account,
                                                                  const PageRequest& page) const override;
    uint64_t count_system_events(const OperationContext& ctx, SystemEventKind kind,
                                 BlockNumRange range) const override;
    uint64_t count_system_events_by_account(const OperationContext& ctx,
                                            const evmc::address& account) const override;
    std::optional<Proposal> get_proposal(const OperationContext& ctx, const evmc::address& contract,
                                         const intx::uint256& proposal_id) const override;
    std::vector<Proposal> get_proposals(const OperationContext& ctx, const evmc::address& contract,
                                        std::optional<ProposalStatus> status,
                                        const PageRequest& page) const override;
    uint64_t count_proposals(const OperationContext& ctx, const evmc::address& contract,
                             std::optional<ProposalStatus> status) const override;

    void put_system_event(RWTxn& txn, const SystemContractEvent& event) override;
    void erase_system_event(RWTxn& txn, const SystemContractEvent& event) override;

  private:
    mutable ::mdbx::env env_;
};

}  // namespace quarry::db

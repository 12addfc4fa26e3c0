// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quarry/core/common/base.hpp>
#include <quarry/db/index/records.hpp>
#include <quarry/events/types.hpp>

namespace quarry::events {

//! \brief Subscriber side selection of events, every set criterion must hold
//! \details
//! - addresses: sender or recipient of a transaction, emitter of a log, contract of a system event, miner of a
//!   block, subject of a validator set change. Chain config events never match an address
//! - from_addresses / to_addresses: sender / recipient of a transaction, a contract creation has no recipient
//! - min_value / max_value: inclusive bounds on the value of a transaction
//! - from_block / to_block: inclusive bounds on the block of any event, 0 meaning unbounded
//! - topics: positional log topics, an empty position is a wildcard and alternatives within a position are OR-ed
//! - system_event_kinds: kinds of system contract events
//! Block, chain config, validator set and system contract events never match sender, recipient or topic criteria.
struct Filter {
    std::vector<evmc::address> addresses;
    std::vector<evmc::address> from_addresses;
    std::vector<evmc::address> to_addresses;
    std::optional<intx::uint256> min_value;
    std::optional<intx::uint256> max_value;
    BlockNum from_block{0};
    BlockNum to_block{0};
    std::vector<std::vector<evmc::bytes32>> topics;
    std::vector<db::SystemEventKind> system_event_kinds;

    //! \remarks Throws Error{kInvalidInput} when min_value > max_value or from_block > to_block
    void validate() const;

    bool empty() const noexcept;

    bool matches(const Event& event) const;

  private:
    bool matches_block(BlockNum block_num) const noexcept;
    //! \brief Whether sender, recipient or topic criteria are set, which only transactions and logs can meet
    bool constrains_directions() const noexcept;
    bool matches_address(const evmc::address& address) const;
    bool matches_transaction(const TransactionEvent& tx) const;
    bool matches_log(const Log& log) const;
    bool matches_system_event(const db::SystemContractEvent& event) const;
};

}  // namespace quarry::events

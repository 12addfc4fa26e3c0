// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quarry/core/common/base.hpp>
#include <quarry/core/types/log.hpp>
#include <quarry/core/types/receipt.hpp>
#include <quarry/db/index/records.hpp>

namespace quarry::events {

//! \brief Event categories, in the order of the alternatives of Event::Payload
enum class EventType : uint8_t {
    kBlock,
    kTransaction,
    kLog,
    kChainConfig,
    kValidatorSet,
    kSystemContract,
};

std::string_view to_string(EventType type);

//! \brief Parses the name of an event type ("block", "transaction", "log"...), case insensitive
std::optional<EventType> event_type_from_string(std::string_view name);

struct BlockEvent {
    BlockNum number{0};
    evmc::bytes32 hash;
    evmc::bytes32 parent_hash;
    BlockTime timestamp{0};
    evmc::address miner;
    uint64_t tx_count{0};
};

struct TransactionEvent {
    evmc::bytes32 hash;
    BlockNum block_num{0};
    evmc::bytes32 block_hash;
    uint32_t index{0};
    evmc::address from;
    std::optional<evmc::address> to;  // unset for contract creations
    intx::uint256 value{0};
    std::optional<Receipt> receipt;
};

struct LogEvent {
    Log log;
};

//! \brief A chain parameter changed at a block, e.g. the governance gas tip
struct ChainConfigEvent {
    BlockNum block_num{0};
    evmc::bytes32 block_hash;
    std::string parameter;
    std::string old_value;
    std::string new_value;
};

enum class ValidatorChange : uint8_t {
    kAdded,
    kRemoved,
};

struct ValidatorSetEvent {
    BlockNum block_num{0};
    evmc::bytes32 block_hash;
    ValidatorChange change{ValidatorChange::kAdded};
    evmc::address validator;
    std::string info;
    uint32_t validator_set_size{0};
};

struct SystemContractEvent {
    db::SystemContractEvent record;
};

//! \brief An immutable notification shared by every subscriber it is delivered to
struct Event {
    using Payload = std::variant<BlockEvent, TransactionEvent, LogEvent, ChainConfigEvent, ValidatorSetEvent,
                                 SystemContractEvent>;

    Payload payload;
    absl::Time created_at{absl::Now()};

    EventType type() const noexcept { return static_cast<EventType>(payload.index()); }

    //! \brief The block the event refers to
    BlockNum block_num() const noexcept;
};

using EventPtr = std::shared_ptr<const Event>;

template <class T>
EventPtr make_event(T payload) {
    return std::make_shared<const Event>(Event{.payload = std::move(payload)});
}

}  // namespace quarry::events

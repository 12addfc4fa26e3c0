// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <magic_enum.hpp>

#include <quarry/core/common/util.hpp>

namespace quarry::events {

static_assert(std::variant_size_v<Event::Payload> == magic_enum::enum_count<EventType>());

std::string_view to_string(EventType type) {
    switch (type) {
        case EventType::kBlock:
            return "block";
        case EventType::kTransaction:
            return "transaction";
        case EventType::kLog:
            return "log";
        case EventType::kChainConfig:
            return "chainConfig";
        case EventType::kValidatorSet:
            return "validatorSet";
        case EventType::kSystemContract:
            return "systemContract";
    }
    return "unknown";
}

std::optional<EventType> event_type_from_string(std::string_view name) {
    for (const auto type : magic_enum::enum_values<EventType>()) {
        if (iequals(name, to_string(type))) {
            return type;
        }
    }
    return std::nullopt;
}

BlockNum Event::block_num() const noexcept {
    return std::visit(
        [](const auto& p) -> BlockNum {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, BlockEvent>) {
                return p.number;
            } else if constexpr (std::is_same_v<T, LogEvent>) {
                return p.log.block_num;
            } else if constexpr (std::is_same_v<T, SystemContractEvent>) {
                return p.record.block_num;
            } else {
                return p.block_num;
            }
        },
        payload);
}

}  // namespace quarry::events

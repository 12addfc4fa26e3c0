// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "filter.hpp"

#include <algorithm>
#include <string>

#include <quarry/core/common/error.hpp>

namespace quarry::events {

namespace {

    template <class T>
    bool contains(const std::vector<T>& values, const T& value) {
        return std::find(values.begin(), values.end(), value) != values.end();
    }

}  // namespace

void Filter::validate() const {
    if (min_value && max_value) {
        ensure_input(*min_value <= *max_value,
                     "min value " + intx::to_string(*min_value) + " exceeds max value " + intx::to_string(*max_value));
    }
    if (from_block != 0 && to_block != 0) {
        ensure_input(from_block <= to_block, "from block " + std::to_string(from_block) + " exceeds to block " +
                                                 std::to_string(to_block));
    }
}

bool Filter::empty() const noexcept {
    return addresses.empty() && from_addresses.empty() && to_addresses.empty() && !min_value && !max_value &&
           from_block == 0 && to_block == 0 && topics.empty() && system_event_kinds.empty();
}

bool Filter::matches(const Event& event) const {
    if (!matches_block(event.block_num())) {
        return false;
    }
    return std::visit(
        [this](const auto& payload) -> bool {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, TransactionEvent>) {
                return matches_transaction(payload);
            } else if constexpr (std::is_same_v<T, LogEvent>) {
                return matches_log(payload.log);
            } else if constexpr (std::is_same_v<T, SystemContractEvent>) {
                return !constrains_directions() && matches_system_event(payload.record);
            } else if constexpr (std::is_same_v<T, BlockEvent>) {
                return !constrains_directions() && matches_address(payload.miner);
            } else if constexpr (std::is_same_v<T, ValidatorSetEvent>) {
                return !constrains_directions() && matches_address(payload.validator);
            } else {
                // configuration changes carry no address nor topic
                return !constrains_directions() && addresses.empty();
            }
        },
        event.payload);
}

bool Filter::matches_block(BlockNum block_num) const noexcept {
    if (from_block != 0 && block_num < from_block) {
        return false;
    }
    if (to_block != 0 && block_num > to_block) {
        return false;
    }
    return true;
}

bool Filter::constrains_directions() const noexcept {
    return !from_addresses.empty() || !to_addresses.empty() || !topics.empty();
}

bool Filter::matches_address(const evmc::address& address) const {
    return addresses.empty() || contains(addresses, address);
}

bool Filter::matches_transaction(const TransactionEvent& tx) const {
    if (!addresses.empty()) {
        const bool touches{contains(addresses, tx.from) || (tx.to && contains(addresses, *tx.to))};
        if (!touches) {
            return false;
        }
    }
    if (!from_addresses.empty() && !contains(from_addresses, tx.from)) {
        return false;
    }
    if (!to_addresses.empty() && (!tx.to || !contains(to_addresses, *tx.to))) {
        return false;
    }
    if (min_value && tx.value < *min_value) {
        return false;
    }
    if (max_value && tx.value > *max_value) {
        return false;
    }
    return true;
}

bool Filter::matches_log(const Log& log) const {
    if (!addresses.empty() && !contains(addresses, log.address)) {
        return false;
    }
    return matches_topics(log, topics);
}

bool Filter::matches_system_event(const db::SystemContractEvent& event) const {
    if (!addresses.empty() && !contains(addresses, event.contract)) {
        return false;
    }
    if (!system_event_kinds.empty() && !contains(system_event_kinds, event.kind)) {
        return false;
    }
    return true;
}

}  // namespace quarry::events

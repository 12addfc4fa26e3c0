// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "tables.hpp"

#include <span>
#include <stdexcept>

namespace quarry::db::table {

static void check_or_create_tables(RWTxn& txn, std::span<const MapConfig> configs) {
    for (const auto& config : configs) {
        if (has_map(txn, config.name)) {
            auto table_map{txn->open_map(config.name)};
            auto table_info{txn->get_handle_info(table_map)};
            if (table_info.key_mode() != config.key_mode || table_info.value_mode() != config.value_mode) {
                throw std::runtime_error("MDBX Table schema incompatible: " + std::string(config.name) +
                                         " has incompatible flags.");
            }
            continue;
        }
        // Create missing table
        (void)txn->create_map(config.name, config.key_mode, config.value_mode);  // Will throw if tx is RO
    }
}

void check_or_create_chaindata_tables(RWTxn& txn) {
    check_or_create_tables(txn, kChainDataTables);
    check_or_create_tables(txn, kIndexTables);
}

}  // namespace quarry::db::table

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include <CLI/CLI.hpp>

#include <quarry/db/data_store.hpp>
#include <quarry/events/bus.hpp>
#include <quarry/index/maintainer.hpp>
#include <quarry/infra/common/log.hpp>
#include <quarry/query/pagination.hpp>

namespace quarry::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up option for the data directory path
void add_option_data_dir(CLI::App& cli, std::filesystem::path& data_dir);

//! \brief Set up options for the MDBX environment (sizes, readers, access mode)
void add_db_options(CLI::App& cli, db::EnvConfig& env_config);

//! \brief Set up one toggle per optional index family
void add_index_options(CLI::App& cli, db::IndexFeatures& features, index::WbftSettings& wbft_settings);

//! \brief Set up options for the event bus queues
void add_bus_options(CLI::App& cli, events::BusSettings& settings);

//! \brief Set up options for the page sizes and scan spans of queries
void add_query_options(CLI::App& cli, query::QueryLimits& limits);

//! \brief Set up parsing of a human readable bytes size
void add_option_human_size(CLI::App& cli, const std::string& name, size_t& value, size_t min_size, size_t max_size,
                           const std::string& description);

//! \brief CLI11 validator for a hex encoded 20 bytes address
struct AddressValidator : public CLI::Validator {
    AddressValidator();
};

}  // namespace quarry::cmd::common

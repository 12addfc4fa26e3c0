// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <chrono>
#include <map>

#include <quarry/core/common/util.hpp>
#include <quarry/core/types/address.hpp>
#include <quarry/infra/common/directories.hpp>

namespace quarry::cmd::common {

namespace {

    struct HumanSizeParserValidator : public CLI::Validator {
        HumanSizeParserValidator(size_t min_size, size_t max_size) {
            std::string range_desc = "range [" + human_size(min_size) + " - " + human_size(max_size) + "]";
            description(range_desc);

            func_ = [=](const std::string& value) -> std::string {
                auto parsed_size = parse_size(value);
                if (!parsed_size) {
                    return std::string("Value " + value + " is not a parseable size");
                }
                if ((parsed_size.value() < min_size) || (parsed_size.value() > max_size)) {
                    return "Value " + value + " not in " + range_desc;
                }
                return {};
            };
        }
    };

}  // namespace

AddressValidator::AddressValidator() {
    description("ADDRESS");
    func_ = [](const std::string& value) -> std::string {
        if (!hex_to_address(value)) {
            return "Value " + value + " is not a hex encoded address";
        }
        return {};
    };
}

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_option_data_dir(CLI::App& cli, std::filesystem::path& data_dir) {
    cli.add_option("--datadir", data_dir, "The path to the index data directory")
        ->default_val(DataDirectory::get_default_storage_path().string());
}

void add_db_options(CLI::App& cli, db::EnvConfig& env_config) {
    auto& db_opts = *cli.add_option_group("Db", "Database options");
    add_option_human_size(db_opts, "--db.max.size", env_config.max_size, 64_Mebi, 16_Tebi,
                          "The maximum size the database file can grow to");
    add_option_human_size(db_opts, "--db.growth.size", env_config.growth_size, 1_Mebi, 64_Gibi,
                          "The size increment of each database file extension");
    db_opts.add_option("--db.max.readers", env_config.max_readers, "The maximum number of concurrent readers")
        ->capture_default_str()
        ->check(CLI::Range(16u, 32'767u));
    db_opts.add_flag("--db.exclusive", env_config.exclusive, "Open the database in exclusive mode");
}

void add_index_options(CLI::App& cli, db::IndexFeatures& features, index::WbftSettings& wbft_settings) {
    auto& index_opts = *cli.add_option_group("Index", "Secondary index options");
    index_opts.add_option("--index.address", features.address, "Maintain the address activity index")
        ->capture_default_str();
    index_opts.add_option("--index.tokens", features.tokens, "Maintain the ERC20/ERC721 transfer indexes")
        ->capture_default_str();
    index_opts.add_option("--index.contracts", features.contracts, "Maintain the contract creation index")
        ->capture_default_str();
    index_opts.add_option("--index.internal", features.internal_transactions,
                          "Maintain the internal transaction index")
        ->capture_default_str();
    index_opts.add_option("--index.wbft", features.wbft, "Maintain the WBFT consensus indexes")
        ->capture_default_str();
    index_opts.add_option("--index.setcode", features.set_code, "Maintain the EIP-7702 authorization indexes")
        ->capture_default_str();
    index_opts.add_option("--index.balance", features.balance_history, "Maintain the balance history index")
        ->capture_default_str();
    index_opts.add_option("--index.system", features.system_contracts, "Maintain the system contract indexes")
        ->capture_default_str();
    index_opts.add_option("--wbft.epoch.length", wbft_settings.epoch_length, "The number of blocks in a WBFT epoch")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
}

void add_bus_options(CLI::App& cli, events::BusSettings& settings) {
    auto& bus_opts = *cli.add_option_group("Bus", "Event bus options");
    bus_opts.add_option("--bus.ingress.capacity", settings.ingress_capacity,
                        "The number of events waiting for dispatch before publishing fails")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    bus_opts.add_option("--bus.subscriber.capacity", settings.default_subscriber_capacity,
                        "The default number of events queued per subscriber before dropping")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    bus_opts.add_option("--bus.history", settings.history_size, "The number of recent events kept for replay")
        ->capture_default_str();
    bus_opts
        .add_option_function<uint32_t>(
            "--bus.poll.ms", [&settings](const uint32_t& ms) { settings.poll_interval = std::chrono::milliseconds{ms}; },
            "The dispatcher wake up interval in milliseconds")
        ->default_str(std::to_string(settings.poll_interval.count()))
        ->check(CLI::Range(1u, 10'000u));
}

void add_query_options(CLI::App& cli, query::QueryLimits& limits) {
    auto& query_opts = *cli.add_option_group("Query", "Query limits");
    query_opts.add_option("--query.default.limit", limits.default_limit, "The page size used when none is given")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    query_opts.add_option("--query.max.limit", limits.max_limit, "The maximum page size")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    query_opts.add_option("--query.max.range", limits.max_range,
                          "The maximum block span scanned by transaction and log queries")
        ->capture_default_str();
    query_opts.add_option("--query.max.blocks", limits.max_blocks_range, "The maximum blocks per range request")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
}

void add_option_human_size(CLI::App& cli, const std::string& name, size_t& value, size_t min_size, size_t max_size,
                           const std::string& description) {
    CLI::Option* option = cli.add_option(name, [&value](const CLI::results_t& results) -> bool {
        auto value_opt = parse_size(results[0]);
        if (value_opt) {
            value = *value_opt;
        }
        return value_opt.has_value();
    });
    option->description(description);
    option->default_str(human_size(value));
    option->check(HumanSizeParserValidator{min_size, max_size});
}

}  // namespace quarry::cmd::common

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

#include <CLI/CLI.hpp>
#include <absl/strings/match.h>
#include <boost/format.hpp>
#include <magic_enum.hpp>

#include <quarry/core/common/error.hpp>
#include <quarry/core/types/address.hpp>
#include <quarry/core/types/evmc_bytes32.hpp>
#include <quarry/db/data_store.hpp>
#include <quarry/events/bus.hpp>
#include <quarry/index/log_decoder.hpp>
#include <quarry/index/maintainer.hpp>
#include <quarry/infra/cli/common.hpp>
#include <quarry/infra/common/directories.hpp>
#include <quarry/infra/common/log.hpp>
#include <quarry/infra/concurrency/operation_context.hpp>
#include <quarry/query/query_engine.hpp>

using namespace quarry;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

OperationContext g_context;

void sig_handler(int signum) {
    (void)signum;
    g_context.cancel();
}

struct Settings {
    log::Settings log_settings;
    fs::path data_dir;
    db::DataStoreSettings store;
    index::WbftSettings wbft;
    events::BusSettings bus;
    query::QueryLimits query;
};

struct PageOptions {
    size_t offset{0};
    std::optional<size_t> limit;

    query::Pagination pagination() const { return query::Pagination{.limit = limit, .offset = offset}; }
};

void add_page_options(CLI::App& cmd, PageOptions& options) {
    cmd.add_option("--offset", options.offset, "Number of items to skip")->capture_default_str();
    cmd.add_option("--limit", options.limit, "Page size");
}

evmc::address parse_address(const std::string& hex) {
    const auto address{hex_to_address(hex)};
    ensure_input(address.has_value(), "invalid address " + hex);
    return *address;
}

template <class T>
void print_page_info(const query::Connection<T>& connection) {
    std::cout << "\n Total " << connection.total_count << (connection.total_count_exact ? "" : " (in scanned range)")
              << "  next: " << (connection.page_info.has_next_page ? "yes" : "no")
              << "  previous: " << (connection.page_info.has_previous_page ? "yes" : "no");
    if (connection.page_info.start_cursor) {
        std::cout << "  cursors: " << *connection.page_info.start_cursor << " .. " << *connection.page_info.end_cursor;
    }
    std::cout << "\n" << std::endl;
}

void do_status(db::DataStore& store) {
    const auto& chain{store.chain()};
    const auto latest{chain.get_latest_height(g_context)};
    const auto indexed{chain.get_indexed_height(g_context)};
    std::cout << "\n Latest height  : " << (latest ? std::to_string(*latest) : "none")
              << "\n Indexed height : " << (indexed ? std::to_string(*indexed) : "none")
              << "\n Blocks         : " << chain.get_block_count(g_context)
              << "\n Transactions   : " << chain.get_transaction_count(g_context) << "\n";

    static const std::string kFmtRow{" %-24s %-8s"};
    const auto& features{store.features()};
    std::cout << "\n" << (boost::format(kFmtRow) % "Index family" % "Enabled") << "\n";
    std::cout << (boost::format(kFmtRow) % std::string(24, '-') % std::string(8, '-')) << "\n";
    const std::vector<std::pair<std::string, bool>> families{
        {"address", features.address},
        {"tokens", features.tokens},
        {"contracts", features.contracts},
        {"internal transactions", features.internal_transactions},
        {"wbft", features.wbft},
        {"set-code", features.set_code},
        {"balance history", features.balance_history},
        {"system contracts", features.system_contracts},
    };
    for (const auto& [name, enabled] : families) {
        std::cout << (boost::format(kFmtRow) % name % (enabled ? "yes" : "no")) << "\n";
    }
    std::cout << std::endl;
}

void do_blocks(const query::QueryEngine& engine, const query::BlockFilter& filter, const PageOptions& page) {
    static const std::string kFmtHdr{" %10s %-66s %12s %5s %-42s"};
    static const std::string kFmtRow{" %10u %-66s %12u %5u %-42s"};

    const auto connection{engine.blocks(g_context, filter, page.pagination())};
    std::cout << "\n" << (boost::format(kFmtHdr) % "Number" % "Hash" % "Timestamp" % "Txs" % "Miner") << "\n";
    for (const auto& block : connection.nodes) {
        std::cout << (boost::format(kFmtRow) % block.header.number % to_hex(block.header.hash, true) %
                      block.header.timestamp % block.transactions.size() % address_to_hex(block.header.beneficiary))
                  << "\n";
    }
    print_page_info(connection);
}

void do_transactions(const query::QueryEngine& engine, const query::TransactionFilter& filter,
                     const PageOptions& page) {
    static const std::string kFmtHdr{" %10s %5s %-66s %-42s %-42s"};
    static const std::string kFmtRow{" %10u %5u %-66s %-42s %-42s"};

    const auto connection{engine.transactions(g_context, filter, page.pagination())};
    std::cout << "\n" << (boost::format(kFmtHdr) % "Block" % "Index" % "Hash" % "From" % "To") << "\n";
    for (const auto& node : connection.nodes) {
        const auto& txn{node.transaction};
        std::cout << (boost::format(kFmtRow) % node.location.block_num % node.location.tx_index %
                      to_hex(txn.hash, true) % address_to_hex(txn.from) %
                      (txn.to ? address_to_hex(*txn.to) : std::string{"(creation)"}))
                  << "\n";
    }
    print_page_info(connection);
}

void do_logs(const query::QueryEngine& engine, const query::LogFilter& filter, const PageOptions& page) {
    static const std::string kFmtHdr{" %10s %5s %-42s %-66s"};
    static const std::string kFmtRow{" %10u %5u %-42s %-66s"};

    const auto connection{engine.logs(g_context, filter, page.pagination())};
    std::cout << "\n" << (boost::format(kFmtHdr) % "Block" % "Index" % "Emitter" % "Topic0") << "\n";
    for (const auto& log : connection.nodes) {
        std::cout << (boost::format(kFmtRow) % log.block_num % log.index % address_to_hex(log.address) %
                      (log.topics.empty() ? std::string{} : to_hex(log.topics[0], true)))
                  << "\n";
    }
    print_page_info(connection);
}

void do_address(const query::QueryEngine& engine, const evmc::address& address, const PageOptions& page) {
    static const std::string kFmtHdr{" %10s %5s %-66s"};
    static const std::string kFmtRow{" %10u %5u %-66s"};

    const auto connection{engine.transactions_by_address(g_context, address, page.pagination())};
    std::cout << "\n Activity of " << address_to_hex(address) << "\n\n"
              << (boost::format(kFmtHdr) % "Block" % "Index" % "Transaction") << "\n";
    for (const auto& entry : connection.nodes) {
        std::cout << (boost::format(kFmtRow) % entry.block_num % entry.tx_index % to_hex(entry.tx_hash, true)) << "\n";
    }
    print_page_info(connection);
}

//! Maps a status name such as "voting" to its value, case insensitive
db::ProposalStatus parse_proposal_status(const std::string& name) {
    for (const auto status : magic_enum::enum_values<db::ProposalStatus>()) {
        if (absl::EqualsIgnoreCase(magic_enum::enum_name(status).substr(1), name)) {
            return status;
        }
    }
    throw Error{ErrorCode::kInvalidInput, "unknown proposal status " + name};
}

void do_proposals(const query::QueryEngine& engine, const evmc::address& contract,
                  std::optional<db::ProposalStatus> status, const PageOptions& page) {
    static const std::string kFmtHdr{" %12s %-10s %-42s %9s %9s %10s"};
    static const std::string kFmtRow{" %12s %-10s %-42s %9u %9u %10u"};

    const auto connection{engine.proposals(g_context, contract, status, page.pagination())};
    std::cout << "
 Proposals of " << address_to_hex(contract) << "

"
              << (boost::format(kFmtHdr) % "Id" % "Status" % "Proposer" % "Approved" % "Rejected" % "Block") << "
";
    for (const auto& proposal : connection.nodes) {
        std::cout << (boost::format(kFmtRow) % intx::to_string(proposal.proposal_id) %
                      magic_enum::enum_name(proposal.status).substr(1) % address_to_hex(proposal.proposer) %
                      proposal.approved % proposal.rejected % proposal.block_num)
                  << "
";
    }
    print_page_info(connection);
}

std::string describe(const events::Event& event) {
    return std::visit(
        [](const auto& payload) -> std::string {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, events::BlockEvent>) {
                return "block " + std::to_string(payload.number) + " txs=" + std::to_string(payload.tx_count);
            } else if constexpr (std::is_same_v<T, events::TransactionEvent>) {
                return "tx " + to_hex(payload.hash, true) + " from=" + address_to_hex(payload.from);
            } else if constexpr (std::is_same_v<T, events::LogEvent>) {
                return "log " + std::to_string(payload.log.index) + " emitter=" + address_to_hex(payload.log.address);
            } else if constexpr (std::is_same_v<T, events::ChainConfigEvent>) {
                return "config " + payload.parameter + " " + payload.old_value + " -> " + payload.new_value;
            } else if constexpr (std::is_same_v<T, events::ValidatorSetEvent>) {
                return "validator " + std::string{magic_enum::enum_name(payload.change)} + " " +
                       address_to_hex(payload.validator);
            } else {
                return "system " + std::string{magic_enum::enum_name(payload.record.kind)};
            }
        },
        event.payload);
}

struct WatchOptions {
    bool enabled{false};
    std::vector<std::string> types;
    std::vector<std::string> addresses;
};

//! Prints the events published by the maintainer while it runs, the bus is drained and stopped on destruction
class EventWatch {
  public:
    EventWatch(const events::BusSettings& settings, const WatchOptions& watch)
        : bus_{settings}, poll_interval_{settings.poll_interval} {
        events::SubscribeOptions options;
        for (const auto& name : watch.types) {
            const auto type{events::event_type_from_string(name)};
            ensure_input(type.has_value(), "unknown event type " + name);
            options.types.push_back(*type);
        }
        if (!watch.addresses.empty()) {
            events::Filter filter;
            for (const auto& hex : watch.addresses) {
                filter.addresses.push_back(parse_address(hex));
            }
            options.filter = std::move(filter);
        }
        auto subscription{bus_.subscribe("cli", std::move(options))};
        bus_.start();
        printer_ = std::thread{[subscription] {
            while (!subscription->is_closed()) {
                if (const auto event{subscription->next(100ms)}; event) {
                    std::cout << " event " << describe(**event) << "\n";
                }
            }
        }};
    }

    ~EventWatch() {
        while (bus_.stats().pending_events > 0 && !g_context.is_cancelled()) {
            std::this_thread::sleep_for(poll_interval_);
        }
        std::this_thread::sleep_for(poll_interval_);
        const auto stats{bus_.stats()};
        bus_.stop(/*wait=*/true);
        printer_.join();
        log::Info("Event bus summary", {"events", std::to_string(stats.total_events),
                                        "deliveries", std::to_string(stats.total_deliveries),
                                        "dropped", std::to_string(stats.dropped_events),
                                        "rejected", std::to_string(stats.publish_rejections)});
    }

    EventWatch(const EventWatch&) = delete;
    EventWatch& operator=(const EventWatch&) = delete;

    events::EventBus* bus() { return &bus_; }

  private:
    events::EventBus bus_;
    std::chrono::milliseconds poll_interval_;
    std::thread printer_;
};

void do_reindex(db::DataStore& store, const Settings& settings, BlockNum from, std::optional<BlockNum> to,
                const WatchOptions& watch) {
    const auto latest{store.chain().get_latest_height(g_context)};
    ensure_input(latest.has_value(), "no block is stored");
    const BlockNum last{to.value_or(*latest)};
    ensure_input(from <= last, "invalid block range " + BlockNumRange{from, last}.to_string());

    std::optional<EventWatch> event_watch;
    if (watch.enabled) {
        event_watch.emplace(settings.bus, watch);
    }

    index::LogDecoder decoder{index::SignatureRegistry::defaults()};
    index::IndexMaintainer maintainer{store, decoder, event_watch ? event_watch->bus() : nullptr, settings.wbft};
    const BlockNumRange range{from, last};
    log::ProgressLog progress{"Reindexing", range.size()};
    for (BlockNum block_num{from}; block_num <= last; ++block_num) {
        maintainer.reindex(g_context, block_num);
        progress.update(block_num - from + 1, {"height", std::to_string(block_num)});
        if (block_num == kMaxBlockNum) {
            break;
        }
    }
    const auto indexed{maintainer.indexed_height(g_context)};
    progress.finish({"range", range.to_string(), "indexed", indexed ? std::to_string(*indexed) : "none"});
}

void do_unwind(db::DataStore& store, const Settings& settings, BlockNum to) {
    index::LogDecoder decoder{index::SignatureRegistry::defaults()};
    index::IndexMaintainer maintainer{store, decoder, nullptr, settings.wbft};
    auto latest{store.chain().get_latest_height(g_context)};
    log::ProgressLog progress{"Unwinding", latest && *latest > to ? *latest - to : 0};
    uint64_t removed{0};
    while (latest && *latest > to) {
        maintainer.unwind(g_context, *latest);
        progress.update(++removed, {"height", std::to_string(*latest)});
        latest = store.chain().get_latest_height(g_context);
    }
    progress.finish({"latest", latest ? std::to_string(*latest) : "none"});
}

}  // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, sig_handler);
    std::signal(SIGTERM, sig_handler);

    CLI::App cli{"Quarry chain index tool"};
    cli.require_subcommand(1);

    Settings settings;
    cmd::common::add_logging_options(cli, settings.log_settings);
    cmd::common::add_option_data_dir(cli, settings.data_dir);
    cmd::common::add_db_options(cli, settings.store.env);
    cmd::common::add_index_options(cli, settings.store.features, settings.wbft);
    cmd::common::add_bus_options(cli, settings.bus);
    cmd::common::add_query_options(cli, settings.query);
    cli.add_option("--read.workers", settings.store.read_workers, "Threads serving batched transaction reads")
        ->capture_default_str()
        ->check(CLI::Range(1u, 256u));

    auto cmd_status = cli.add_subcommand("status", "Reports the store heights, counters and index families");

    auto cmd_blocks = cli.add_subcommand("blocks", "Lists blocks, latest first unless a number range is given");
    query::BlockFilter block_filter;
    std::string block_miner;
    PageOptions block_page;
    cmd_blocks->add_option("--from", block_filter.number_from, "First block number");
    cmd_blocks->add_option("--to", block_filter.number_to, "Last block number");
    cmd_blocks->add_option("--timestamp.from", block_filter.timestamp_from, "Minimum block timestamp");
    cmd_blocks->add_option("--timestamp.to", block_filter.timestamp_to, "Maximum block timestamp");
    cmd_blocks->add_option("--miner", block_miner, "Block beneficiary")->check(cmd::common::AddressValidator{});
    add_page_options(*cmd_blocks, block_page);

    auto cmd_txs = cli.add_subcommand("txs", "Lists transactions newest first");
    query::TransactionFilter tx_filter;
    std::string tx_sender, tx_recipient;
    PageOptions tx_page;
    cmd_txs->add_option("--from.block", tx_filter.from_block, "First block to scan");
    cmd_txs->add_option("--to.block", tx_filter.to_block, "Last block to scan");
    cmd_txs->add_option("--sender", tx_sender, "Sender address")->check(cmd::common::AddressValidator{});
    cmd_txs->add_option("--recipient", tx_recipient, "Recipient address")->check(cmd::common::AddressValidator{});
    add_page_options(*cmd_txs, tx_page);

    auto cmd_logs = cli.add_subcommand("logs", "Lists logs newest first");
    query::LogFilter log_filter;
    std::vector<std::string> log_emitters, log_topic0;
    PageOptions log_page;
    cmd_logs->add_option("--from.block", log_filter.from_block, "First block to scan");
    cmd_logs->add_option("--to.block", log_filter.to_block, "Last block to scan");
    cmd_logs->add_option("--emitter", log_emitters, "Emitting contract addresses")
        ->delimiter(',')
        ->check(cmd::common::AddressValidator{});
    cmd_logs->add_option("--topic0", log_topic0, "Accepted event signatures")->delimiter(',');
    add_page_options(*cmd_logs, log_page);

    auto cmd_address = cli.add_subcommand("address", "Lists the transactions of an address newest first");
    std::string activity_address;
    PageOptions activity_page;
    cmd_address->add_option("address", activity_address, "The address")
        ->required()
        ->check(cmd::common::AddressValidator{});
    add_page_options(*cmd_address, activity_page);

    auto cmd_proposals = cli.add_subcommand("proposals", "Lists the governance proposals of a system contract");
    std::string proposals_contract, proposals_status;
    PageOptions proposals_page;
    cmd_proposals->add_option("--contract", proposals_contract, "Governance contract address")
        ->required()
        ->check(cmd::common::AddressValidator{});
    cmd_proposals->add_option("--status", proposals_status,
                              "Only proposals in this status (voting, approved, executed, cancelled...)");
    add_page_options(*cmd_proposals, proposals_page);

    auto cmd_reindex = cli.add_subcommand("reindex", "Rebuilds the secondary indexes of stored heights");
    BlockNum reindex_from{0};
    std::optional<BlockNum> reindex_to;
    WatchOptions watch;
    cmd_reindex->add_option("--from", reindex_from, "First height to reindex")->capture_default_str();
    cmd_reindex->add_option("--to", reindex_to, "Last height to reindex, the latest one when omitted");
    cmd_reindex->add_flag("--watch", watch.enabled, "Print the events published for newly indexed heights");
    cmd_reindex->add_option("--watch.types", watch.types, "Event types to print (block, transaction, log...)")
        ->delimiter(',');
    cmd_reindex->add_option("--watch.addresses", watch.addresses, "Addresses the printed events must involve")
        ->delimiter(',')
        ->check(cmd::common::AddressValidator{});

    auto cmd_unwind = cli.add_subcommand("unwind", "Removes every height above the given one");
    BlockNum unwind_to{0};
    cmd_unwind->add_option("--to", unwind_to, "The height to keep as latest")->required();

    CLI11_PARSE(cli, argc, argv);

    try {
        log::init(settings.log_settings);

        DataDirectory data_dir{settings.data_dir, /*create=*/true};
        data_dir.deploy();
        settings.store.env.path = data_dir.chaindata().path().string();
        settings.store.env.create = true;

        db::DataStore store{settings.store};
        const query::QueryEngine engine{store, settings.query};

        if (*cmd_status) {
            do_status(store);
        } else if (*cmd_blocks) {
            if (!block_miner.empty()) {
                block_filter.miner = parse_address(block_miner);
            }
            do_blocks(engine, block_filter, block_page);
        } else if (*cmd_txs) {
            if (!tx_sender.empty()) {
                tx_filter.from = parse_address(tx_sender);
            }
            if (!tx_recipient.empty()) {
                tx_filter.to = parse_address(tx_recipient);
            }
            do_transactions(engine, tx_filter, tx_page);
        } else if (*cmd_logs) {
            for (const auto& hex : log_emitters) {
                log_filter.addresses.push_back(parse_address(hex));
            }
            if (!log_topic0.empty()) {
                auto& position{log_filter.topics.emplace_back()};
                for (const auto& hex : log_topic0) {
                    const auto topic{hex_to_bytes32(hex)};
                    ensure_input(topic.has_value(), "invalid topic " + hex);
                    position.push_back(*topic);
                }
            }
            do_logs(engine, log_filter, log_page);
        } else if (*cmd_address) {
            do_address(engine, parse_address(activity_address), activity_page);
        } else if (*cmd_proposals) {
            std::optional<db::ProposalStatus> status;
            if (!proposals_status.empty()) {
                status = parse_proposal_status(proposals_status);
            }
            do_proposals(engine, parse_address(proposals_contract), status, proposals_page);
        } else if (*cmd_reindex) {
            do_reindex(store, settings, reindex_from, reindex_to, watch);
        } else if (*cmd_unwind) {
            do_unwind(store, settings, unwind_to);
        }
        return 0;
    } catch (const Error& ex) {
        std::cerr << "\n Error (" << magic_enum::enum_name(ex.code()) << ") : " << ex.what() << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "\n Unexpected error : " << ex.what() << std::endl;
    }
    return -1;
}

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "maintainer.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <magic_enum.hpp>

#include <quarry/core/common/error.hpp>
#include <quarry/core/types/address.hpp>
#include <quarry/core/types/evmc_bytes32.hpp>
#include <quarry/db/access_layer.hpp>
#include <quarry/db/util.hpp>
#include <quarry/index/set_code.hpp>
#include <quarry/index/wbft_extra.hpp>
#include <quarry/infra/common/log.hpp>

namespace quarry::index {

namespace {

    template <class T>
    void push_unique(std::vector<T>& values, const T& value) {
        if (std::find(values.begin(), values.end(), value) == values.end()) {
            values.push_back(value);
        }
    }

    //! \brief Puts receipts in transaction order, rejecting receipts not matching the block
    std::vector<Receipt> order_receipts(const Block& block, std::vector<Receipt> receipts) {
        const BlockNum block_num{block.header.number};
        ensure_input(receipts.size() == block.transactions.size(),
                     "block " + std::to_string(block_num) + " has " + std::to_string(block.transactions.size()) +
                         " transactions but " + std::to_string(receipts.size()) + " receipts");

        std::vector<std::optional<Receipt>> slots(block.transactions.size());
        for (auto& receipt : receipts) {
            const auto it{std::find_if(block.transactions.begin(), block.transactions.end(),
                                       [&](const Transaction& txn) { return txn.hash == receipt.tx_hash; })};
            ensure_input(it != block.transactions.end(),
                         "receipt " + to_hex(receipt.tx_hash, true) + " does not belong to block " +
                             std::to_string(block_num));
            auto& slot{slots[static_cast<size_t>(it - block.transactions.begin())]};
            ensure_input(!slot, "duplicate receipt " + to_hex(receipt.tx_hash, true));
            slot = std::move(receipt);
        }

        std::vector<Receipt> ordered;
        ordered.reserve(slots.size());
        for (auto& slot : slots) {
            ordered.push_back(std::move(*slot));
        }
        return ordered;
    }

    //! \brief Binds receipts and their logs to their position in the block
    void bind_locations(const Block& block, std::vector<Receipt>& receipts) {
        for (uint32_t i{0}; i < receipts.size(); ++i) {
            Receipt& receipt{receipts[i]};
            receipt.block_num = block.header.number;
            receipt.block_hash = block.header.hash;
            receipt.tx_index = i;
            receipt.type = block.transactions[i].type;
            for (Log& log : receipt.logs) {
                log.block_num = block.header.number;
                log.block_hash = block.header.hash;
                log.tx_hash = receipt.tx_hash;
                log.tx_index = i;
            }
        }
    }

    //! \brief Addresses whose balance the deltas touch, in order of appearance
    std::vector<evmc::address> touched_addresses(const std::vector<db::BalanceEntry>& deltas) {
        std::vector<evmc::address> addresses;
        for (const auto& delta : deltas) {
            push_unique(addresses, delta.address);
        }
        return addresses;
    }

    std::vector<events::EventPtr> validator_set_events(const BlockHeader& header,
                                                       const std::optional<db::EpochInfo>& previous,
                                                       const db::EpochInfo& announced) {
        const auto before{previous ? validator_addresses(*previous) : std::vector<evmc::address>{}};
        const auto after{validator_addresses(announced)};
        const std::string info{"epoch " + std::to_string(announced.epoch_num)};

        std::vector<events::EventPtr> changes;
        auto add_change = [&](events::ValidatorChange change, const evmc::address& validator) {
            changes.push_back(events::make_event(events::ValidatorSetEvent{
                .block_num = header.number,
                .block_hash = header.hash,
                .change = change,
                .validator = validator,
                .info = info,
                .validator_set_size = static_cast<uint32_t>(after.size()),
            }));
        };
        for (const auto& validator : after) {
            if (std::find(before.begin(), before.end(), validator) == before.end()) {
                add_change(events::ValidatorChange::kAdded, validator);
            }
        }
        for (const auto& validator : before) {
            if (std::find(after.begin(), after.end(), validator) == after.end()) {
                add_change(events::ValidatorChange::kRemoved, validator);
            }
        }
        return changes;
    }

    //! \brief Chain parameter updated by a system event, empty for events that update none
    std::string_view config_parameter(db::SystemEventKind kind) {
        switch (kind) {
            case db::SystemEventKind::kGasTipUpdated:
                return "gasTip";
            case db::SystemEventKind::kQuorumUpdated:
                return "quorum";
            case db::SystemEventKind::kMaxMinterAllowanceUpdated:
                return "maxMinterAllowance";
            case db::SystemEventKind::kMaxProposalsPerMemberUpdated:
                return "maxProposalsPerMember";
            default:
                return {};
        }
    }

}  // namespace

IndexMaintainer::IndexMaintainer(db::DataStore& store, const LogDecoder& decoder, events::EventBus* bus,
                                 WbftSettings wbft_settings, BalanceProvider balance_provider)
    : store_{store},
      decoder_{decoder},
      bus_{bus},
      wbft_settings_{wbft_settings},
      balance_provider_{std::move(balance_provider)} {
    ensure_input(wbft_settings_.epoch_length > 0, "epoch length must be positive");
    store_.chain().attach_index_eraser(this);
}

IndexMaintainer::~IndexMaintainer() {
    store_.chain().detach_index_eraser(this);
}

void IndexMaintainer::ingest(const OperationContext& ctx, const Block& block, std::vector<Receipt> receipts) {
    ctx.throw_if_cancelled();
    ensure_input(decoder_.is_initialized(), "log decoder is not initialized");
    const BlockNum block_num{block.header.number};

    receipts = order_receipts(block, std::move(receipts));
    bind_locations(block, receipts);
    db::derive_receipt_fields(receipts, block.transactions, block.header.base_fee_per_gas);

    std::vector<events::EventPtr> index_events;
    bool replaced{false};
    db::storage_guard("ingest", [&] {
        RWTxn txn{store_.env()};

        const auto previous{db::read_block(txn, block_num)};
        replaced = previous.has_value();
        if (previous && db::read_indexed_block_hash(txn, block_num)) {
            const auto previous_receipts{db::read_receipts(txn, block_num)};
            erase_indexes(txn, *previous, previous_receipts, block.transaction_hashes());
        }

        db::write_block(txn, block);
        for (const auto& receipt : receipts) {
            db::write_receipt(txn, receipt);
        }
        write_indexes(txn, block, receipts, index_events);
        db::mark_block_indexed(txn, block_num, block.header.hash);

        ctx.throw_if_cancelled();
        txn.commit();
    });

    QUARRY_DEBUG_M("Block indexed", {"block", std::to_string(block_num),
                                     "txs", std::to_string(block.transactions.size()),
                                     "replaced", replaced ? "yes" : "no"});

    auto events{chain_events(block, receipts)};
    std::move(index_events.begin(), index_events.end(), std::back_inserter(events));
    publish(std::move(events));
}

void IndexMaintainer::reindex(const OperationContext& ctx, BlockNum block_num) {
    ctx.throw_if_cancelled();
    ensure_input(decoder_.is_initialized(), "log decoder is not initialized");

    std::optional<Block> block;
    std::vector<Receipt> receipts;
    std::vector<events::EventPtr> index_events;
    bool was_indexed{false};
    db::storage_guard("reindex", [&] {
        RWTxn txn{store_.env()};

        block = db::read_block(txn, block_num);
        if (!block) {
            throw Error{ErrorCode::kNotFound, "no block stored at height " + std::to_string(block_num)};
        }
        receipts = db::read_receipts(txn, block_num);
        if (receipts.size() != block->transactions.size()) {
            throw Error{ErrorCode::kNotFound, "receipts missing at height " + std::to_string(block_num)};
        }
        bind_locations(*block, receipts);

        const auto indexed_hash{db::read_indexed_block_hash(txn, block_num)};
        was_indexed = indexed_hash.has_value();
        if (indexed_hash) {
            ensure_stored(*indexed_hash == block->header.hash,
                          "indexed hash of height " + std::to_string(block_num) + " does not match the stored block");
            erase_indexes(txn, *block, receipts, block->transaction_hashes());
        }

        write_indexes(txn, *block, receipts, index_events);
        db::mark_block_indexed(txn, block_num, block->header.hash);

        ctx.throw_if_cancelled();
        txn.commit();
    });

    log::Info("Block reindexed", {"block", std::to_string(block_num), "txs", std::to_string(receipts.size())});

    // Subscribers have already been told about a height indexed before
    if (!was_indexed) {
        auto events{chain_events(*block, receipts)};
        std::move(index_events.begin(), index_events.end(), std::back_inserter(events));
        publish(std::move(events));
    }
}

void IndexMaintainer::unwind(const OperationContext& ctx, BlockNum block_num) {
    ctx.throw_if_cancelled();
    db::storage_guard("unwind", [&] {
        RWTxn txn{store_.env()};

        const auto block{db::read_block(txn, block_num)};
        if (!block) {
            throw Error{ErrorCode::kNotFound, "no block stored at height " + std::to_string(block_num)};
        }
        if (db::read_indexed_block_hash(txn, block_num)) {
            auto receipts{db::read_receipts(txn, block_num)};
            bind_locations(*block, receipts);
            erase_indexes(txn, *block, receipts, /*kept_tx_hashes=*/{});
        }
        (void)db::delete_block(txn, block_num);
        txn.commit();
    });
    log::Info("Block unwound", {"block", std::to_string(block_num)});
}

void IndexMaintainer::erase_height(RWTxn& txn, BlockNum block_num, const std::vector<evmc::bytes32>& kept_tx_hashes) {
    const auto block{db::read_block(txn, block_num)};
    if (!block) {
        return;
    }
    auto receipts{db::read_receipts(txn, block_num)};
    bind_locations(*block, receipts);
    erase_indexes(txn, *block, receipts, kept_tx_hashes);
    QUARRY_DEBUG_M("Block records erased", {"block", std::to_string(block_num)});
}

std::optional<BlockNum> IndexMaintainer::indexed_height(const OperationContext& ctx) const {
    ctx.throw_if_cancelled();
    return db::storage_guard("indexed_height", [&] {
        ROTxn txn{store_.env()};
        return db::read_indexed_height(txn);
    });
}

IndexMaintainer::DerivedRecords IndexMaintainer::derive_records(const Block& block,
                                                                const std::vector<Receipt>& receipts) const {
    const BlockHeader& header{block.header};
    DerivedRecords records;

    for (uint32_t i{0}; i < block.transactions.size(); ++i) {
        const Transaction& txn{block.transactions[i]};
        const Receipt& receipt{receipts[i]};
        const TransactionLocation location{header.number, header.hash, i};

        auto add_participant = [&](const evmc::address& address) {
            const db::AddressTransaction entry{address, header.number, i, txn.hash};
            push_unique(records.address_transactions, entry);
        };
        add_participant(txn.from);
        if (txn.to) {
            add_participant(*txn.to);
        }
        if (txn.fee_payer) {
            add_participant(*txn.fee_payer);
        }

        if (txn.is_contract_creation() && receipt.contract_address) {
            records.contract_creations.push_back(db::ContractCreation{
                .contract_address = *receipt.contract_address,
                .creator = txn.from,
                .tx_hash = txn.hash,
                .block_num = header.number,
                .tx_index = i,
                .timestamp = header.timestamp,
                .bytecode_size = txn.data.size(),
            });
        }

        auto set_code{make_set_code_records(txn, location, &receipt, header.timestamp)};
        std::move(set_code.begin(), set_code.end(), std::back_inserter(records.set_code_authorizations));

        auto deltas{make_balance_deltas(txn, receipt)};
        std::move(deltas.begin(), deltas.end(), std::back_inserter(records.balance_deltas));

        for (const Log& log : receipt.logs) {
            try {
                std::visit(
                    [&](auto&& decoded) {
                        using T = std::decay_t<decltype(decoded)>;
                        if constexpr (std::is_same_v<T, db::Erc20Transfer>) {
                            records.erc20_transfers.push_back(std::move(decoded));
                        } else if constexpr (std::is_same_v<T, db::Erc721Transfer>) {
                            records.erc721_transfers.push_back(std::move(decoded));
                        } else if constexpr (std::is_same_v<T, db::SystemContractEvent>) {
                            records.system_events.push_back(std::move(decoded));
                        }
                    },
                    decoder_.decode(log, header.timestamp));
            } catch (const Error& ex) {
                if (ex.code() != ErrorCode::kDecodeFailure) {
                    throw;
                }
                QUARRY_WARN_M("Skipping undecodable log", {"block", std::to_string(header.number),
                                                           "tx", to_hex(txn.hash, true),
                                                           "log", std::to_string(log.index),
                                                           "error", ex.what()});
            }
        }
    }
    return records;
}

void IndexMaintainer::write_indexes(RWTxn& txn, const Block& block, const std::vector<Receipt>& receipts,
                                    std::vector<events::EventPtr>& events) {
    const auto& capabilities{store_.capabilities()};
    const auto records{derive_records(block, receipts)};

    if (capabilities.address) {
        for (const auto& entry : records.address_transactions) {
            capabilities.address.writer->put_address_transaction(txn, entry);
        }
    }
    if (capabilities.contracts) {
        for (const auto& creation : records.contract_creations) {
            capabilities.contracts.writer->put_contract_creation(txn, creation);
        }
    }
    if (capabilities.tokens) {
        for (const auto& transfer : records.erc20_transfers) {
            capabilities.tokens.writer->put_erc20_transfer(txn, transfer);
        }
        for (const auto& transfer : records.erc721_transfers) {
            capabilities.tokens.writer->put_erc721_transfer(txn, transfer);
        }
    }
    if (capabilities.set_code) {
        for (const auto& record : records.set_code_authorizations) {
            capabilities.set_code.writer->put_set_code_authorization(txn, record);
        }
    }
    if (capabilities.balance_history) {
        seed_balances(txn, records, block.header.number);
        for (const auto& delta : records.balance_deltas) {
            capabilities.balance_history.writer->put_balance_entry(txn, delta);
        }
    }
    if (capabilities.system_contracts) {
        for (const auto& event : records.system_events) {
            capabilities.system_contracts.writer->put_system_event(txn, event);
        }
    }
    if (capabilities.wbft) {
        write_wbft(txn, block.header, events);
    }

    for (const auto& event : records.system_events) {
        events.push_back(events::make_event(events::SystemContractEvent{event}));
        if (const auto parameter{config_parameter(event.kind)}; !parameter.empty()) {
            events.push_back(events::make_event(events::ChainConfigEvent{
                .block_num = event.block_num,
                .block_hash = block.header.hash,
                .parameter = std::string{parameter},
                .old_value = intx::to_string(event.previous_amount),
                .new_value = intx::to_string(event.amount),
            }));
        }
    }
}

void IndexMaintainer::write_wbft(RWTxn& txn, const BlockHeader& header, std::vector<events::EventPtr>& events) {
    if (header.extra_data.empty()) {
        return;
    }
    const auto extra{decode_wbft_extra(header.extra_data)};
    if (!extra) {
        QUARRY_WARN_M("Skipping undecodable WBFT extra data", {"block", std::to_string(header.number),
                                                               "error", std::string{magic_enum::enum_name(extra.error())}});
        return;
    }

    auto& wbft{*store_.capabilities().wbft.writer};
    const uint64_t epoch_length{wbft_settings_.epoch_length};
    const auto announced{announced_epoch(header, *extra, epoch_length)};
    const auto in_force{announced ? announced : wbft.find_epoch_in_force(txn, header.number, epoch_length)};

    db::WbftBlockRecord record;
    std::vector<db::ValidatorSigningActivity> activities;
    std::vector<events::EventPtr> changes;
    try {
        record = make_wbft_block_record(header, *extra, in_force, announced);
        if (in_force) {
            activities = make_signing_activity(header, *extra, *in_force);
        }
        if (announced) {
            const uint64_t epoch_num{announced->epoch_num};
            const auto previous{epoch_num > 0
                                    ? wbft.find_epoch_in_force(txn, epoch_num * epoch_length - 1, epoch_length)
                                    : std::nullopt};
            changes = validator_set_events(header, previous, *announced);
        }
    } catch (const Error& ex) {
        if (ex.code() != ErrorCode::kDecodeFailure) {
            throw;
        }
        QUARRY_WARN_M("Skipping inconsistent WBFT data", {"block", std::to_string(header.number),
                                                          "error", ex.what()});
        return;
    }

    wbft.put_wbft_block(txn, record);
    if (announced) {
        wbft.put_epoch_info(txn, *announced);
    }
    for (const auto& activity : activities) {
        wbft.put_signing_activity(txn, activity);
    }
    std::move(changes.begin(), changes.end(), std::back_inserter(events));
}

void IndexMaintainer::seed_balances(RWTxn& txn, const DerivedRecords& records, BlockNum block_num) {
    if (!balance_provider_) {
        return;
    }
    auto& writer{*store_.capabilities().balance_history.writer};
    for (const auto& address : touched_addresses(records.balance_deltas)) {
        if (writer.has_balance_history(txn, address)) {
            continue;
        }
        const BlockNum before{block_num > 0 ? block_num - 1 : 0};
        auto balance{balance_provider_(address, before)};
        if (!balance) {
            QUARRY_WARN_M("Balance unknown, seeding zero", {"address", address_to_hex(address),
                                                            "block", std::to_string(before)});
            balance = 0;
        }
        writer.put_balance_entry(txn, make_balance_snapshot(address, block_num, *balance));
    }
}

void IndexMaintainer::erase_indexes(RWTxn& txn, const Block& block, const std::vector<Receipt>& receipts,
                                    const std::vector<evmc::bytes32>& kept_tx_hashes) {
    const auto& capabilities{store_.capabilities()};
    if (receipts.size() != block.transactions.size()) {
        QUARRY_WARN_M("Receipts missing, stale records may remain", {"block", std::to_string(block.header.number)});
        return;
    }
    const auto records{derive_records(block, receipts)};

    // Stateful families are reverted newest first
    if (capabilities.wbft) {
        capabilities.wbft.writer->erase_wbft_block(txn, block.header.number, wbft_settings_.epoch_length);
    }
    if (capabilities.system_contracts) {
        for (auto it{records.system_events.rbegin()}; it != records.system_events.rend(); ++it) {
            capabilities.system_contracts.writer->erase_system_event(txn, *it);
        }
    }
    if (capabilities.balance_history) {
        for (const auto& address : touched_addresses(records.balance_deltas)) {
            capabilities.balance_history.writer->erase_balance_entries(txn, address, block.header.number);
        }
    }
    if (capabilities.set_code) {
        for (auto it{records.set_code_authorizations.rbegin()}; it != records.set_code_authorizations.rend(); ++it) {
            capabilities.set_code.writer->erase_set_code_authorization(txn, *it);
        }
    }
    if (capabilities.tokens) {
        for (auto it{records.erc721_transfers.rbegin()}; it != records.erc721_transfers.rend(); ++it) {
            capabilities.tokens.writer->erase_erc721_transfer(txn, *it);
        }
        for (const auto& transfer : records.erc20_transfers) {
            capabilities.tokens.writer->erase_erc20_transfer(txn, transfer);
        }
    }
    if (capabilities.contracts) {
        for (const auto& creation : records.contract_creations) {
            capabilities.contracts.writer->erase_contract_creation(txn, creation);
        }
    }
    if (capabilities.address) {
        for (const auto& entry : records.address_transactions) {
            capabilities.address.writer->erase_address_transaction(txn, entry);
        }
    }
    if (capabilities.internal_transactions) {
        for (const auto& txn_entry : block.transactions) {
            if (std::find(kept_tx_hashes.begin(), kept_tx_hashes.end(), txn_entry.hash) == kept_tx_hashes.end()) {
                capabilities.internal_transactions.writer->erase_internal_transactions(txn, txn_entry.hash);
            }
        }
    }
}

std::vector<events::EventPtr> IndexMaintainer::chain_events(const Block& block,
                                                            const std::vector<Receipt>& receipts) {
    const BlockHeader& header{block.header};
    std::vector<events::EventPtr> events;
    events.push_back(events::make_event(events::BlockEvent{
        .number = header.number,
        .hash = header.hash,
        .parent_hash = header.parent_hash,
        .timestamp = header.timestamp,
        .miner = header.beneficiary,
        .tx_count = block.transactions.size(),
    }));
    for (uint32_t i{0}; i < block.transactions.size(); ++i) {
        const Transaction& txn{block.transactions[i]};
        events.push_back(events::make_event(events::TransactionEvent{
            .hash = txn.hash,
            .block_num = header.number,
            .block_hash = header.hash,
            .index = i,
            .from = txn.from,
            .to = txn.to,
            .value = txn.value,
            .receipt = receipts[i],
        }));
    }
    for (const auto& receipt : receipts) {
        for (const auto& log : receipt.logs) {
            events.push_back(events::make_event(events::LogEvent{log}));
        }
    }
    return events;
}

void IndexMaintainer::publish(std::vector<events::EventPtr> events) {
    if (!bus_) {
        return;
    }
    size_t rejected{0};
    for (auto& event : events) {
        if (!bus_->publish(std::move(event))) {
            ++rejected;
        }
    }
    if (rejected > 0) {
        QUARRY_DEBUG_M("Events not accepted by the bus", {"rejected", std::to_string(rejected),
                                                          "total", std::to_string(events.size())});
    }
}

}  // namespace quarry::index

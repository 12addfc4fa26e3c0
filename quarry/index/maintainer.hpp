// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <quarry/core/types/block.hpp>
#include <quarry/core/types/receipt.hpp>
#include <quarry/db/data_store.hpp>
#include <quarry/db/index/records.hpp>
#include <quarry/events/bus.hpp>
#include <quarry/index/balance.hpp>
#include <quarry/index/log_decoder.hpp>
#include <quarry/infra/concurrency/operation_context.hpp>

namespace quarry::index {

struct WbftSettings {
    uint64_t epoch_length{10};
};

//! \brief Writes the primary data of a height and every enabled secondary index in one write transaction
//! \details Readers either see a height with all of its secondary records or not at all. Two watermarks are kept:
//! the latest height counts heights whose primary data is stored, the indexed height counts heights whose
//! secondary records are complete. Primary data written directly through the chain store only moves the former,
//! reindex() catches up the latter.
//! Undecodable logs and consensus extra data are logged and skipped. A storage failure aborts the whole height
//! leaving both watermarks untouched.
//! Events are published to the bus, if any, after the write transaction has been committed.
//! While alive the maintainer is the index eraser of the chain store, so deleting or replacing an indexed height
//! through the chain store drops its secondary records.
class IndexMaintainer : public db::IndexEraser {
  public:
    //! \param decoder an initialized decoder, owned by the caller
    //! \param bus optional event sink, owned by the caller
    //! \param balance_provider optional source of the balance of an address seen for the first time
    IndexMaintainer(db::DataStore& store, const LogDecoder& decoder, events::EventBus* bus = nullptr,
                    WbftSettings wbft_settings = {}, BalanceProvider balance_provider = {});
    ~IndexMaintainer() override;

    IndexMaintainer(const IndexMaintainer&) = delete;
    IndexMaintainer& operator=(const IndexMaintainer&) = delete;

    //! \brief Stores a block with its receipts and indexes it
    //! \details Re-ingesting a height first removes the secondary records derived from the block it replaces.
    //! \param receipts one receipt per transaction, in any order
    //! \remarks Throws Error{kInvalidInput} if the receipts do not match the transactions of the block
    void ingest(const OperationContext& ctx, const Block& block, std::vector<Receipt> receipts);

    //! \brief Rebuilds the secondary records of an already stored height and marks it as indexed
    //! \remarks Throws Error{kNotFound} if the block or one of its receipts is not stored
    void reindex(const OperationContext& ctx, BlockNum block_num);

    //! \brief Removes a height with every secondary record derived from it, for chain reorganizations
    //! \remarks Throws Error{kNotFound} if no block is stored at block_num
    void unwind(const OperationContext& ctx, BlockNum block_num);

    //! \brief The highest height whose secondary indexes are complete, std::nullopt if none is
    std::optional<BlockNum> indexed_height(const OperationContext& ctx) const;

    void erase_height(RWTxn& txn, BlockNum block_num, const std::vector<evmc::bytes32>& kept_tx_hashes) override;

  private:
    //! \brief Records derived from a block and its receipts, shared by the write and the erase paths
    struct DerivedRecords {
        std::vector<db::AddressTransaction> address_transactions;
        std::vector<db::ContractCreation> contract_creations;
        std::vector<db::Erc20Transfer> erc20_transfers;
        std::vector<db::Erc721Transfer> erc721_transfers;
        std::vector<db::SetCodeAuthorizationRecord> set_code_authorizations;
        std::vector<db::BalanceEntry> balance_deltas;
        std::vector<db::SystemContractEvent> system_events;
    };

    DerivedRecords derive_records(const Block& block, const std::vector<Receipt>& receipts) const;

    void write_indexes(RWTxn& txn, const Block& block, const std::vector<Receipt>& receipts,
                       std::vector<events::EventPtr>& events);
    void erase_indexes(RWTxn& txn, const Block& block, const std::vector<Receipt>& receipts,
                       const std::vector<evmc::bytes32>& kept_tx_hashes);

    void write_wbft(RWTxn& txn, const BlockHeader& header, std::vector<events::EventPtr>& events);
    void seed_balances(RWTxn& txn, const DerivedRecords& records, BlockNum block_num);

    static std::vector<events::EventPtr> chain_events(const Block& block, const std::vector<Receipt>& receipts);
    void publish(std::vector<events::EventPtr> events);

    db::DataStore& store_;
    const LogDecoder& decoder_;
    events::EventBus* bus_;
    WbftSettings wbft_settings_;
    BalanceProvider balance_provider_;
};

}  // namespace quarry::index

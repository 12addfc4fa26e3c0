// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "data_store.hpp"

#include <quarry/db/index/address_index.hpp>
#include <quarry/db/index/balance_index.hpp>
#include <quarry/db/index/contract_index.hpp>
#include <quarry/db/index/internal_tx_index.hpp>
#include <quarry/db/index/setcode_index.hpp>
#include <quarry/db/index/system_contract_index.hpp>
#include <quarry/db/index/token_index.hpp>
#include <quarry/db/index/wbft_index.hpp>
#include <quarry/db/tables.hpp>
#include <quarry/db/util.hpp>
#include <quarry/infra/common/log.hpp>

namespace quarry::db {

namespace {

    template <class Index>
    std::unique_ptr<Index> make_index(bool enabled, ::mdbx::env env) {
        return enabled ? std::make_unique<Index>(env) : nullptr;
    }

    template <class Reader, class Writer, class Index>
    Capability<Reader, Writer> capability_of(const std::unique_ptr<Index>& index) {
        return {index.get(), index.get()};
    }

    std::string enabled_families(const IndexFeatures& features) {
        std::string families;
        const auto add = [&](bool enabled, const char* name) {
            if (!enabled) return;
            if (!families.empty()) families += ",";
            families += name;
        };
        add(features.address, "address");
        add(features.tokens, "tokens");
        add(features.contracts, "contracts");
        add(features.internal_transactions, "internal_transactions");
        add(features.wbft, "wbft");
        add(features.set_code, "set_code");
        add(features.balance_history, "balance_history");
        add(features.system_contracts, "system_contracts");
        return families.empty() ? "none" : families;
    }

}  // namespace

DataStore::DataStore(const DataStoreSettings& settings)
    : env_{storage_guard("open_env", [&] { return open_env(settings.env); })},
      features_{settings.features} {
    if (!settings.env.readonly) {
        storage_guard("create_tables", [&] {
            RWTxn txn{env_};
            table::check_or_create_chaindata_tables(txn);
            txn.commit();
        });
    }

    chain_ = std::make_unique<ChainStore>(env_, settings.read_workers);

    address_index_ = make_index<MdbxAddressIndex>(features_.address, env_);
    token_index_ = make_index<MdbxTokenIndex>(features_.tokens, env_);
    contract_index_ = make_index<MdbxContractIndex>(features_.contracts, env_);
    internal_tx_index_ = make_index<MdbxInternalTransactionIndex>(features_.internal_transactions, env_);
    wbft_index_ = make_index<MdbxWbftIndex>(features_.wbft, env_);
    setcode_index_ = make_index<MdbxSetCodeIndex>(features_.set_code, env_);
    balance_index_ = make_index<MdbxBalanceIndex>(features_.balance_history, env_);
    system_contract_index_ = make_index<MdbxSystemContractIndex>(features_.system_contracts, env_);

    capabilities_.address = capability_of<AddressIndexReader, AddressIndexWriter>(address_index_);
    capabilities_.tokens = capability_of<TokenIndexReader, TokenIndexWriter>(token_index_);
    capabilities_.contracts = capability_of<ContractIndexReader, ContractIndexWriter>(contract_index_);
    capabilities_.internal_transactions =
        capability_of<InternalTransactionIndexReader, InternalTransactionIndexWriter>(internal_tx_index_);
    capabilities_.wbft = capability_of<WbftIndexReader, WbftIndexWriter>(wbft_index_);
    capabilities_.set_code = capability_of<SetCodeIndexReader, SetCodeIndexWriter>(setcode_index_);
    capabilities_.balance_history = capability_of<BalanceIndexReader, BalanceIndexWriter>(balance_index_);
    capabilities_.system_contracts =
        capability_of<SystemContractIndexReader, SystemContractIndexWriter>(system_contract_index_);

    log::Info("Data store opened", {"path", settings.env.inmemory ? "<in-memory>" : settings.env.path,
                                    "readonly", settings.env.readonly ? "true" : "false",
                                    "indexes", enabled_families(features_)});
}

DataStore::~DataStore() {
    chain_.reset();
    log::Info("Data store closed");
}

}  // namespace quarry::db

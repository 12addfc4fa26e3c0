// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <memory>
#include <thread>

#include <quarry/db/chain_store.hpp>
#include <quarry/db/index/capabilities.hpp>
#include <quarry/db/kv/mdbx.hpp>

namespace quarry::db {

class MdbxAddressIndex;
class MdbxTokenIndex;
class MdbxContractIndex;
class MdbxInternalTransactionIndex;
class MdbxWbftIndex;
class MdbxSetCodeIndex;
class MdbxBalanceIndex;
class MdbxSystemContractIndex;

struct DataStoreSettings {
    EnvConfig env;
    IndexFeatures features;
    size_t read_workers{std::max(1u, std::thread::hardware_concurrency() / 2)};
};

//! \brief Owner of the MDBX environment, the chain store and the enabled index families
class DataStore {
  public:
    explicit DataStore(const DataStoreSettings& settings);
    ~DataStore();

    DataStore(const DataStore&) = delete;
    DataStore& operator=(const DataStore&) = delete;

    ChainStore& chain() { return *chain_; }
    const ChainStore& chain() const { return *chain_; }

    //! \brief The index families provided by this store, disabled ones have null reader and writer
    const IndexCapabilities& capabilities() const { return capabilities_; }
    const IndexFeatures& features() const { return features_; }

    //! \brief The environment, for components writing primary and secondary data in one transaction
    ::mdbx::env& env() { return env_; }

  private:
    ::mdbx::env_managed env_;
    IndexFeatures features_;
    std::unique_ptr<ChainStore> chain_;

    std::unique_ptr<MdbxAddressIndex> address_index_;
    std::unique_ptr<MdbxTokenIndex> token_index_;
    std::unique_ptr<MdbxContractIndex> contract_index_;
    std::unique_ptr<MdbxInternalTransactionIndex> internal_tx_index_;
    std::unique_ptr<MdbxWbftIndex> wbft_index_;
    std::unique_ptr<MdbxSetCodeIndex> setcode_index_;
    std::unique_ptr<MdbxBalanceIndex> balance_index_;
    std::unique_ptr<MdbxSystemContractIndex> system_contract_index_;

    IndexCapabilities capabilities_;
};

}  // namespace quarry::db

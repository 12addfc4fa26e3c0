// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <quarry/db/data_store.hpp>
#include <quarry/infra/common/directories.hpp>

namespace quarry::db::test_util {

//! \brief TempStore is a helper resource manager for a temporary directory plus an in-memory data store
//! with all tables created.
//! \remarks TempStore follows the RAII idiom and cleans up its temporary directory upon destruction.
class TempStore {
  public:
    explicit TempStore(const IndexFeatures& features = {}, bool in_memory = true)
        : store_{DataStoreSettings{
              .env = EnvConfig{
                  .path = tmp_dir_.path().string(),
                  .create = true,
                  .inmemory = in_memory,
                  .max_size = 64_Mebi,
                  .growth_size = 4_Mebi,
              },
              .features = features,
              .read_workers = 2,
          }} {}

    // Not copyable nor movable
    TempStore(const TempStore&) = delete;
    TempStore& operator=(const TempStore&) = delete;

    DataStore& operator*() { return store_; }
    DataStore* operator->() { return &store_; }

    ChainStore& chain() { return store_.chain(); }
    const IndexCapabilities& capabilities() const { return store_.capabilities(); }
    ::mdbx::env& env() { return store_.env(); }

  private:
    TemporaryDirectory tmp_dir_;
    DataStore store_;
};

}  // namespace quarry::db::test_util

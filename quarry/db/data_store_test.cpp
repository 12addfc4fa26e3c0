// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "data_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <quarry/core/test_util/sample_blocks.hpp>
#include <quarry/db/test_util/temp_store.hpp>
#include <quarry/infra/common/directories.hpp>

namespace quarry::db {

TEST_CASE("DataStore capabilities follow features", "[db][data_store]") {
    SECTION("all families enabled by default") {
        test_util::TempStore store;
        const auto& caps{store.capabilities()};
        CHECK(caps.address);
        CHECK(caps.tokens);
        CHECK(caps.contracts);
        CHECK(caps.internal_transactions);
        CHECK(caps.wbft);
        CHECK(caps.set_code);
        CHECK(caps.balance_history);
        CHECK(caps.system_contracts);
    }

    SECTION("disabled families have no reader nor writer") {
        IndexFeatures features;
        features.wbft = false;
        features.balance_history = false;
        test_util::TempStore store{features};
        const auto& caps{store.capabilities()};
        CHECK(caps.address);
        CHECK_FALSE(caps.wbft);
        CHECK(caps.wbft.reader == nullptr);
        CHECK(caps.wbft.writer == nullptr);
        CHECK_FALSE(caps.balance_history);
        CHECK(store->features().tokens);
        CHECK_FALSE(store->features().wbft);
    }
}

TEST_CASE("DataStore persists across reopen", "[db][data_store]") {
    TemporaryDirectory tmp_dir;
    const DataStoreSettings settings{
        .env = EnvConfig{
            .path = tmp_dir.path().string(),
            .create = true,
            .max_size = 64_Mebi,
            .growth_size = 4_Mebi,
        },
        .read_workers = 1,
    };
    OperationContext ctx;
    const Block block{quarry::test_util::sample_block(0)};
    {
        DataStore store{settings};
        store.chain().set_block(ctx, block);
    }
    {
        DataStore store{settings};
        CHECK(store.chain().get_block(ctx, 0) == block);
        CHECK(store.chain().get_latest_height(ctx) == 0);
    }
}

}  // namespace quarry::db

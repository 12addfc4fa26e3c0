// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
Composite keys of the index tables.
Every key is made of an entity (address, hash or kind) followed by big endian block number and ordinals,
so a cursor walk over one entity visits its records in chain order.
*/

#include <string>
#include <tuple>
#include <utility>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quarry/core/common/base.hpp>
#include <quarry/core/common/error.hpp>
#include <quarry/db/kv/mdbx.hpp>
#include <quarry/infra/concurrency/operation_context.hpp>

namespace quarry::db {

//! \brief Offset/limit window over an ordered index
struct PageRequest {
    size_t offset{0};
    size_t limit{0};
    bool newest_first{true};
};

Bytes block_key(BlockNum block_num);

Bytes meta_key(std::string_view name);

//! \brief tx hash + ordinal (log index, call index or authorization index)
Bytes hash_ordinal_key(const evmc::bytes32& hash, uint32_t ordinal);
std::tuple<evmc::bytes32, uint32_t> split_hash_ordinal_key(ByteView key);

//! \brief address + block number, the prefix of every per-address key
Bytes address_block_key(const evmc::address& address, BlockNum block_num);

//! \brief address + block number + one ordinal
Bytes address_block_key(const evmc::address& address, BlockNum block_num, uint32_t ordinal);

//! \brief address + block number + two ordinals
Bytes address_block_key(const evmc::address& address, BlockNum block_num, uint32_t ordinal, uint32_t sub_ordinal);

//! \brief Extracts the block number following the address in any per-address key
BlockNum address_key_block_num(ByteView key);

//! \brief contract address + token id
Bytes token_key(const evmc::address& contract, const intx::uint256& token_id);

//! \brief owner address + contract address + token id
Bytes owned_token_key(const evmc::address& owner, const evmc::address& contract, const intx::uint256& token_id);

//! \brief kind + block number (+ log index)
Bytes kind_block_key(uint8_t kind, BlockNum block_num);
Bytes kind_block_key(uint8_t kind, BlockNum block_num, uint32_t log_index);

inline mdbx::slice to_slice(const evmc::bytes32& value) {
    return to_slice(ByteView{value.bytes, kHashLength});
}

inline mdbx::slice to_slice(const evmc::address& address) {
    return to_slice(ByteView{address.bytes, kAddressLength});
}

inline ByteView address_view(const evmc::address& address) { return {address.bytes, kAddressLength}; }

evmc::address address_from_view(ByteView data);
evmc::bytes32 hash_from_view(ByteView data);

//! \brief Walks the records with key in [first_key, last_key] (last_key compared as a prefix), skipping the first
//! page.offset ones and stopping after page.limit ones (0 means no limit)
//! \remarks Throws Error{kCancelled} between two records when ctx gets cancelled
//! \return The number of records passed to the walker
size_t cursor_for_page(const OperationContext& ctx, ::mdbx::cursor& cursor, ByteView first_key, ByteView last_key,
                       const PageRequest& page, WalkFuncRef walker);

//! \brief Counts the records with key in [first_key, last_key] (last_key compared as a prefix)
size_t cursor_count_range(const OperationContext& ctx, ::mdbx::cursor& cursor, ByteView first_key, ByteView last_key);

//! \brief Runs func translating MDBX failures into Error{kStorageUnavailable}
template <class Func>
auto storage_guard(std::string_view operation, Func&& func) -> decltype(func()) {
    try {
        return std::forward<Func>(func)();
    } catch (const ::mdbx::exception& ex) {
        throw Error{ErrorCode::kStorageUnavailable, std::string{operation} + ": " + ex.what()};
    }
}

}  // namespace quarry::db

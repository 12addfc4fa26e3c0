// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <cstring>

#include <quarry/core/common/endian.hpp>

namespace quarry::db {

namespace {

    Bytes with_address(const evmc::address& address) { return Bytes{address.bytes, kAddressLength}; }

}  // namespace

Bytes block_key(BlockNum block_num) {
    Bytes key;
    endian::append_big_u64(key, block_num);
    return key;
}

Bytes meta_key(std::string_view name) {
    return Bytes{reinterpret_cast<const uint8_t*>(name.data()), name.size()};
}

Bytes hash_ordinal_key(const evmc::bytes32& hash, uint32_t ordinal) {
    Bytes key{hash.bytes, kHashLength};
    endian::append_big_u32(key, ordinal);
    return key;
}

std::tuple<evmc::bytes32, uint32_t> split_hash_ordinal_key(ByteView key) {
    ensure_input(key.size() == kHashLength + sizeof(uint32_t), "invalid hash ordinal key size");
    return {hash_from_view(key.substr(0, kHashLength)), endian::load_big_u32(&key[kHashLength])};
}

Bytes address_block_key(const evmc::address& address, BlockNum block_num) {
    Bytes key{with_address(address)};
    endian::append_big_u64(key, block_num);
    return key;
}

Bytes address_block_key(const evmc::address& address, BlockNum block_num, uint32_t ordinal) {
    Bytes key{address_block_key(address, block_num)};
    endian::append_big_u32(key, ordinal);
    return key;
}

Bytes address_block_key(const evmc::address& address, BlockNum block_num, uint32_t ordinal, uint32_t sub_ordinal) {
    Bytes key{address_block_key(address, block_num, ordinal)};
    endian::append_big_u32(key, sub_ordinal);
    return key;
}

BlockNum address_key_block_num(ByteView key) {
    ensure_input(key.size() >= kAddressLength + sizeof(BlockNum), "invalid address key size");
    return endian::load_big_u64(&key[kAddressLength]);
}

Bytes token_key(const evmc::address& contract, const intx::uint256& token_id) {
    Bytes key{with_address(contract)};
    endian::append_big_u256(key, token_id);
    return key;
}

Bytes owned_token_key(const evmc::address& owner, const evmc::address& contract, const intx::uint256& token_id) {
    Bytes key{with_address(owner)};
    key.append(token_key(contract, token_id));
    return key;
}

Bytes kind_block_key(uint8_t kind, BlockNum block_num) {
    Bytes key(1, kind);
    endian::append_big_u64(key, block_num);
    return key;
}

Bytes kind_block_key(uint8_t kind, BlockNum block_num, uint32_t log_index) {
    Bytes key{kind_block_key(kind, block_num)};
    endian::append_big_u32(key, log_index);
    return key;
}

evmc::address address_from_view(ByteView data) {
    ensure_input(data.size() >= kAddressLength, "invalid address size");
    evmc::address address;
    std::memcpy(address.bytes, data.data(), kAddressLength);
    return address;
}

evmc::bytes32 hash_from_view(ByteView data) {
    ensure_input(data.size() >= kHashLength, "invalid hash size");
    evmc::bytes32 hash;
    std::memcpy(hash.bytes, data.data(), kHashLength);
    return hash;
}

size_t cursor_for_page(const OperationContext& ctx, ::mdbx::cursor& cursor, ByteView first_key, ByteView last_key,
                       const PageRequest& page, WalkFuncRef walker) {
    size_t skipped{0};
    size_t taken{0};
    const auto direction{page.newest_first ? CursorMoveDirection::kReverse : CursorMoveDirection::kForward};
    cursor_for_range(
        cursor, first_key, last_key,
        [&](ByteView key, ByteView value) {
            ctx.throw_if_cancelled();
            if (skipped < page.offset) {
                ++skipped;
                return true;
            }
            if (!walker(key, value)) {
                return false;
            }
            ++taken;
            return page.limit == 0 || taken < page.limit;
        },
        direction);
    return taken;
}

size_t cursor_count_range(const OperationContext& ctx, ::mdbx::cursor& cursor, ByteView first_key,
                          ByteView last_key) {
    return cursor_for_range(cursor, first_key, last_key, [&](ByteView, ByteView) {
        ctx.throw_if_cancelled();
        return true;
    });
}

}  // namespace quarry::db

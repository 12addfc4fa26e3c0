// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "setcode_index.hpp"

#include <algorithm>

#include <quarry/core/common/endian.hpp>
#include <quarry/core/types/address.hpp>
#include <quarry/db/tables.hpp>

namespace quarry::db {

namespace {

    constexpr size_t kAddressIndexKeySize{kAddressLength + sizeof(BlockNum) + 2 * sizeof(uint32_t)};

    std::optional<SetCodeAuthorizationRecord> find_authorization(::mdbx::cursor& primary, ByteView key) {
        auto data{primary.find(to_slice(key), /*throw_notfound=*/false)};
        if (!data.done) {
            return std::nullopt;
        }
        return decode_record<SetCodeAuthorizationRecord>(from_slice(data.value), table::kSetCodeAuthorizations.name);
    }

    //! \brief Primary key referenced by an entry of the by-target or by-authority index
    Bytes primary_key_of(ByteView index_key, ByteView index_value) {
        ensure_stored(index_key.size() == kAddressIndexKeySize, "invalid key in set-code address index");
        const uint32_t auth_index{endian::load_big_u32(&index_key[kAddressIndexKeySize - sizeof(uint32_t)])};
        return hash_ordinal_key(hash_from_view(index_value), auth_index);
    }

    std::vector<SetCodeAuthorizationRecord> read_by_address(const OperationContext& ctx, ROTxn& txn,
                                                            const MapConfig& index_config,
                                                            const evmc::address& address, const PageRequest& page) {
        auto index{open_cursor(txn, index_config)};
        auto primary{open_cursor(txn, table::kSetCodeAuthorizations)};
        std::vector<SetCodeAuthorizationRecord> records;
        cursor_for_page(ctx, index, address_view(address), address_view(address), page,
                        [&](ByteView key, ByteView value) {
                            auto record{find_authorization(primary, primary_key_of(key, value))};
                            if (record) {
                                records.push_back(std::move(*record));
                            }
                            return true;
                        });
        return records;
    }

    std::optional<AddressDelegationState> read_delegation_state(ROTxn& txn, const evmc::address& address) {
        auto cursor{open_cursor(txn, table::kDelegationStates)};
        auto data{cursor.find(to_slice(address), /*throw_notfound=*/false)};
        if (!data.done) {
            return std::nullopt;
        }
        return decode_record<AddressDelegationState>(from_slice(data.value), table::kDelegationStates.name);
    }

    void write_delegation_state(RWTxn& txn, const evmc::address& authority,
                                const SetCodeAuthorizationRecord& record) {
        AddressDelegationState state{
            .address = authority,
            .last_updated_block = record.block_num,
            .last_updated_tx_hash = record.tx_hash,
        };
        // Delegating to the zero address resets the account code
        if (record.target != kZeroAddress) {
            state.target = record.target;
        }
        auto cursor{open_cursor(txn, table::kDelegationStates)};
        cursor.upsert(to_slice(authority), to_slice(encode_record(state)));
    }

    //! \brief Block number of the most recent entry of address in an address index
    std::optional<BlockNum> last_activity(ROTxn& txn, const MapConfig& config, const evmc::address& address) {
        auto cursor{open_cursor(txn, config)};
        std::optional<BlockNum> block_num;
        cursor_for_range(
            cursor, address_view(address), address_view(address),
            [&](ByteView key, ByteView) {
                block_num = address_key_block_num(key);
                return false;
            },
            CursorMoveDirection::kReverse);
        return block_num;
    }

}  // namespace

std::optional<SetCodeAuthorizationRecord> MdbxSetCodeIndex::get_set_code_authorization(
    const OperationContext&, const evmc::bytes32& tx_hash, uint32_t auth_index) const {
    return storage_guard("get_set_code_authorization", [&] {
        ROTxn txn{env_};
        auto primary{open_cursor(txn, table::kSetCodeAuthorizations)};
        return find_authorization(primary, hash_ordinal_key(tx_hash, auth_index));
    });
}

std::vector<SetCodeAuthorizationRecord> MdbxSetCodeIndex::get_set_code_authorizations(
    const OperationContext& ctx, const evmc::bytes32& tx_hash) const {
    return storage_guard("get_set_code_authorizations", [&] {
        ROTxn txn{env_};
        auto primary{open_cursor(txn, table::kSetCodeAuthorizations)};
        std::vector<SetCodeAuthorizationRecord> records;
        cursor_for_prefix(primary, ByteView{tx_hash.bytes, kHashLength}, [&](ByteView, ByteView value) {
            ctx.throw_if_cancelled();
            records.push_back(decode_record<SetCodeAuthorizationRecord>(value, table::kSetCodeAuthorizations.name));
            return true;
        });
        return records;
    });
}

std::vector<SetCodeAuthorizationRecord> MdbxSetCodeIndex::get_set_code_authorizations_by_target(
    const OperationContext& ctx, const evmc::address& target, const PageRequest& page) const {
    return storage_guard("get_set_code_authorizations_by_target", [&] {
        ROTxn txn{env_};
        return read_by_address(ctx, txn, table::kSetCodeByTarget, target, page);
    });
}

std::vector<SetCodeAuthorizationRecord> MdbxSetCodeIndex::get_set_code_authorizations_by_authority(
    const OperationContext& ctx, const evmc::address& authority, const PageRequest& page) const {
    return storage_guard("get_set_code_authorizations_by_authority", [&] {
        ROTxn txn{env_};
        return read_by_address(ctx, txn, table::kSetCodeByAuthority, authority, page);
    });
}

uint64_t MdbxSetCodeIndex::count_set_code_authorizations_by_target(const OperationContext& ctx,
                                                                   const evmc::address& target) const {
    return storage_guard("count_set_code_authorizations_by_target", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kSetCodeByTarget)};
        return static_cast<uint64_t>(cursor_count_range(ctx, cursor, address_view(target), address_view(target)));
    });
}

uint64_t MdbxSetCodeIndex::count_set_code_authorizations_by_authority(const OperationContext& ctx,
                                                                      const evmc::address& authority) const {
    return storage_guard("count_set_code_authorizations_by_authority", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kSetCodeByAuthority)};
        return static_cast<uint64_t>(
            cursor_count_range(ctx, cursor, address_view(authority), address_view(authority)));
    });
}

std::optional<AddressDelegationState> MdbxSetCodeIndex::get_delegation_state(const OperationContext&,
                                                                             const evmc::address& address) const {
    return storage_guard("get_delegation_state", [&] {
        ROTxn txn{env_};
        return read_delegation_state(txn, address);
    });
}

AddressSetCodeStats MdbxSetCodeIndex::get_set_code_stats(const OperationContext& ctx,
                                                         const evmc::address& address) const {
    return storage_guard("get_set_code_stats", [&] {
        ROTxn txn{env_};
        AddressSetCodeStats stats{.address = address};

        auto by_target{open_cursor(txn, table::kSetCodeByTarget)};
        stats.as_target_count = cursor_count_range(ctx, by_target, address_view(address), address_view(address));
        auto by_authority{open_cursor(txn, table::kSetCodeByAuthority)};
        stats.as_authority_count =
            cursor_count_range(ctx, by_authority, address_view(address), address_view(address));

        if (const auto state{read_delegation_state(txn, address)}; state) {
            stats.current_delegation = state->target;
        }
        const auto last_as_target{last_activity(txn, table::kSetCodeByTarget, address)};
        const auto last_as_authority{last_activity(txn, table::kSetCodeByAuthority, address)};
        stats.last_activity_block = std::max(last_as_target.value_or(0), last_as_authority.value_or(0));
        return stats;
    });
}

void MdbxSetCodeIndex::put_set_code_authorization(RWTxn& txn, const SetCodeAuthorizationRecord& record) {
    auto primary{open_cursor(txn, table::kSetCodeAuthorizations)};
    primary.upsert(to_slice(hash_ordinal_key(record.tx_hash, record.auth_index)), to_slice(encode_record(record)));

    auto by_target{open_cursor(txn, table::kSetCodeByTarget)};
    by_target.upsert(to_slice(address_block_key(record.target, record.block_num, record.tx_index, record.auth_index)),
                     to_slice(record.tx_hash));

    if (!record.authority) {
        return;
    }
    auto by_authority{open_cursor(txn, table::kSetCodeByAuthority)};
    by_authority.upsert(
        to_slice(address_block_key(*record.authority, record.block_num, record.tx_index, record.auth_index)),
        to_slice(record.tx_hash));

    if (!record.applied) {
        return;
    }
    const auto state{read_delegation_state(txn, *record.authority)};
    if (state && state->last_updated_block > record.block_num) {
        return;
    }
    write_delegation_state(txn, *record.authority, record);
}

void MdbxSetCodeIndex::erase_set_code_authorization(RWTxn& txn, const SetCodeAuthorizationRecord& record) {
    auto primary{open_cursor(txn, table::kSetCodeAuthorizations)};
    (void)primary.erase(to_slice(hash_ordinal_key(record.tx_hash, record.auth_index)));

    auto by_target{open_cursor(txn, table::kSetCodeByTarget)};
    (void)by_target.erase(
        to_slice(address_block_key(record.target, record.block_num, record.tx_index, record.auth_index)));

    if (!record.authority) {
        return;
    }
    const evmc::address& authority{*record.authority};
    auto by_authority{open_cursor(txn, table::kSetCodeByAuthority)};
    (void)by_authority.erase(
        to_slice(address_block_key(authority, record.block_num, record.tx_index, record.auth_index)));

    const auto state{read_delegation_state(txn, authority)};
    if (!state || state->last_updated_tx_hash != record.tx_hash) {
        return;
    }

    // Delegation goes back to the most recent remaining applied authorization
    std::optional<SetCodeAuthorizationRecord> previous;
    cursor_for_range(
        by_authority, address_view(authority), address_view(authority),
        [&](ByteView key, ByteView value) {
            auto candidate{find_authorization(primary, primary_key_of(key, value))};
            if (candidate && candidate->applied) {
                previous = std::move(candidate);
                return false;
            }
            return true;
        },
        CursorMoveDirection::kReverse);

    if (previous) {
        write_delegation_state(txn, authority, *previous);
    } else {
        auto states{open_cursor(txn, table::kDelegationStates)};
        (void)states.erase(to_slice(authority));
    }
}

}  // namespace quarry::db

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "balance_index.hpp"

#include <algorithm>

#include <quarry/core/types/address.hpp>
#include <quarry/db/tables.hpp>
#include <quarry/infra/common/log.hpp>

namespace quarry::db {

namespace {

    void apply_entry(intx::uint256& balance, const BalanceEntry& entry) {
        if (entry.kind == BalanceEntry::Kind::kSnapshot) {
            balance += entry.amount;
        } else if (entry.negative) {
            balance -= entry.amount;
        } else {
            balance += entry.amount;
        }
    }

    bool is_negative(const intx::uint256& balance) { return (balance >> 255) != 0; }

    //! \brief Sums the entries of address from the nearest snapshot up to last_key included
    intx::uint256 balance_through(const OperationContext& ctx, ::mdbx::cursor& cursor, const evmc::address& address,
                                  ByteView last_key) {
        intx::uint256 balance{0};
        cursor_for_range(
            cursor, address_view(address), last_key,
            [&](ByteView, ByteView value) {
                ctx.throw_if_cancelled();
                const auto entry{decode_record<BalanceEntry>(value, table::kBalanceHistory.name)};
                apply_entry(balance, entry);
                return entry.kind != BalanceEntry::Kind::kSnapshot;
            },
            CursorMoveDirection::kReverse);
        return balance;
    }

    intx::uint256 clamp_negative(const intx::uint256& balance, const evmc::address& address) {
        if (is_negative(balance)) {
            QUARRY_WARN_M("Negative balance computed, reporting zero", {"address", address_to_hex(address)});
            return 0;
        }
        return balance;
    }

}  // namespace

intx::uint256 MdbxBalanceIndex::get_balance(const OperationContext& ctx, const evmc::address& address,
                                            BlockNum block_num) const {
    return storage_guard("get_balance", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kBalanceHistory)};
        return clamp_negative(balance_through(ctx, cursor, address, address_block_key(address, block_num)), address);
    });
}

std::vector<BalanceSnapshot> MdbxBalanceIndex::get_balance_history(const OperationContext& ctx,
                                                                   const evmc::address& address,
                                                                   BlockNumRange range,
                                                                   const PageRequest& page) const {
    ensure_input(range.start <= range.end, "invalid block range " + range.to_string());
    return storage_guard("get_balance_history", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kBalanceHistory)};

        std::vector<std::pair<Bytes, BalanceEntry>> entries;
        cursor_for_page(ctx, cursor, address_block_key(address, range.start), address_block_key(address, range.end),
                        page, [&](ByteView key, ByteView value) {
                            entries.emplace_back(Bytes{key},
                                                 decode_record<BalanceEntry>(value, table::kBalanceHistory.name));
                            return true;
                        });
        if (entries.empty()) {
            return std::vector<BalanceSnapshot>{};
        }
        if (page.newest_first) {
            std::reverse(entries.begin(), entries.end());
        }

        // Entries of a page are contiguous, so the running balance only needs one lookback
        intx::uint256 running{balance_through(ctx, cursor, address, entries.front().first)};
        std::vector<BalanceSnapshot> history;
        history.reserve(entries.size());
        for (size_t i{0}; i < entries.size(); ++i) {
            const auto& entry{entries[i].second};
            if (i > 0) {
                if (entry.kind == BalanceEntry::Kind::kSnapshot) {
                    running = 0;
                }
                apply_entry(running, entry);
            }
            const bool is_delta{entry.kind == BalanceEntry::Kind::kDelta};
            history.push_back(BalanceSnapshot{
                .block_num = entry.block_num,
                .balance = is_negative(running) ? intx::uint256{0} : running,
                .negative_delta = is_delta && entry.negative,
                .delta = is_delta ? entry.amount : intx::uint256{0},
                .tx_hash = entry.tx_hash,
            });
        }
        if (page.newest_first) {
            std::reverse(history.begin(), history.end());
        }
        return history;
    });
}

uint64_t MdbxBalanceIndex::count_balance_history(const OperationContext& ctx, const evmc::address& address,
                                                 BlockNumRange range) const {
    ensure_input(range.start <= range.end, "invalid block range " + range.to_string());
    return storage_guard("count_balance_history", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kBalanceHistory)};
        return static_cast<uint64_t>(cursor_count_range(ctx, cursor, address_block_key(address, range.start),
                                                        address_block_key(address, range.end)));
    });
}

bool MdbxBalanceIndex::has_balance_history(ROTxn& txn, const evmc::address& address) const {
    auto cursor{open_cursor(txn, table::kBalanceHistory)};
    auto data{cursor.lower_bound(to_slice(address), /*throw_notfound=*/false)};
    return data.done && from_slice(data.key).starts_with(address_view(address));
}

void MdbxBalanceIndex::put_balance_entry(RWTxn& txn, const BalanceEntry& entry) {
    auto cursor{open_cursor(txn, table::kBalanceHistory)};
    cursor.upsert(to_slice(address_block_key(entry.address, entry.block_num, entry.sequence)),
                  to_slice(encode_record(entry)));
}

void MdbxBalanceIndex::erase_balance_entries(RWTxn& txn, const evmc::address& address, BlockNum block_num) {
    auto cursor{open_cursor(txn, table::kBalanceHistory)};
    cursor_erase_prefix(cursor, address_block_key(address, block_num));
}

}  // namespace quarry::db

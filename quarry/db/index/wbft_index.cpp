// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "wbft_index.hpp"

#include <algorithm>

#include <quarry/db/tables.hpp>

namespace quarry::db {

namespace {

    template <class T>
    std::optional<T> find_record(::mdbx::cursor& cursor, const MapConfig& config, ByteView key) {
        auto data{cursor.find(to_slice(key), /*throw_notfound=*/false)};
        if (!data.done) {
            return std::nullopt;
        }
        return decode_record<T>(from_slice(data.value), config.name);
    }

    //! \brief Adds (sign = 1) or removes (sign = -1) the contribution of one activity to the counters
    void apply_activity(ValidatorSigningStats& stats, const ValidatorSigningActivity& activity, int sign) {
        const auto adjust = [sign](uint64_t& counter) {
            if (sign > 0) {
                ++counter;
            } else if (counter > 0) {
                --counter;
            }
        };
        adjust(activity.signed_prepare ? stats.prepare_sign_count : stats.prepare_miss_count);
        adjust(activity.signed_commit ? stats.commit_sign_count : stats.commit_miss_count);
    }

    bool has_no_activity(const ValidatorSigningStats& stats) {
        return stats.prepare_sign_count + stats.prepare_miss_count + stats.commit_sign_count +
                   stats.commit_miss_count ==
               0;
    }

    std::vector<evmc::address> validator_addresses(const EpochInfo& info) {
        std::vector<evmc::address> addresses;
        addresses.reserve(info.validators.size());
        for (const uint32_t index : info.validators) {
            if (index < info.candidates.size()) {
                addresses.push_back(info.candidates[index].address);
            }
        }
        return addresses;
    }

}  // namespace

std::optional<WbftBlockRecord> MdbxWbftIndex::get_wbft_block(const OperationContext&, BlockNum block_num) const {
    return storage_guard("get_wbft_block", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kWbftBlocks)};
        return find_record<WbftBlockRecord>(cursor, table::kWbftBlocks, block_key(block_num));
    });
}

std::optional<EpochInfo> MdbxWbftIndex::get_epoch_info(const OperationContext&, uint64_t epoch_num) const {
    return storage_guard("get_epoch_info", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kWbftEpochs)};
        return find_record<EpochInfo>(cursor, table::kWbftEpochs, block_key(epoch_num));
    });
}

std::optional<EpochInfo> MdbxWbftIndex::get_latest_epoch_info(const OperationContext&) const {
    return storage_guard("get_latest_epoch_info", [&]() -> std::optional<EpochInfo> {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kWbftEpochs)};
        auto data{cursor.to_last(/*throw_notfound=*/false)};
        if (!data.done) {
            return std::nullopt;
        }
        return decode_record<EpochInfo>(from_slice(data.value), table::kWbftEpochs.name);
    });
}

std::optional<ValidatorSigningStats> MdbxWbftIndex::get_validator_stats(const OperationContext&,
                                                                        const evmc::address& validator) const {
    return storage_guard("get_validator_stats", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kValidatorStats)};
        return find_record<ValidatorSigningStats>(cursor, table::kValidatorStats, address_view(validator));
    });
}

std::vector<ValidatorSigningStats> MdbxWbftIndex::get_all_validator_stats(const OperationContext& ctx) const {
    return storage_guard("get_all_validator_stats", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kValidatorStats)};
        std::vector<ValidatorSigningStats> all_stats;
        cursor_for_each(cursor, [&](ByteView, ByteView value) {
            ctx.throw_if_cancelled();
            all_stats.push_back(decode_record<ValidatorSigningStats>(value, table::kValidatorStats.name));
            return true;
        });
        return all_stats;
    });
}

std::vector<ValidatorSigningActivity> MdbxWbftIndex::get_validator_activity(const OperationContext& ctx,
                                                                            const evmc::address& validator,
                                                                            BlockNumRange range,
                                                                            const PageRequest& page) const {
    ensure_input(range.start <= range.end, "invalid block range " + range.to_string());
    return storage_guard("get_validator_activity", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kValidatorActivity)};
        std::vector<ValidatorSigningActivity> activities;
        cursor_for_page(ctx, cursor, address_block_key(validator, range.start),
                        address_block_key(validator, range.end), page, [&](ByteView, ByteView value) {
                            activities.push_back(
                                decode_record<ValidatorSigningActivity>(value, table::kValidatorActivity.name));
                            return true;
                        });
        return activities;
    });
}

uint64_t MdbxWbftIndex::count_validator_activity(const OperationContext& ctx, const evmc::address& validator,
                                                 BlockNumRange range) const {
    ensure_input(range.start <= range.end, "invalid block range " + range.to_string());
    return storage_guard("count_validator_activity", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kValidatorActivity)};
        return static_cast<uint64_t>(cursor_count_range(ctx, cursor, address_block_key(validator, range.start),
                                                        address_block_key(validator, range.end)));
    });
}

std::optional<EpochInfo> MdbxWbftIndex::find_epoch_in_force(ROTxn& txn, BlockNum block_num,
                                                            uint64_t epoch_length) const {
    ensure_input(epoch_length > 0, "epoch length must be positive");
    auto cursor{open_cursor(txn, table::kWbftEpochs)};
    std::optional<EpochInfo> info;
    cursor_for_range(
        cursor, block_key(0), block_key(block_num / epoch_length),
        [&](ByteView, ByteView value) {
            info = decode_record<EpochInfo>(value, table::kWbftEpochs.name);
            return false;
        },
        CursorMoveDirection::kReverse);
    return info;
}

void MdbxWbftIndex::put_wbft_block(RWTxn& txn, const WbftBlockRecord& record) {
    auto cursor{open_cursor(txn, table::kWbftBlocks)};
    cursor.upsert(to_slice(block_key(record.block_num)), to_slice(encode_record(record)));
}

void MdbxWbftIndex::put_epoch_info(RWTxn& txn, const EpochInfo& info) {
    auto cursor{open_cursor(txn, table::kWbftEpochs)};
    cursor.upsert(to_slice(block_key(info.epoch_num)), to_slice(encode_record(info)));
}

void MdbxWbftIndex::put_signing_activity(RWTxn& txn, const ValidatorSigningActivity& activity) {
    auto activities{open_cursor(txn, table::kValidatorActivity)};
    const auto activity_key{address_block_key(activity.validator, activity.block_num)};
    const auto previous{find_record<ValidatorSigningActivity>(activities, table::kValidatorActivity, activity_key)};
    activities.upsert(to_slice(activity_key), to_slice(encode_record(activity)));

    auto stats_cursor{open_cursor(txn, table::kValidatorStats)};
    auto stats{find_record<ValidatorSigningStats>(stats_cursor, table::kValidatorStats,
                                                  address_view(activity.validator))};
    if (!stats) {
        stats = ValidatorSigningStats{
            .validator = activity.validator,
            .from_block = activity.block_num,
            .to_block = activity.block_num,
        };
    }
    if (previous) {
        apply_activity(*stats, *previous, -1);
    }
    apply_activity(*stats, activity, +1);
    stats->validator_index = activity.validator_index;
    stats->from_block = std::min(stats->from_block, activity.block_num);
    stats->to_block = std::max(stats->to_block, activity.block_num);
    stats_cursor.upsert(to_slice(activity.validator), to_slice(encode_record(*stats)));
}

void MdbxWbftIndex::erase_wbft_block(RWTxn& txn, BlockNum block_num, uint64_t epoch_length) {
    auto blocks{open_cursor(txn, table::kWbftBlocks)};
    const auto key{block_key(block_num)};
    const auto record{find_record<WbftBlockRecord>(blocks, table::kWbftBlocks, key)};
    if (!record) {
        return;
    }

    // Activities were recorded against the validator set in force when the block got indexed
    const auto in_force{record->epoch_info ? record->epoch_info : find_epoch_in_force(txn, block_num, epoch_length)};
    if (in_force) {
        auto activities{open_cursor(txn, table::kValidatorActivity)};
        auto stats_cursor{open_cursor(txn, table::kValidatorStats)};
        for (const auto& validator : validator_addresses(*in_force)) {
            const auto activity_key{address_block_key(validator, block_num)};
            const auto activity{
                find_record<ValidatorSigningActivity>(activities, table::kValidatorActivity, activity_key)};
            if (!activity) {
                continue;
            }
            (void)activities.erase(to_slice(activity_key));

            auto stats{
                find_record<ValidatorSigningStats>(stats_cursor, table::kValidatorStats, address_view(validator))};
            if (!stats) {
                continue;
            }
            apply_activity(*stats, *activity, -1);
            if (has_no_activity(*stats)) {
                (void)stats_cursor.erase(to_slice(validator));
                continue;
            }
            if (stats->to_block == block_num && block_num > stats->from_block) {
                stats->to_block = block_num - 1;
            }
            stats_cursor.upsert(to_slice(validator), to_slice(encode_record(*stats)));
        }
    }

    if (record->epoch_info) {
        auto epochs{open_cursor(txn, table::kWbftEpochs)};
        const auto epoch_key{block_key(record->epoch_info->epoch_num)};
        const auto stored{find_record<EpochInfo>(epochs, table::kWbftEpochs, epoch_key)};
        if (stored && stored->block_num == block_num) {
            (void)epochs.erase(to_slice(epoch_key));
        }
    }
    (void)blocks.erase(to_slice(key));
}

}  // namespace quarry::db

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "mdbx.hpp"

#include <stdexcept>

#include <quarry/core/common/util.hpp>

namespace quarry::db {

namespace detail {

    //! \brief Returns data of current cursor position or moves it to the beginning or the end of the table based on
    //! provided direction if the cursor is not positioned.
    static ::mdbx::cursor::move_result adjust_cursor_position_if_unpositioned_and_return_data(
        ::mdbx::cursor& c, CursorMoveDirection d) {
        // Warning: eof() is not exactly what we need here since it returns true not only for cursors
        // that are not positioned, but also for those pointing to the end of data.
        // Unfortunately, there's no MDBX API to differentiate the two.
        if (c.eof()) {
            return (d == CursorMoveDirection::kForward) ? c.to_first(/*throw_notfound=*/false)
                                                        : c.to_last(/*throw_notfound=*/false);
        }
        return c.current(/*throw_notfound=*/false);
    }

    static ::mdbx::cursor::move_operation move_operation_for(CursorMoveDirection d) {
        return d == CursorMoveDirection::kForward ? ::mdbx::cursor::move_operation::next
                                                  : ::mdbx::cursor::move_operation::previous;
    }

    //! \brief Computes the smallest key greater than every key starting with prefix
    //! \return false if no such key exists (prefix made of 0xFF only)
    static bool prefix_successor(ByteView prefix, Bytes& successor) {
        successor.assign(prefix.data(), prefix.size());
        while (!successor.empty()) {
            if (successor.back() != 0xFF) {
                ++successor.back();
                return true;
            }
            successor.pop_back();
        }
        return false;
    }

    //! \brief Positions the cursor on the last record whose key is lower than every key beyond the provided prefix
    static ::mdbx::cursor::move_result seek_last_within(::mdbx::cursor& c, ByteView last_prefix) {
        Bytes successor;
        if (prefix_successor(last_prefix, successor)) {
            if (c.lower_bound(to_slice(successor), /*throw_notfound=*/false).done) {
                return c.to_previous(/*throw_notfound=*/false);
            }
        }
        return c.to_last(/*throw_notfound=*/false);
    }

}  // namespace detail

::mdbx::env_managed open_env(const EnvConfig& config) {
    namespace fs = std::filesystem;

    if (config.path.empty()) {
        throw std::invalid_argument("Invalid argument : config.path");
    }

    fs::path db_path{config.path};
    if (!fs::exists(db_path)) {
        if (!config.create) {
            throw std::runtime_error("Unable to locate " + db_path.string() + ", which is required to exist");
        }
        fs::create_directories(db_path);
    } else if (!fs::is_directory(db_path)) {
        throw std::runtime_error("Path " + db_path.string() + " is not valid");
    }

    const fs::path db_file{get_datafile_path(db_path)};
    const size_t db_ondisk_file_size{fs::exists(db_file) ? fs::file_size(db_file) : 0};
    if (!config.create && !db_ondisk_file_size) {
        throw std::runtime_error("Unable to locate " + db_file.string() + ", which is required to exist");
    }

    // Prevent mapping a file with a smaller map size than the size on disk.
    // Opening would not fail but only a part of data would be mapped.
    if (db_ondisk_file_size > config.max_size) {
        throw std::runtime_error("Database map size is too small. Min required " + human_size(db_ondisk_file_size));
    }

    if (config.create && config.readonly) {
        throw std::runtime_error("Create conflicts with Readonly");
    }

    uint32_t flags{MDBX_NOTLS | MDBX_NORDAHEAD | MDBX_COALESCE | MDBX_SYNC_DURABLE};  // Default flags
    if (config.readonly) {
        flags |= MDBX_RDONLY;
    }
    if (config.inmemory) {
        flags |= MDBX_NOMETASYNC;
    }
    if (config.exclusive) {
        flags |= MDBX_EXCLUSIVE;
    }

    ::mdbx::env_managed::create_parameters cp{};  // Default create parameters
    const auto max_map_size = static_cast<intptr_t>(config.inmemory ? 128_Mebi : config.max_size);
    const auto growth_size = static_cast<intptr_t>(config.inmemory ? 2_Mebi : config.growth_size);
    cp.geometry.make_dynamic(::mdbx::env::geometry::default_value, max_map_size);
    cp.geometry.growth_step = growth_size;
    cp.geometry.pagesize = static_cast<intptr_t>(config.page_size);

    ::mdbx::env::operate_parameters op{};  // Operational parameters
    op.mode = op.mode_from_flags(static_cast<MDBX_env_flags_t>(flags));
    op.options = op.options_from_flags(static_cast<MDBX_env_flags_t>(flags));
    op.durability = op.durability_from_flags(static_cast<MDBX_env_flags_t>(flags));
    op.max_maps = config.max_tables;
    op.max_readers = config.max_readers;

    ::mdbx::env_managed ret{db_path.native(), cp, op};
    if (!config.inmemory) {
        ret.check_readers();
    }
    return ret;
}

::mdbx::map_handle open_map(::mdbx::txn& tx, const MapConfig& config) {
    if (tx.is_readonly()) {
        return tx.open_map(config.name, config.key_mode, config.value_mode);
    }
    return tx.create_map(config.name, config.key_mode, config.value_mode);
}

::mdbx::cursor_managed open_cursor(::mdbx::txn& tx, const MapConfig& config) {
    return tx.open_cursor(open_map(tx, config));
}

bool has_map(::mdbx::txn& tx, const char* map_name) {
    ::mdbx::map_handle main_map{1};
    auto main_crs{tx.open_cursor(main_map)};
    return main_crs.seek(::mdbx::slice(map_name));
}

size_t cursor_for_each(::mdbx::cursor& cursor, WalkFuncRef walker, CursorMoveDirection direction) {
    const auto move_operation{detail::move_operation_for(direction)};

    size_t ret{0};
    auto data{detail::adjust_cursor_position_if_unpositioned_and_return_data(cursor, direction)};
    while (data.done) {
        ++ret;
        if (!walker(from_slice(data.key), from_slice(data.value))) {
            break;  // Walker function has returned false hence stop
        }
        data = cursor.move(move_operation, /*throw_notfound=*/false);
    }
    return ret;
}

size_t cursor_for_prefix(::mdbx::cursor& cursor, ByteView prefix, WalkFuncRef walker,
                         CursorMoveDirection direction) {
    return cursor_for_range(cursor, prefix, prefix, walker, direction);
}

size_t cursor_for_range(::mdbx::cursor& cursor, ByteView first_key, ByteView last_key, WalkFuncRef walker,
                        CursorMoveDirection direction) {
    const auto move_operation{detail::move_operation_for(direction)};

    auto data{direction == CursorMoveDirection::kForward
                  ? cursor.lower_bound(to_slice(first_key), /*throw_notfound=*/false)
                  : detail::seek_last_within(cursor, last_key)};

    size_t ret{0};
    while (data.done) {
        const ByteView key{from_slice(data.key)};
        if (key.compare(0, last_key.size(), last_key) > 0 || key < first_key) {
            break;
        }
        ++ret;
        if (!walker(key, from_slice(data.value))) {
            break;
        }
        data = cursor.move(move_operation, /*throw_notfound=*/false);
    }
    return ret;
}

size_t cursor_count_prefix(::mdbx::cursor& cursor, ByteView prefix) {
    return cursor_for_prefix(cursor, prefix, [](ByteView, ByteView) { return true; });
}

size_t cursor_erase_prefix(::mdbx::cursor& cursor, ByteView prefix) {
    size_t ret{0};
    auto data{cursor.lower_bound(to_slice(prefix), /*throw_notfound=*/false)};
    while (data.done && from_slice(data.key).starts_with(prefix)) {
        cursor.erase();
        ++ret;
        data = cursor.lower_bound(to_slice(prefix), /*throw_notfound=*/false);
    }
    return ret;
}

}  // namespace quarry::db

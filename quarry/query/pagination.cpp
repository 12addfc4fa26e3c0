// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "pagination.hpp"

#include <algorithm>

#include <quarry/core/common/error.hpp>

namespace quarry::query {

size_t effective_limit(const Pagination& pagination, const QueryLimits& limits) {
    if (!pagination.limit || *pagination.limit == 0) {
        return std::min(limits.default_limit, limits.max_limit);
    }
    return std::min(*pagination.limit, limits.max_limit);
}

BlockWindow calculate_block_range_reverse(BlockNum latest, uint64_t offset, uint64_t limit) {
    ensure_input(limit > 0, "page limit must be positive");

    BlockWindow window{.has_previous_page = offset > 0};
    if (offset > latest) {
        return window;
    }
    const BlockNum end_block{latest - offset};
    const BlockNum start_block{end_block >= limit - 1 ? end_block - (limit - 1) : 0};
    window.range = BlockNumRange{start_block, end_block};
    window.has_next_page = start_block > 0;
    return window;
}

BlockWindow calculate_block_range_forward(BlockNum from, BlockNum to, uint64_t offset, uint64_t limit) {
    ensure_input(limit > 0, "page limit must be positive");
    ensure_input(from <= to, "invalid block range: from " + std::to_string(from) + " > to " + std::to_string(to));

    BlockWindow window{.has_previous_page = offset > 0};
    // offset >= to - from + 1 written so that [0, kMaxBlockNum] cannot overflow
    if (offset > to - from) {
        return window;
    }
    const BlockNum start_block{from + offset};
    const BlockNum end_block{limit - 1 < to - start_block ? start_block + (limit - 1) : to};
    window.range = BlockNumRange{start_block, end_block};
    window.has_next_page = end_block < to;
    return window;
}

bool clamp_block_range(BlockNumRange& range, uint64_t max_range, bool keep_end) {
    if (range.end - range.start <= max_range) {
        return false;
    }
    if (keep_end) {
        range.start = range.end - max_range;
    } else {
        range.end = range.start + max_range;
    }
    return true;
}

db::PageRequest to_page_request(const Pagination& pagination, const QueryLimits& limits) {
    return db::PageRequest{
        .offset = pagination.offset,
        .limit = effective_limit(pagination, limits),
        .newest_first = true,
    };
}

PageInfo positional_page_info(size_t offset, size_t node_count, uint64_t total_count) {
    PageInfo info{
        .has_next_page = offset + node_count < total_count,
        .has_previous_page = offset > 0,
    };
    if (node_count > 0) {
        info.start_cursor = std::to_string(offset);
        info.end_cursor = std::to_string(offset + node_count - 1);
    }
    return info;
}

}  // namespace quarry::query

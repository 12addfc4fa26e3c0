// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include <quarry/core/common/base.hpp>
#include <quarry/db/util.hpp>

namespace quarry::query {

//! \brief Bounds applied to every query to cap its scan cost
struct QueryLimits {
    size_t default_limit{10};
    size_t max_limit{100};
    uint64_t max_range{1'000};        // max block span scanned by transaction and log queries
    uint64_t max_blocks_range{100};  // max blocks returned by a single blocks_range request
};

//! \brief Offset/limit pagination as requested by a caller, limit unset means the default page size
struct Pagination {
    std::optional<size_t> limit;
    size_t offset{0};
};

//! \brief The page size to use: missing or zero limits get the default, larger ones are capped to max_limit
size_t effective_limit(const Pagination& pagination, const QueryLimits& limits);

struct PageInfo {
    bool has_next_page{false};
    bool has_previous_page{false};
    std::optional<std::string> start_cursor;
    std::optional<std::string> end_cursor;

    friend bool operator==(const PageInfo&, const PageInfo&) = default;
};

//! \brief Page of results along with the total number of matching items
//! \details total_count is exact when it comes from an aggregate counter or a complete index scan. It is a lower
//! bound when it only counts the matches found within a clamped or already paginated scan
template <class T>
struct Connection {
    std::vector<T> nodes;
    uint64_t total_count{0};
    bool total_count_exact{true};
    PageInfo page_info;
};

//! \brief Block interval selected by one page, range unset when the page lies past the end
struct BlockWindow {
    std::optional<BlockNumRange> range;
    bool has_next_page{false};
    bool has_previous_page{false};
};

//! \brief Latest-first paging: page 0 ends at latest, following pages move towards genesis
//! \remarks Throws Error{kInvalidInput} if limit is zero
BlockWindow calculate_block_range_reverse(BlockNum latest, uint64_t offset, uint64_t limit);

//! \brief Ascending paging over the explicit interval [from, to]
//! \remarks Throws Error{kInvalidInput} if limit is zero or from > to
BlockWindow calculate_block_range_forward(BlockNum from, BlockNum to, uint64_t offset, uint64_t limit);

//! \brief Clamps range so that it spans at most max_range + 1 blocks
//! \param keep_end true to keep the upper bound and raise the lower one, false to lower the upper bound
//! \return true if the range has been clamped
bool clamp_block_range(BlockNumRange& range, uint64_t max_range, bool keep_end = false);

//! \brief Index page request matching a caller pagination, newest records first
db::PageRequest to_page_request(const Pagination& pagination, const QueryLimits& limits);

//! \brief The [offset, offset + limit) slice of items
template <class T>
std::vector<T> slice_page(std::vector<T> items, size_t offset, size_t limit) {
    if (offset >= items.size()) {
        return {};
    }
    const size_t end{limit < items.size() - offset ? offset + limit : items.size()};
    std::vector<T> page;
    page.reserve(end - offset);
    std::move(items.begin() + static_cast<std::ptrdiff_t>(offset),
              items.begin() + static_cast<std::ptrdiff_t>(end), std::back_inserter(page));
    return page;
}

//! \brief Page info of an offset-paginated result out of total matches, cursors are absolute positions
PageInfo positional_page_info(size_t offset, size_t node_count, uint64_t total_count);

}  // namespace quarry::query

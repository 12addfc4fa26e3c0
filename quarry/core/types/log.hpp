// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>

#include <quarry/core/common/base.hpp>
#include <quarry/core/rlp/decode.hpp>

namespace quarry {

//! \brief An event log together with the location of the receipt it belongs to
struct Log {
    evmc::address address;
    std::vector<evmc::bytes32> topics;
    Bytes data;

    BlockNum block_num{0};
    evmc::bytes32 block_hash;
    evmc::bytes32 tx_hash;
    uint32_t tx_index{0};
    uint32_t index{0};  // position within the block
    bool removed{false};

    friend bool operator==(const Log&, const Log&) = default;
};

//! \brief Positional topic selection: an empty position is a wildcard, alternatives within a position are OR-ed
bool matches_topics(const Log& log, const std::vector<std::vector<evmc::bytes32>>& topics);

namespace rlp {
    void encode(Bytes& to, const Log&);
    DecodingResult decode(ByteView& from, Log& to, Leftover mode = Leftover::kProhibit) noexcept;
}  // namespace rlp

}  // namespace quarry

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <algorithm>

#include <quarry/core/rlp/encode.hpp>

namespace quarry {

bool matches_topics(const Log& log, const std::vector<std::vector<evmc::bytes32>>& topics) {
    for (size_t i{0}; i < topics.size(); ++i) {
        if (topics[i].empty()) {
            continue;
        }
        if (i >= log.topics.size()) {
            return false;
        }
        if (std::find(topics[i].begin(), topics[i].end(), log.topics[i]) == topics[i].end()) {
            return false;
        }
    }
    return true;
}

}  // namespace quarry

namespace quarry::rlp {

void encode(Bytes& to, const Log& log) {
    Bytes payload;
    encode(payload, log.address);
    encode(payload, log.topics);
    encode(payload, ByteView{log.data});
    encode(payload, log.block_num);
    encode(payload, log.block_hash);
    encode(payload, log.tx_hash);
    encode(payload, log.tx_index);
    encode(payload, log.index);
    encode(payload, log.removed);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, Log& to, Leftover mode) noexcept {
    auto payload{decode_list(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    if (DecodingResult res{decode_items(*payload, to.address, to.topics, to.data, to.block_num, to.block_hash,
                                        to.tx_hash, to.tx_index, to.index, to.removed)};
        !res) {
        return res;
    }
    return finalize_list(*payload, from, mode);
}

}  // namespace quarry::rlp

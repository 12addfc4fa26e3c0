// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <quarry/core/rlp/encode.hpp>

namespace quarry {

std::vector<evmc::bytes32> Block::transaction_hashes() const {
    std::vector<evmc::bytes32> hashes;
    hashes.reserve(transactions.size());
    for (const auto& txn : transactions) {
        hashes.push_back(txn.hash);
    }
    return hashes;
}

namespace rlp {

    void encode(Bytes& to, const BlockHeader& header) {
        Bytes payload;
        encode(payload, header.hash);
        encode(payload, header.parent_hash);
        encode(payload, header.number);
        encode(payload, header.timestamp);
        encode(payload, header.beneficiary);
        encode(payload, header.gas_limit);
        encode(payload, header.gas_used);
        encode(payload, header.base_fee_per_gas);
        encode(payload, header.blob_gas_used);
        encode(payload, header.excess_blob_gas);
        encode(payload, ByteView{header.extra_data});
        encode_list(to, payload);
    }

    void encode(Bytes& to, const BlockForStorage& block) {
        Bytes payload;
        encode(payload, block.header);
        encode(payload, block.transaction_hashes);
        encode(payload, block.ommer_hashes);
        encode_list(to, payload);
    }

    DecodingResult decode(ByteView& from, BlockHeader& to, Leftover mode) noexcept {
        auto payload{decode_list(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        if (DecodingResult res{decode_items(*payload, to.hash, to.parent_hash, to.number, to.timestamp, to.beneficiary,
                                            to.gas_limit, to.gas_used, to.base_fee_per_gas, to.blob_gas_used,
                                            to.excess_blob_gas, to.extra_data)};
            !res) {
            return res;
        }
        return finalize_list(*payload, from, mode);
    }

    DecodingResult decode(ByteView& from, BlockForStorage& to, Leftover mode) noexcept {
        auto payload{decode_list(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        if (DecodingResult res{decode(*payload, to.header, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_items(*payload, to.transaction_hashes, to.ommer_hashes)}; !res) {
            return res;
        }
        return finalize_list(*payload, from, mode);
    }

}  // namespace rlp

}  // namespace quarry

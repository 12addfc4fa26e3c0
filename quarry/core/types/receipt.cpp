// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt.hpp"

#include <quarry/core/rlp/encode.hpp>

namespace quarry {

void derive_gas_used(std::vector<Receipt>& receipts) {
    uint64_t previous_cumulative{0};
    for (auto& receipt : receipts) {
        // A non monotonic source must not wrap around
        receipt.gas_used = receipt.cumulative_gas_used >= previous_cumulative
                               ? receipt.cumulative_gas_used - previous_cumulative
                               : 0;
        previous_cumulative = receipt.cumulative_gas_used;
    }
}

namespace rlp {

    void encode(Bytes& to, const Receipt& r) {
        Bytes payload;
        encode(payload, r.tx_hash);
        encode(payload, static_cast<uint8_t>(r.type));
        encode(payload, r.success);
        encode(payload, r.cumulative_gas_used);
        encode(payload, ByteView{r.bloom});
        Bytes logs;
        for (const auto& log : r.logs) {
            encode(logs, log);
        }
        encode_list(payload, logs);
        encode(payload, r.contract_address);
        encode(payload, r.block_num);
        encode(payload, r.block_hash);
        encode(payload, r.tx_index);
        encode_list(to, payload);
    }

    DecodingResult decode(ByteView& from, Receipt& to, Leftover mode) noexcept {
        auto payload{decode_list(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        uint8_t type{0};
        if (DecodingResult res{decode_items(*payload, to.tx_hash, type, to.success, to.cumulative_gas_used)}; !res) {
            return res;
        }
        if (!is_valid_transaction_type(type)) {
            return tl::unexpected{DecodingError::kUnsupportedTransactionType};
        }
        to.type = static_cast<TransactionType>(type);
        if (DecodingResult res{decode(*payload, std::span<uint8_t, kBloomByteLength>{to.bloom}, Leftover::kAllow)};
            !res) {
            return res;
        }

        auto logs{decode_list(*payload)};
        if (!logs) {
            return tl::unexpected{logs.error()};
        }
        to.logs.clear();
        while (!logs->empty()) {
            if (DecodingResult res{decode(*logs, to.logs.emplace_back(), Leftover::kAllow)}; !res) {
                return res;
            }
        }

        if (DecodingResult res{decode_items(*payload, to.contract_address, to.block_num, to.block_hash, to.tx_index)};
            !res) {
            return res;
        }
        to.gas_used = 0;
        to.effective_gas_price = 0;
        return finalize_list(*payload, from, mode);
    }

}  // namespace rlp

}  // namespace quarry

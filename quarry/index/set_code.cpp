// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "set_code.hpp"

#include <limits>

#include <quarry/core/types/evmc_bytes32.hpp>
#include <quarry/infra/common/log.hpp>

namespace quarry::index {

std::string validate_authorization(const Authorization& authorization,
                                   const std::optional<intx::uint256>& tx_chain_id) {
    // chain id 0 authorizes on any chain
    if (authorization.chain_id != 0 && authorization.chain_id != tx_chain_id.value_or(0)) {
        return std::string{kSetCodeErrWrongChainId};
    }
    if (authorization.nonce == std::numeric_limits<uint64_t>::max()) {
        return std::string{kSetCodeErrNonceOverflow};
    }
    if (authorization.r == 0 || authorization.s == 0) {
        return std::string{kSetCodeErrInvalidSignature};
    }
    return {};
}

std::vector<db::SetCodeAuthorizationRecord> make_set_code_records(const Transaction& transaction,
                                                                  const TransactionLocation& location,
                                                                  const Receipt* receipt, BlockTime timestamp) {
    std::vector<db::SetCodeAuthorizationRecord> records;
    if (transaction.type != TransactionType::kSetCode) {
        return records;
    }
    const bool tx_success{receipt != nullptr && receipt->success};

    records.reserve(transaction.authorizations.size());
    for (uint32_t i{0}; i < transaction.authorizations.size(); ++i) {
        const Authorization& authorization{transaction.authorizations[i]};
        db::SetCodeAuthorizationRecord& record{records.emplace_back()};
        record.tx_hash = transaction.hash;
        record.block_num = location.block_num;
        record.block_hash = location.block_hash;
        record.tx_index = location.tx_index;
        record.auth_index = i;
        record.target = authorization.address;
        record.chain_id = authorization.chain_id;
        record.nonce = authorization.nonce;
        record.y_parity = authorization.y_parity;
        record.r = authorization.r;
        record.s = authorization.s;
        record.timestamp = timestamp;

        record.authority = authorization.recover_authority();
        if (!record.authority) {
            QUARRY_WARN_M("Failed to recover set-code authority",
                          {"tx", to_hex(transaction.hash, true), "auth_index", std::to_string(i)});
            record.error = std::string{kSetCodeErrRecoveryFailed};
            continue;
        }
        record.error = validate_authorization(authorization, transaction.chain_id);
        record.applied = record.error.empty() && tx_success;
    }
    return records;
}

}  // namespace quarry::index

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <intx/intx.hpp>

#include <quarry/core/types/receipt.hpp>
#include <quarry/core/types/transaction.hpp>
#include <quarry/db/index/records.hpp>

namespace quarry::index {

inline constexpr std::string_view kSetCodeErrWrongChainId{"wrong_chain_id"};
inline constexpr std::string_view kSetCodeErrNonceOverflow{"nonce_overflow"};
inline constexpr std::string_view kSetCodeErrInvalidSignature{"invalid_signature"};
inline constexpr std::string_view kSetCodeErrRecoveryFailed{"recovery_failed"};

//! \brief Stateless checks of an authorization, the first failing rule or an empty string
//! \details Nonce and code of the authority are not known to the indexer so they are not checked
std::string validate_authorization(const Authorization& authorization,
                                   const std::optional<intx::uint256>& tx_chain_id);

//! \brief One record per authorization of a set-code transaction, none for other transaction types
//! \param receipt the receipt of the transaction, applied is left false when missing or failed
std::vector<db::SetCodeAuthorizationRecord> make_set_code_records(const Transaction& transaction,
                                                                  const TransactionLocation& location,
                                                                  const Receipt* receipt, BlockTime timestamp);

}  // namespace quarry::index

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <quarry/db/kv/mdbx.hpp>

namespace quarry::db::table {

/* Primary chain data */

//! \details Canonical blocks
//! \struct
//! \verbatim
//!   key   : block_num_u64 (BE)
//!   value : block for storage (header + transaction hashes + ommer hashes) RLP encoded
//! \endverbatim
inline constexpr MapConfig kBlocks{"Block"};

//! \details Binding of block hash to block number
//! \struct
//! \verbatim
//!   key   : block hash
//!   value : block_num_u64 (BE)
//! \endverbatim
inline constexpr MapConfig kBlockHashes{"BlockHash"};

//! \details Transactions with their location in the canonical chain
//! \struct
//! \verbatim
//!   key   : tx hash
//!   value : RLP list [transaction, location]
//! \endverbatim
inline constexpr MapConfig kTransactions{"Transaction"};

//! \details Receipts without the derived fields
//! \struct
//! \verbatim
//!   key   : tx hash
//!   value : receipt RLP encoded
//! \endverbatim
inline constexpr MapConfig kReceipts{"Receipt"};

//! \details Watermarks, aggregate counters and other singletons
//! \struct
//! \verbatim
//!   key   : one of the kXxxKey below
//!   value : depends on key
//! \endverbatim
inline constexpr MapConfig kMeta{"Meta"};

//! \details Heights whose secondary indexes are complete, with the hash of the block they were derived from
//! \struct
//! \verbatim
//!   key   : block_num_u64 (BE)
//!   value : block hash
//! \endverbatim
inline constexpr MapConfig kIndexedBlocks{"IndexedBlock"};

/* Address activity */

//! \struct
//! \verbatim
//!   key   : address + block_num_u64 (BE) + tx_index_u32 (BE)
//!   value : tx hash
//! \endverbatim
inline constexpr MapConfig kAddressTransactions{"AddressTransaction"};

/* Token transfers */

//! \struct
//! \verbatim
//!   key   : tx hash + log_index_u32 (BE)
//!   value : Erc20Transfer RLP encoded
//! \endverbatim
inline constexpr MapConfig kErc20Transfers{"Erc20Transfer"};

//! \details Participant (sender or receiver) and token contract indexes of ERC20 transfers
//! \struct
//! \verbatim
//!   key   : address + block_num_u64 (BE) + log_index_u32 (BE)
//!   value : tx hash + log_index_u32 (BE)
//! \endverbatim
inline constexpr MapConfig kErc20TransfersByAddress{"Erc20TransferByAddress"};
inline constexpr MapConfig kErc20TransfersByToken{"Erc20TransferByToken"};

//! \struct
//! \verbatim
//!   key   : tx hash + log_index_u32 (BE)
//!   value : Erc721Transfer RLP encoded
//! \endverbatim
inline constexpr MapConfig kErc721Transfers{"Erc721Transfer"};
inline constexpr MapConfig kErc721TransfersByAddress{"Erc721TransferByAddress"};
inline constexpr MapConfig kErc721TransfersByToken{"Erc721TransferByToken"};

//! \details Current owner of each NFT
//! \struct
//! \verbatim
//!   key   : contract address + token id (32 bytes BE)
//!   value : NftOwnership RLP encoded
//! \endverbatim
inline constexpr MapConfig kNftOwners{"NftOwner"};

//! \struct
//! \verbatim
//!   key   : owner address + contract address + token id (32 bytes BE)
//!   value : block_num_u64 (BE) of the transfer which made owner the holder
//! \endverbatim
inline constexpr MapConfig kNftsByOwner{"NftByOwner"};

/* Contracts */

//! \struct
//! \verbatim
//!   key   : contract address
//!   value : ContractCreation RLP encoded
//! \endverbatim
inline constexpr MapConfig kContractCreations{"ContractCreation"};

//! \struct
//! \verbatim
//!   key   : creator address + block_num_u64 (BE) + tx_index_u32 (BE)
//!   value : contract address
//! \endverbatim
inline constexpr MapConfig kContractsByCreator{"ContractByCreator"};

//! \details Mutable, last write wins
//! \struct
//! \verbatim
//!   key   : contract address
//!   value : ContractVerification RLP encoded
//! \endverbatim
inline constexpr MapConfig kContractVerifications{"ContractVerification"};

/* Internal transactions */

//! \struct
//! \verbatim
//!   key   : tx hash + call_index_u32 (BE)
//!   value : InternalTransaction RLP encoded
//! \endverbatim
inline constexpr MapConfig kInternalTransactions{"InternalTransaction"};

//! \struct
//! \verbatim
//!   key   : address + block_num_u64 (BE) + tx_index_u32 (BE) + call_index_u32 (BE)
//!   value : tx hash
//! \endverbatim
inline constexpr MapConfig kInternalTransactionsByAddress{"InternalTransactionByAddress"};

/* EIP-7702 set-code authorizations */

//! \struct
//! \verbatim
//!   key   : tx hash + auth_index_u32 (BE)
//!   value : SetCodeAuthorizationRecord RLP encoded
//! \endverbatim
inline constexpr MapConfig kSetCodeAuthorizations{"SetCodeAuthorization"};

//! \struct
//! \verbatim
//!   key   : address + block_num_u64 (BE) + tx_index_u32 (BE) + auth_index_u32 (BE)
//!   value : tx hash
//! \endverbatim
inline constexpr MapConfig kSetCodeByTarget{"SetCodeByTarget"};
inline constexpr MapConfig kSetCodeByAuthority{"SetCodeByAuthority"};

//! \struct
//! \verbatim
//!   key   : authority address
//!   value : AddressDelegationState RLP encoded
//! \endverbatim
inline constexpr MapConfig kDelegationStates{"DelegationState"};

/* WBFT consensus */

//! \struct
//! \verbatim
//!   key   : block_num_u64 (BE)
//!   value : WbftBlockRecord RLP encoded
//! \endverbatim
inline constexpr MapConfig kWbftBlocks{"WbftBlock"};

//! \struct
//! \verbatim
//!   key   : epoch_num_u64 (BE)
//!   value : EpochInfo RLP encoded
//! \endverbatim
inline constexpr MapConfig kWbftEpochs{"WbftEpoch"};

//! \struct
//! \verbatim
//!   key   : validator address
//!   value : ValidatorSigningStats RLP encoded
//! \endverbatim
inline constexpr MapConfig kValidatorStats{"ValidatorStats"};

//! \struct
//! \verbatim
//!   key   : validator address + block_num_u64 (BE)
//!   value : ValidatorSigningActivity RLP encoded
//! \endverbatim
inline constexpr MapConfig kValidatorActivity{"ValidatorActivity"};

/* Balance history */

//! \details Signed balance deltas and absolute snapshots
//! \struct
//! \verbatim
//!   key   : address + block_num_u64 (BE) + sequence_u32 (BE)
//!   value : BalanceEntry RLP encoded
//! \endverbatim
//! \remark Sequence 0 is reserved to the snapshot of the block, deltas use 1 + 2 * tx_index (+1 for credits)
inline constexpr MapConfig kBalanceHistory{"BalanceHistory"};

/* System contracts */

//! \struct
//! \verbatim
//!   key   : kind_u8 + block_num_u64 (BE) + log_index_u32 (BE)
//!   value : SystemContractEvent RLP encoded
//! \endverbatim
inline constexpr MapConfig kSystemEvents{"SystemEvent"};

//! \struct
//! \verbatim
//!   key   : account address + block_num_u64 (BE) + log_index_u32 (BE)
//!   value : kind_u8
//! \endverbatim
inline constexpr MapConfig kSystemEventsByAccount{"SystemEventByAccount"};

//! \struct
//! \verbatim
//!   key   : minter address
//!   value : allowance RLP encoded
//! \endverbatim
inline constexpr MapConfig kActiveMinters{"ActiveMinter"};

//! \struct
//! \verbatim
//!   key   : account address
//!   value : BlacklistStatus RLP encoded
//! \endverbatim
inline constexpr MapConfig kBlacklist{"Blacklist"};

//! \struct
//! \verbatim
//!   key   : contract address + proposal_id_u256 (BE)
//!   value : Proposal RLP encoded
//! \endverbatim
inline constexpr MapConfig kProposals{"Proposal"};

//! \struct
//! \verbatim
//!   key   : contract address + status_u8 + proposal_id_u256 (BE)
//!   value : empty
//! \endverbatim
inline constexpr MapConfig kProposalsByStatus{"ProposalByStatus"};

//! \struct
//! \verbatim
//!   key   : contract address + proposal_id_u256 (BE) + block_num_u64 (BE) + log_index_u32 (BE)
//!   value : kind_u8
//! \endverbatim
//! \remark Lifecycle events of each proposal, the Proposal record is folded from them in key order
inline constexpr MapConfig kProposalEvents{"ProposalEvent"};

/* Meta keys */

inline constexpr std::string_view kLatestHeightKey{"LatestHeight"};
inline constexpr std::string_view kIndexedHeightKey{"IndexedHeight"};
inline constexpr std::string_view kBlockCountKey{"BlockCount"};
inline constexpr std::string_view kTransactionCountKey{"TransactionCount"};
inline constexpr std::string_view kTotalSupplyKey{"TotalSupply"};

inline constexpr MapConfig kChainDataTables[]{
    kBlocks,
    kBlockHashes,
    kTransactions,
    kReceipts,
    kMeta,
    kIndexedBlocks,
};

inline constexpr MapConfig kIndexTables[]{
    kAddressTransactions,
    kErc20Transfers,
    kErc20TransfersByAddress,
    kErc20TransfersByToken,
    kErc721Transfers,
    kErc721TransfersByAddress,
    kErc721TransfersByToken,
    kNftOwners,
    kNftsByOwner,
    kContractCreations,
    kContractsByCreator,
    kContractVerifications,
    kInternalTransactions,
    kInternalTransactionsByAddress,
    kSetCodeAuthorizations,
    kSetCodeByTarget,
    kSetCodeByAuthority,
    kDelegationStates,
    kWbftBlocks,
    kWbftEpochs,
    kValidatorStats,
    kValidatorActivity,
    kBalanceHistory,
    kSystemEvents,
    kSystemEventsByAccount,
    kActiveMinters,
    kBlacklist,
    kProposals,
    kProposalsByStatus,
    kProposalEvents,
};

//! \brief Ensures all tables exist
void check_or_create_chaindata_tables(RWTxn& txn);

}  // namespace quarry::db::table

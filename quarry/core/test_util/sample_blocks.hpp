// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstring>
#include <utility>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quarry/core/common/endian.hpp>
#include <quarry/core/types/block.hpp>
#include <quarry/core/types/receipt.hpp>

namespace quarry::test_util {

using evmc::literals::operator""_address, evmc::literals::operator""_bytes32;

inline constexpr evmc::address kSampleSender{0xb685342b8c54347aad148e1f22eff3eb3eb29391_address};
inline constexpr evmc::address kSampleRecipient{0x3f1d8cbe5a1e1a9e3b8ee7a0e2ecbb2d0f36d6f3_address};
inline constexpr evmc::address kSampleMiner{0x0000000000000000000000000000000000c0ffee_address};
inline constexpr evmc::address kSampleToken{0x6b175474e89094c44da98b954eedeac495271d0f_address};

inline const evmc::bytes32 kTransferTopic{0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32};

//! \brief Deterministic 32 bytes identifier: tag in the first byte, block number and index big endian at the tail
inline evmc::bytes32 sample_hash(uint8_t tag, BlockNum block_num, uint32_t index = 0) {
    evmc::bytes32 hash;
    hash.bytes[0] = tag;
    endian::store_big_u64(&hash.bytes[20], block_num);
    endian::store_big_u32(&hash.bytes[28], index);
    return hash;
}

inline evmc::bytes32 sample_block_hash(BlockNum block_num) { return sample_hash(0xb1, block_num); }

inline evmc::bytes32 sample_tx_hash(BlockNum block_num, uint32_t tx_index) {
    return sample_hash(0x7e, block_num, tx_index);
}

inline evmc::bytes32 address_topic(const evmc::address& address) {
    evmc::bytes32 topic;
    std::memcpy(topic.bytes + 12, address.bytes, kAddressLength);
    return topic;
}

inline Bytes uint256_word(const intx::uint256& value) {
    Bytes word(32, 0);
    intx::be::unsafe::store(word.data(), value);
    return word;
}

//! \brief A dynamic fee value transfer from kSampleSender to kSampleRecipient
inline Transaction sample_transaction(BlockNum block_num, uint32_t tx_index) {
    Transaction txn;
    txn.type = TransactionType::kDynamicFee;
    txn.hash = sample_tx_hash(block_num, tx_index);
    txn.chain_id = 1;
    txn.nonce = block_num * 100 + tx_index;
    txn.from = kSampleSender;
    txn.to = kSampleRecipient;
    txn.value = 1'000;
    txn.gas_limit = 50'000;
    txn.max_priority_fee_per_gas = 20;
    txn.max_fee_per_gas = 200;
    txn.r = 1;
    txn.s = 2;
    return txn;
}

inline Block sample_block(BlockNum block_num, uint32_t tx_count = 2) {
    Block block;
    block.header.hash = sample_block_hash(block_num);
    block.header.parent_hash = block_num > 0 ? sample_block_hash(block_num - 1) : evmc::bytes32{};
    block.header.number = block_num;
    block.header.timestamp = 1'700'000'000 + block_num * 12;
    block.header.beneficiary = kSampleMiner;
    block.header.gas_limit = 30'000'000;
    block.header.gas_used = 21'000ull * tx_count;
    block.header.base_fee_per_gas = 100;
    for (uint32_t i{0}; i < tx_count; ++i) {
        block.transactions.push_back(sample_transaction(block_num, i));
    }
    return block;
}

//! \brief Successful receipts using 21'000 gas each, cumulative gas increasing along the block
inline std::vector<Receipt> sample_receipts(const Block& block, uint64_t gas_per_tx = 21'000) {
    std::vector<Receipt> receipts;
    uint64_t cumulative{0};
    for (uint32_t i{0}; i < block.transactions.size(); ++i) {
        cumulative += gas_per_tx;
        Receipt& r{receipts.emplace_back()};
        r.tx_hash = block.transactions[i].hash;
        r.type = block.transactions[i].type;
        r.success = true;
        r.cumulative_gas_used = cumulative;
        r.block_num = block.header.number;
        r.block_hash = block.header.hash;
        r.tx_index = i;
    }
    return receipts;
}

inline Log sample_log(const Receipt& receipt, uint32_t log_index, const evmc::address& emitter,
                      std::vector<evmc::bytes32> topics, Bytes data = {}) {
    Log log;
    log.address = emitter;
    log.topics = std::move(topics);
    log.data = std::move(data);
    log.block_num = receipt.block_num;
    log.block_hash = receipt.block_hash;
    log.tx_hash = receipt.tx_hash;
    log.tx_index = receipt.tx_index;
    log.index = log_index;
    return log;
}

//! \brief ERC20 Transfer(from, to, value) log: 3 topics, value in data
inline Log erc20_transfer_log(const Receipt& receipt, uint32_t log_index, const evmc::address& token,
                              const evmc::address& from, const evmc::address& to, const intx::uint256& value) {
    return sample_log(receipt, log_index, token, {kTransferTopic, address_topic(from), address_topic(to)},
                      uint256_word(value));
}

//! \brief ERC721 Transfer(from, to, tokenId) log: 4 topics, no data
inline Log erc721_transfer_log(const Receipt& receipt, uint32_t log_index, const evmc::address& token,
                               const evmc::address& from, const evmc::address& to, const intx::uint256& token_id) {
    evmc::bytes32 id_topic;
    intx::be::store(id_topic.bytes, token_id);
    return sample_log(receipt, log_index, token, {kTransferTopic, address_topic(from), address_topic(to), id_topic});
}

}  // namespace quarry::test_util

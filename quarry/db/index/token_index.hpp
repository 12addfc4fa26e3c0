// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <quarry/db/index/capabilities.hpp>

namespace quarry::db {

//! \brief ERC20 and ERC721 transfer indexes plus the current owner of every NFT seen in a transfer
class MdbxTokenIndex : public TokenIndexReader, public TokenIndexWriter {
  public:
    explicit MdbxTokenIndex(::mdbx::env env) : env_{env} {}

    std::optional<Erc20Transfer> get_erc20_transfer(const OperationContext& ctx, const evmc::bytes32& tx_hash,
                                                    uint32_t log_index) const override;
    std::vector<Erc20Transfer> get_erc20_transfers_by_address(const OperationContext& ctx,
                                                              const evmc::address& address,
                                                              const PageRequest& page) const override;
    std::vector<Erc20Transfer> get_erc20_transfers_by_token(const OperationContext& ctx, const evmc::address& token,
                                                            const PageRequest& page) const override;
    uint64_t count_erc20_transfers_by_address(const OperationContext& ctx,
                                              const evmc::address& address) const override;
    uint64_t count_erc20_transfers_by_token(const OperationContext& ctx, const evmc::address& token) const override;

    std::optional<Erc721Transfer> get_erc721_transfer(const OperationContext& ctx, const evmc::bytes32& tx_hash,
                                                      uint32_t log_index) const override;
    std::vector<Erc721Transfer> get_erc721_transfers_by_address(const OperationContext& ctx,
                                                                const evmc::address& address,
                                                                const PageRequest& page) const override;
    std::vector<Erc721Transfer> get_erc721_transfers_by_token(const OperationContext& ctx,
                                                              const evmc::address& token,
                                                              const PageRequest& page) const override;
    uint64_t count_erc721_transfers_by_address(const OperationContext& ctx,
                                               const evmc::address& address) const override;
    uint64_t count_erc721_transfers_by_token(const OperationContext& ctx, const evmc::address& token) const override;

    std::optional<NftOwnership> get_nft_owner(const OperationContext& ctx, const evmc::address& contract,
                                              const intx::uint256& token_id) const override;
    std::vector<NftOwnership> get_nfts_by_owner(const OperationContext& ctx, const evmc::address& owner,
                                                const PageRequest& page) const override;
    uint64_t count_nfts_by_owner(const OperationContext& ctx, const evmc::address& owner) const override;

    void put_erc20_transfer(RWTxn& txn, const Erc20Transfer& transfer) override;
    void erase_erc20_transfer(RWTxn& txn, const Erc20Transfer& transfer) override;
    void put_erc721_transfer(RWTxn& txn, const Erc721Transfer& transfer) override;
    void erase_erc721_transfer(RWTxn& txn, const Erc721Transfer& transfer) override;

  private:
    void set_nft_owner(RWTxn& txn, const std::optional<NftOwnership>& previous, const NftOwnership& current);
    void clear_nft_owner(RWTxn& txn, const NftOwnership& current);

    mutable ::mdbx::env env_;
};

}  // namespace quarry::db

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "contract_index.hpp"

#include <quarry/core/types/address.hpp>
#include <quarry/db/tables.hpp>
#include <quarry/infra/common/log.hpp>

namespace quarry::db {

namespace {

    std::optional<ContractCreation> read_creation(::mdbx::cursor& cursor, ByteView contract) {
        auto data{cursor.find(to_slice(contract), /*throw_notfound=*/false)};
        if (!data.done) {
            return std::nullopt;
        }
        return decode_record<ContractCreation>(from_slice(data.value), table::kContractCreations.name);
    }

}  // namespace

std::optional<ContractCreation> MdbxContractIndex::get_contract_creation(const OperationContext&,
                                                                         const evmc::address& contract) const {
    return storage_guard("get_contract_creation", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kContractCreations)};
        return read_creation(cursor, address_view(contract));
    });
}

std::vector<ContractCreation> MdbxContractIndex::get_contracts_by_creator(const OperationContext& ctx,
                                                                          const evmc::address& creator,
                                                                          const PageRequest& page) const {
    return storage_guard("get_contracts_by_creator", [&] {
        ROTxn txn{env_};
        auto by_creator{open_cursor(txn, table::kContractsByCreator)};
        auto creations{open_cursor(txn, table::kContractCreations)};
        std::vector<ContractCreation> contracts;
        cursor_for_page(ctx, by_creator, address_view(creator), address_view(creator), page,
                        [&](ByteView, ByteView value) {
                            auto creation{read_creation(creations, value)};
                            if (creation) {
                                contracts.push_back(std::move(*creation));
                            } else {
                                QUARRY_WARN_M("Dangling contract creator entry",
                                              {"creator", address_to_hex(creator), "contract", to_hex(value)});
                            }
                            return true;
                        });
        return contracts;
    });
}

uint64_t MdbxContractIndex::count_contracts_by_creator(const OperationContext& ctx,
                                                       const evmc::address& creator) const {
    return storage_guard("count_contracts_by_creator", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kContractsByCreator)};
        return static_cast<uint64_t>(cursor_count_range(ctx, cursor, address_view(creator), address_view(creator)));
    });
}

std::optional<ContractVerification> MdbxContractIndex::get_contract_verification(
    const OperationContext&, const evmc::address& contract) const {
    return storage_guard("get_contract_verification", [&]() -> std::optional<ContractVerification> {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kContractVerifications)};
        auto data{cursor.find(to_slice(contract), /*throw_notfound=*/false)};
        if (!data.done) {
            return std::nullopt;
        }
        return decode_record<ContractVerification>(from_slice(data.value), table::kContractVerifications.name);
    });
}

void MdbxContractIndex::put_contract_creation(RWTxn& txn, const ContractCreation& creation) {
    auto creations{open_cursor(txn, table::kContractCreations)};
    creations.upsert(to_slice(creation.contract_address), to_slice(encode_record(creation)));

    auto by_creator{open_cursor(txn, table::kContractsByCreator)};
    by_creator.upsert(to_slice(address_block_key(creation.creator, creation.block_num, creation.tx_index)),
                      to_slice(creation.contract_address));
}

void MdbxContractIndex::erase_contract_creation(RWTxn& txn, const ContractCreation& creation) {
    auto creations{open_cursor(txn, table::kContractCreations)};
    (void)creations.erase(to_slice(creation.contract_address));

    auto by_creator{open_cursor(txn, table::kContractsByCreator)};
    (void)by_creator.erase(to_slice(address_block_key(creation.creator, creation.block_num, creation.tx_index)));
}

void MdbxContractIndex::set_contract_verification(const OperationContext& ctx,
                                                  const ContractVerification& verification) {
    ctx.throw_if_cancelled();
    storage_guard("set_contract_verification", [&] {
        RWTxn txn{env_};
        auto cursor{open_cursor(txn, table::kContractVerifications)};
        cursor.upsert(to_slice(verification.address), to_slice(encode_record(verification)));
        txn.commit();
    });
}

bool MdbxContractIndex::delete_contract_verification(const OperationContext& ctx, const evmc::address& contract) {
    ctx.throw_if_cancelled();
    return storage_guard("delete_contract_verification", [&] {
        RWTxn txn{env_};
        auto cursor{open_cursor(txn, table::kContractVerifications)};
        const bool erased{cursor.erase(to_slice(contract))};
        txn.commit();
        return erased;
    });
}

}  // namespace quarry::db

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "system_contract_index.hpp"

#include <quarry/core/common/endian.hpp>
#include <quarry/core/rlp/encode.hpp>
#include <quarry/core/types/address.hpp>
#include <quarry/db/access_layer.hpp>
#include <quarry/db/tables.hpp>

namespace quarry::db {

namespace {

    constexpr size_t kAccountKeySize{kAddressLength + sizeof(BlockNum) + sizeof(uint32_t)};

    uint8_t kind_byte(SystemEventKind kind) { return static_cast<uint8_t>(kind); }

    Bytes event_key(const SystemContractEvent& event) {
        return kind_block_key(kind_byte(event.kind), event.block_num, event.log_index);
    }

    std::optional<SystemContractEvent> find_event(::mdbx::cursor& events, ByteView key) {
        auto data{events.find(to_slice(key), /*throw_notfound=*/false)};
        if (!data.done) {
            return std::nullopt;
        }
        return decode_record<SystemContractEvent>(from_slice(data.value), table::kSystemEvents.name);
    }

    //! \brief Primary key referenced by an entry of the by-account index
    Bytes primary_key_of(ByteView account_key, ByteView kind) {
        ensure_stored(account_key.size() == kAccountKeySize && kind.size() == 1,
                     "invalid entry in table SystemEventByAccount");
        return kind_block_key(kind[0], address_key_block_num(account_key),
                              endian::load_big_u32(&account_key[kAddressLength + sizeof(BlockNum)]));
    }

    intx::uint256 decode_allowance(ByteView data) {
        intx::uint256 allowance;
        success_or_throw(rlp::decode(data, allowance), "malformed record in table ActiveMinter");
        return allowance;
    }

    //! \brief Accounts the event is listed under, the zero address of contract-wide events excluded
    std::vector<evmc::address> indexed_accounts(const SystemContractEvent& event) {
        std::vector<evmc::address> accounts;
        if (event.account != kZeroAddress) {
            accounts.push_back(event.account);
        }
        if (event.counterparty && *event.counterparty != event.account && *event.counterparty != kZeroAddress) {
            accounts.push_back(*event.counterparty);
        }
        return accounts;
    }

    //! \brief Latest remaining event of account among the specified kinds
    std::optional<SystemContractEvent> latest_event_of(RWTxn& txn, const evmc::address& account,
                                                       SystemEventKind first_kind, SystemEventKind second_kind) {
        auto by_account{open_cursor(txn, table::kSystemEventsByAccount)};
        auto events{open_cursor(txn, table::kSystemEvents)};
        std::optional<SystemContractEvent> latest;
        cursor_for_range(
            by_account, address_view(account), address_view(account),
            [&](ByteView key, ByteView value) {
                if (value.size() != 1 ||
                    (value[0] != kind_byte(first_kind) && value[0] != kind_byte(second_kind))) {
                    return true;
                }
                auto event{find_event(events, primary_key_of(key, value))};
                if (event && event->account == account) {
                    latest = std::move(event);
                    return false;
                }
                return true;
            },
            CursorMoveDirection::kReverse);
        return latest;
    }

    bool tracks_proposal(const SystemContractEvent& event) {
        return event.proposal_id && is_proposal_lifecycle(event.kind);
    }

    Bytes proposal_status_key(const evmc::address& contract, ProposalStatus status, const intx::uint256& id) {
        Bytes key{address_view(contract)};
        key.push_back(static_cast<uint8_t>(status));
        endian::append_big_u256(key, id);
        return key;
    }

    Bytes proposal_event_key(const SystemContractEvent& event) {
        Bytes key{token_key(event.contract, *event.proposal_id)};
        endian::append_big_u64(key, event.block_num);
        endian::append_big_u32(key, event.log_index);
        return key;
    }

    //! \brief Advances proposal by one lifecycle event
    //! \remarks Events preceding the creation of the proposal leave it unset
    void fold_proposal_event(std::optional<Proposal>& proposal, const SystemContractEvent& event) {
        if (event.kind == SystemEventKind::kProposalCreated) {
            proposal = Proposal{
                .contract = event.contract,
                .proposal_id = *event.proposal_id,
                .proposer = event.account,
                .action_type = event.tag,
                .call_data = event.payload,
                .member_version = event.amount,
                .required_approvals = event.quorum,
                .status = ProposalStatus::kVoting,
                .created_at = event.timestamp,
                .block_num = event.block_num,
                .tx_hash = event.tx_hash,
            };
            return;
        }
        if (!proposal) {
            return;
        }
        switch (event.kind) {
            case SystemEventKind::kProposalVoted:
            case SystemEventKind::kProposalApproved:
            case SystemEventKind::kProposalRejected:
                proposal->approved = static_cast<uint32_t>(event.amount);
                proposal->rejected = static_cast<uint32_t>(event.previous_amount);
                if (event.kind == SystemEventKind::kProposalApproved) {
                    proposal->status = ProposalStatus::kApproved;
                } else if (event.kind == SystemEventKind::kProposalRejected) {
                    proposal->status = ProposalStatus::kRejected;
                }
                break;
            case SystemEventKind::kProposalExecuted:
                proposal->status = event.approval ? ProposalStatus::kExecuted : ProposalStatus::kFailed;
                proposal->executed_at = event.block_num;
                break;
            case SystemEventKind::kProposalFailed:
                proposal->status = ProposalStatus::kFailed;
                proposal->executed_at = event.block_num;
                break;
            case SystemEventKind::kProposalExpired:
                proposal->status = ProposalStatus::kExpired;
                break;
            case SystemEventKind::kProposalCancelled:
                proposal->status = ProposalStatus::kCancelled;
                break;
            default:
                break;
        }
    }

    //! \brief Refolds the proposal from its remaining lifecycle events and rewrites its status entry
    void rebuild_proposal(RWTxn& txn, const evmc::address& contract, const intx::uint256& proposal_id) {
        const Bytes key{token_key(contract, proposal_id)};
        constexpr size_t kEventKeySuffix{sizeof(BlockNum) + sizeof(uint32_t)};

        auto lifecycle{open_cursor(txn, table::kProposalEvents)};
        auto events{open_cursor(txn, table::kSystemEvents)};
        std::optional<Proposal> folded;
        cursor_for_range(lifecycle, key, key, [&](ByteView entry, ByteView kind) {
            ensure_stored(entry.size() == key.size() + kEventKeySuffix && kind.size() == 1,
                          "invalid entry in table ProposalEvent");
            const BlockNum block_num{endian::load_big_u64(&entry[key.size()])};
            const uint32_t log_index{endian::load_big_u32(&entry[key.size() + sizeof(BlockNum)])};
            const auto event{find_event(events, kind_block_key(kind[0], block_num, log_index))};
            if (event) {
                fold_proposal_event(folded, *event);
            }
            return true;
        });

        auto proposals{open_cursor(txn, table::kProposals)};
        auto by_status{open_cursor(txn, table::kProposalsByStatus)};
        auto data{proposals.find(to_slice(key), /*throw_notfound=*/false)};
        if (data.done) {
            const auto stored{decode_record<Proposal>(from_slice(data.value), table::kProposals.name)};
            (void)by_status.erase(to_slice(proposal_status_key(contract, stored.status, proposal_id)));
            if (!folded) {
                (void)proposals.erase(to_slice(key));
            }
        }
        if (folded) {
            proposals.upsert(to_slice(key), to_slice(encode_record(*folded)));
            by_status.upsert(to_slice(proposal_status_key(contract, folded->status, proposal_id)),
                             to_slice(ByteView{}));
        }
    }

    void set_minter(RWTxn& txn, const evmc::address& minter, const intx::uint256& allowance) {
        Bytes encoded;
        rlp::encode(encoded, allowance);
        auto minters{open_cursor(txn, table::kActiveMinters)};
        minters.upsert(to_slice(minter), to_slice(encoded));
    }

    void remove_minter(RWTxn& txn, const evmc::address& minter) {
        auto minters{open_cursor(txn, table::kActiveMinters)};
        (void)minters.erase(to_slice(minter));
    }

    void set_blacklist_status(RWTxn& txn, const SystemContractEvent& event) {
        const BlacklistStatus status{
            .account = event.account,
            .blacklisted = event.kind == SystemEventKind::kAddressBlacklisted,
            .block_num = event.block_num,
            .proposal_id = event.proposal_id,
        };
        auto blacklist{open_cursor(txn, table::kBlacklist)};
        blacklist.upsert(to_slice(event.account), to_slice(encode_record(status)));
    }

    void adjust_total_supply(RWTxn& txn, const intx::uint256& amount, bool increase) {
        intx::uint256 supply{read_meta_u256(txn, table::kTotalSupplyKey).value_or(0)};
        if (increase) {
            supply += amount;
        } else {
            supply = supply > amount ? supply - amount : intx::uint256{0};
        }
        write_meta_u256(txn, table::kTotalSupplyKey, supply);
    }

    void apply_event(RWTxn& txn, const SystemContractEvent& event) {
        switch (event.kind) {
            case SystemEventKind::kMint:
                adjust_total_supply(txn, event.amount, /*increase=*/true);
                break;
            case SystemEventKind::kBurn:
                adjust_total_supply(txn, event.amount, /*increase=*/false);
                break;
            case SystemEventKind::kMinterConfigured:
                set_minter(txn, event.account, event.amount);
                break;
            case SystemEventKind::kMinterRemoved:
                remove_minter(txn, event.account);
                break;
            case SystemEventKind::kAddressBlacklisted:
            case SystemEventKind::kAddressUnblacklisted:
                set_blacklist_status(txn, event);
                break;
            default:
                break;
        }
    }

    void revert_event(RWTxn& txn, const SystemContractEvent& event) {
        switch (event.kind) {
            case SystemEventKind::kMint:
                adjust_total_supply(txn, event.amount, /*increase=*/false);
                break;
            case SystemEventKind::kBurn:
                adjust_total_supply(txn, event.amount, /*increase=*/true);
                break;
            case SystemEventKind::kMinterConfigured:
            case SystemEventKind::kMinterRemoved: {
                const auto latest{latest_event_of(txn, event.account, SystemEventKind::kMinterConfigured,
                                                  SystemEventKind::kMinterRemoved)};
                if (latest && latest->kind == SystemEventKind::kMinterConfigured) {
                    set_minter(txn, event.account, latest->amount);
                } else {
                    remove_minter(txn, event.account);
                }
                break;
            }
            case SystemEventKind::kAddressBlacklisted:
            case SystemEventKind::kAddressUnblacklisted: {
                const auto latest{latest_event_of(txn, event.account, SystemEventKind::kAddressBlacklisted,
                                                  SystemEventKind::kAddressUnblacklisted)};
                if (latest) {
                    set_blacklist_status(txn, *latest);
                } else {
                    auto blacklist{open_cursor(txn, table::kBlacklist)};
                    (void)blacklist.erase(to_slice(event.account));
                }
                break;
            }
            default:
                break;
        }
    }

}  // namespace

intx::uint256 MdbxSystemContractIndex::get_total_supply(const OperationContext&) const {
    return storage_guard("get_total_supply", [&] {
        ROTxn txn{env_};
        return read_meta_u256(txn, table::kTotalSupplyKey).value_or(0);
    });
}

std::vector<MinterInfo> MdbxSystemContractIndex::get_active_minters(const OperationContext& ctx) const {
    return storage_guard("get_active_minters", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kActiveMinters)};
        std::vector<MinterInfo> minters;
        cursor_for_each(cursor, [&](ByteView key, ByteView value) {
            ctx.throw_if_cancelled();
            minters.push_back(MinterInfo{.minter = address_from_view(key), .allowance = decode_allowance(value)});
            return true;
        });
        return minters;
    });
}

std::optional<intx::uint256> MdbxSystemContractIndex::get_minter_allowance(const OperationContext&,
                                                                           const evmc::address& minter) const {
    return storage_guard("get_minter_allowance", [&]() -> std::optional<intx::uint256> {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kActiveMinters)};
        auto data{cursor.find(to_slice(minter), /*throw_notfound=*/false)};
        if (!data.done) {
            return std::nullopt;
        }
        return decode_allowance(from_slice(data.value));
    });
}

std::optional<BlacklistStatus> MdbxSystemContractIndex::get_blacklist_status(const OperationContext&,
                                                                             const evmc::address& account) const {
    return storage_guard("get_blacklist_status", [&]() -> std::optional<BlacklistStatus> {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kBlacklist)};
        auto data{cursor.find(to_slice(account), /*throw_notfound=*/false)};
        if (!data.done) {
            return std::nullopt;
        }
        return decode_record<BlacklistStatus>(from_slice(data.value), table::kBlacklist.name);
    });
}

std::vector<SystemContractEvent> MdbxSystemContractIndex::get_system_events(const OperationContext& ctx,
                                                                            SystemEventKind kind,
                                                                            BlockNumRange range,
                                                                            const PageRequest& page) const {
    ensure_input(range.start <= range.end, "invalid block range " + range.to_string());
    return storage_guard("get_system_events", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kSystemEvents)};
        std::vector<SystemContractEvent> events;
        cursor_for_page(ctx, cursor, kind_block_key(kind_byte(kind), range.start),
                        kind_block_key(kind_byte(kind), range.end), page, [&](ByteView, ByteView value) {
                            events.push_back(decode_record<SystemContractEvent>(value, table::kSystemEvents.name));
                            return true;
                        });
        return events;
    });
}

std::vector<SystemContractEvent> MdbxSystemContractIndex::get_system_events_by_account(
    const OperationContext& ctx, const evmc::address& account, const PageRequest& page) const {
    return storage_guard("get_system_events_by_account", [&] {
        ROTxn txn{env_};
        auto by_account{open_cursor(txn, table::kSystemEventsByAccount)};
        auto events{open_cursor(txn, table::kSystemEvents)};
        std::vector<SystemContractEvent> result;
        cursor_for_page(ctx, by_account, address_view(account), address_view(account), page,
                        [&](ByteView key, ByteView value) {
                            auto event{find_event(events, primary_key_of(key, value))};
                            if (event) {
                                result.push_back(std::move(*event));
                            }
                            return true;
                        });
        return result;
    });
}

uint64_t MdbxSystemContractIndex::count_system_events(const OperationContext& ctx, SystemEventKind kind,
                                                      BlockNumRange range) const {
    ensure_input(range.start <= range.end, "invalid block range " + range.to_string());
    return storage_guard("count_system_events", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kSystemEvents)};
        return static_cast<uint64_t>(cursor_count_range(ctx, cursor, kind_block_key(kind_byte(kind), range.start),
                                                        kind_block_key(kind_byte(kind), range.end)));
    });
}

uint64_t MdbxSystemContractIndex::count_system_events_by_account(const OperationContext& ctx,
                                                                 const evmc::address& account) const {
    return storage_guard("count_system_events_by_account", [&] {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kSystemEventsByAccount)};
        return static_cast<uint64_t>(cursor_count_range(ctx, cursor, address_view(account), address_view(account)));
    });
}

std::optional<Proposal> MdbxSystemContractIndex::get_proposal(const OperationContext&, const evmc::address& contract,
                                                              const intx::uint256& proposal_id) const {
    return storage_guard("get_proposal", [&]() -> std::optional<Proposal> {
        ROTxn txn{env_};
        auto cursor{open_cursor(txn, table::kProposals)};
        auto data{cursor.find(to_slice(token_key(contract, proposal_id)), /*throw_notfound=*/false)};
        if (!data.done) {
            return std::nullopt;
        }
        return decode_record<Proposal>(from_slice(data.value), table::kProposals.name);
    });
}

std::vector<Proposal> MdbxSystemContractIndex::get_proposals(const OperationContext& ctx,
                                                             const evmc::address& contract,
                                                             std::optional<ProposalStatus> status,
                                                             const PageRequest& page) const {
    return storage_guard("get_proposals", [&] {
        ROTxn txn{env_};
        auto proposals{open_cursor(txn, table::kProposals)};
        std::vector<Proposal> result;
        if (!status) {
            cursor_for_page(ctx, proposals, address_view(contract), address_view(contract), page,
                            [&](ByteView, ByteView value) {
                                result.push_back(decode_record<Proposal>(value, table::kProposals.name));
                                return true;
                            });
            return result;
        }

        Bytes prefix{address_view(contract)};
        prefix.push_back(static_cast<uint8_t>(*status));
        auto by_status{open_cursor(txn, table::kProposalsByStatus)};
        cursor_for_page(ctx, by_status, prefix, prefix, page, [&](ByteView key, ByteView) {
            ensure_stored(key.size() == prefix.size() + sizeof(intx::uint256),
                          "invalid entry in table ProposalByStatus");
            Bytes primary_key{address_view(contract)};
            primary_key.append(key.substr(prefix.size()));
            auto data{proposals.find(to_slice(primary_key), /*throw_notfound=*/false)};
            ensure_stored(data.done, "dangling entry in table ProposalByStatus");
            result.push_back(decode_record<Proposal>(from_slice(data.value), table::kProposals.name));
            return true;
        });
        return result;
    });
}

uint64_t MdbxSystemContractIndex::count_proposals(const OperationContext& ctx, const evmc::address& contract,
                                                  std::optional<ProposalStatus> status) const {
    return storage_guard("count_proposals", [&] {
        ROTxn txn{env_};
        if (!status) {
            auto cursor{open_cursor(txn, table::kProposals)};
            return static_cast<uint64_t>(
                cursor_count_range(ctx, cursor, address_view(contract), address_view(contract)));
        }
        Bytes prefix{address_view(contract)};
        prefix.push_back(static_cast<uint8_t>(*status));
        auto cursor{open_cursor(txn, table::kProposalsByStatus)};
        return static_cast<uint64_t>(cursor_count_range(ctx, cursor, prefix, prefix));
    });
}

void MdbxSystemContractIndex::put_system_event(RWTxn& txn, const SystemContractEvent& event) {
    auto events{open_cursor(txn, table::kSystemEvents)};
    const auto key{event_key(event)};
    const bool replayed{find_event(events, key).has_value()};
    events.upsert(to_slice(key), to_slice(encode_record(event)));

    auto by_account{open_cursor(txn, table::kSystemEventsByAccount)};
    const uint8_t kind{kind_byte(event.kind)};
    for (const auto& account : indexed_accounts(event)) {
        by_account.upsert(to_slice(address_block_key(account, event.block_num, event.log_index)),
                          to_slice(ByteView{&kind, 1}));
    }

    if (tracks_proposal(event)) {
        auto lifecycle{open_cursor(txn, table::kProposalEvents)};
        lifecycle.upsert(to_slice(proposal_event_key(event)), to_slice(ByteView{&kind, 1}));
        rebuild_proposal(txn, event.contract, *event.proposal_id);
    }

    // Derived state already reflects a replayed event
    if (!replayed) {
        apply_event(txn, event);
    }
}

void MdbxSystemContractIndex::erase_system_event(RWTxn& txn, const SystemContractEvent& event) {
    auto events{open_cursor(txn, table::kSystemEvents)};
    if (!events.erase(to_slice(event_key(event)))) {
        return;
    }
    auto by_account{open_cursor(txn, table::kSystemEventsByAccount)};
    for (const auto& account : indexed_accounts(event)) {
        (void)by_account.erase(to_slice(address_block_key(account, event.block_num, event.log_index)));
    }
    if (tracks_proposal(event)) {
        auto lifecycle{open_cursor(txn, table::kProposalEvents)};
        (void)lifecycle.erase(to_slice(proposal_event_key(event)));
        rebuild_proposal(txn, event.contract, *event.proposal_id);
    }
    revert_event(txn, event);
}

}  // namespace quarry::db

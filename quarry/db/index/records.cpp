// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "records.hpp"

#include <magic_enum.hpp>

#include <quarry/core/rlp/encode.hpp>

namespace quarry::db {

bool is_proposal_lifecycle(SystemEventKind kind) noexcept {
    switch (kind) {
        case SystemEventKind::kProposalCreated:
        case SystemEventKind::kProposalVoted:
        case SystemEventKind::kProposalApproved:
        case SystemEventKind::kProposalRejected:
        case SystemEventKind::kProposalExecuted:
        case SystemEventKind::kProposalFailed:
        case SystemEventKind::kProposalExpired:
        case SystemEventKind::kProposalCancelled:
            return true;
        default:
            return false;
    }
}

double ValidatorSigningStats::signing_rate() const noexcept {
    const uint64_t total{commit_sign_count + commit_miss_count};
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(commit_sign_count) * 100.0 / static_cast<double>(total);
}

}  // namespace quarry::db

namespace quarry::rlp {

namespace {

    void encode_string(Bytes& to, const std::string& s) {
        encode(to, ByteView{reinterpret_cast<const uint8_t*>(s.data()), s.size()});
    }

    DecodingResult decode_string(ByteView& from, std::string& to) noexcept {
        Bytes raw;
        if (DecodingResult res{decode(from, raw, Leftover::kAllow)}; !res) {
            return res;
        }
        to.assign(reinterpret_cast<const char*>(raw.data()), raw.size());
        return {};
    }

    template <class T>
    void encode_optional(Bytes& to, const std::optional<T>& value) {
        Bytes payload;
        if (value) {
            encode(payload, *value);
        }
        encode_list(to, payload);
    }

    template <class T>
    DecodingResult decode_optional(ByteView& from, std::optional<T>& to) noexcept {
        auto payload{decode_list(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        to.reset();
        if (payload->empty()) {
            return {};
        }
        T value;
        if (DecodingResult res{decode(*payload, value, Leftover::kProhibit)}; !res) {
            return res;
        }
        to = std::move(value);
        return {};
    }

    template <class T>
    void encode_records(Bytes& to, const std::vector<T>& values) {
        Bytes payload;
        for (const auto& value : values) {
            encode(payload, value);
        }
        encode_list(to, payload);
    }

    template <class T>
    DecodingResult decode_records(ByteView& from, std::vector<T>& to) noexcept {
        auto payload{decode_list(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        to.clear();
        while (!payload->empty()) {
            if (DecodingResult res{decode(*payload, to.emplace_back(), Leftover::kAllow)}; !res) {
                return res;
            }
        }
        return {};
    }

    //! \brief Opens the list payload of a record, decodes its fields with func and checks nothing is left
    template <class Func>
    DecodingResult decode_record_list(ByteView& from, Leftover mode, Func&& func) noexcept {
        auto payload{decode_list(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        if (DecodingResult res{func(*payload)}; !res) {
            return res;
        }
        return finalize_list(*payload, from, mode);
    }

}  // namespace

void encode(Bytes& to, const db::ContractCreation& record) {
    Bytes payload;
    encode(payload, record.contract_address);
    encode(payload, record.creator);
    encode(payload, record.tx_hash);
    encode(payload, record.block_num);
    encode(payload, record.tx_index);
    encode(payload, record.timestamp);
    encode(payload, record.bytecode_size);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::ContractCreation& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) {
        return decode_items(payload, to.contract_address, to.creator, to.tx_hash, to.block_num, to.tx_index,
                            to.timestamp, to.bytecode_size);
    });
}

void encode(Bytes& to, const db::ContractVerification& record) {
    Bytes payload;
    encode(payload, record.address);
    encode(payload, record.is_verified);
    encode_string(payload, record.name);
    encode_string(payload, record.compiler_version);
    encode(payload, record.optimization_enabled);
    encode(payload, record.optimization_runs);
    encode_string(payload, record.source_code);
    encode_string(payload, record.abi);
    encode(payload, record.verified_at);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::ContractVerification& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) -> DecodingResult {
        if (DecodingResult res{decode_items(payload, to.address, to.is_verified)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_string(payload, to.name)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_string(payload, to.compiler_version)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_items(payload, to.optimization_enabled, to.optimization_runs)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_string(payload, to.source_code)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_string(payload, to.abi)}; !res) {
            return res;
        }
        return decode(payload, to.verified_at, Leftover::kAllow);
    });
}

void encode(Bytes& to, const db::InternalTransaction& record) {
    Bytes payload;
    encode(payload, record.tx_hash);
    encode(payload, record.block_num);
    encode(payload, record.tx_index);
    encode(payload, record.index);
    encode_string(payload, record.type);
    encode(payload, record.from);
    encode(payload, record.to);
    encode(payload, record.value);
    encode(payload, record.gas);
    encode(payload, record.gas_used);
    encode(payload, ByteView{record.input});
    encode(payload, ByteView{record.output});
    encode_string(payload, record.error);
    encode(payload, record.depth);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::InternalTransaction& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) -> DecodingResult {
        if (DecodingResult res{decode_items(payload, to.tx_hash, to.block_num, to.tx_index, to.index)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_string(payload, to.type)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_items(payload, to.from, to.to, to.value, to.gas, to.gas_used, to.input,
                                            to.output)};
            !res) {
            return res;
        }
        if (DecodingResult res{decode_string(payload, to.error)}; !res) {
            return res;
        }
        return decode(payload, to.depth, Leftover::kAllow);
    });
}

void encode(Bytes& to, const db::Erc20Transfer& record) {
    Bytes payload;
    encode(payload, record.contract);
    encode(payload, record.from);
    encode(payload, record.to);
    encode(payload, record.value);
    encode(payload, record.tx_hash);
    encode(payload, record.block_num);
    encode(payload, record.log_index);
    encode(payload, record.timestamp);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::Erc20Transfer& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) {
        return decode_items(payload, to.contract, to.from, to.to, to.value, to.tx_hash, to.block_num, to.log_index,
                            to.timestamp);
    });
}

void encode(Bytes& to, const db::Erc721Transfer& record) {
    Bytes payload;
    encode(payload, record.contract);
    encode(payload, record.from);
    encode(payload, record.to);
    encode(payload, record.token_id);
    encode(payload, record.tx_hash);
    encode(payload, record.block_num);
    encode(payload, record.log_index);
    encode(payload, record.timestamp);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::Erc721Transfer& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) {
        return decode_items(payload, to.contract, to.from, to.to, to.token_id, to.tx_hash, to.block_num,
                            to.log_index, to.timestamp);
    });
}

void encode(Bytes& to, const db::NftOwnership& record) {
    Bytes payload;
    encode(payload, record.contract);
    encode(payload, record.token_id);
    encode(payload, record.owner);
    encode(payload, record.block_num);
    encode(payload, record.log_index);
    encode(payload, record.tx_hash);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::NftOwnership& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) {
        return decode_items(payload, to.contract, to.token_id, to.owner, to.block_num, to.log_index, to.tx_hash);
    });
}

void encode(Bytes& to, const db::SetCodeAuthorizationRecord& record) {
    Bytes payload;
    encode(payload, record.tx_hash);
    encode(payload, record.block_num);
    encode(payload, record.block_hash);
    encode(payload, record.tx_index);
    encode(payload, record.auth_index);
    encode(payload, record.target);
    encode(payload, record.authority);
    encode(payload, record.chain_id);
    encode(payload, record.nonce);
    encode(payload, record.y_parity);
    encode(payload, record.r);
    encode(payload, record.s);
    encode(payload, record.applied);
    encode_string(payload, record.error);
    encode(payload, record.timestamp);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::SetCodeAuthorizationRecord& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) -> DecodingResult {
        if (DecodingResult res{decode_items(payload, to.tx_hash, to.block_num, to.block_hash, to.tx_index,
                                            to.auth_index, to.target, to.authority, to.chain_id, to.nonce,
                                            to.y_parity, to.r, to.s, to.applied)};
            !res) {
            return res;
        }
        if (DecodingResult res{decode_string(payload, to.error)}; !res) {
            return res;
        }
        return decode(payload, to.timestamp, Leftover::kAllow);
    });
}

void encode(Bytes& to, const db::AddressDelegationState& record) {
    Bytes payload;
    encode(payload, record.address);
    encode(payload, record.target);
    encode(payload, record.last_updated_block);
    encode(payload, record.last_updated_tx_hash);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::AddressDelegationState& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) {
        return decode_items(payload, to.address, to.target, to.last_updated_block, to.last_updated_tx_hash);
    });
}

void encode(Bytes& to, const db::WbftAggregatedSeal& seal) {
    Bytes payload;
    encode(payload, ByteView{seal.sealers});
    encode(payload, ByteView{seal.signature});
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::WbftAggregatedSeal& to, Leftover mode) noexcept {
    return decode_record_list(from, mode,
                              [&](ByteView& payload) { return decode_items(payload, to.sealers, to.signature); });
}

void encode(Bytes& to, const db::Candidate& candidate) {
    Bytes payload;
    encode(payload, candidate.address);
    encode(payload, candidate.diligence);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::Candidate& to, Leftover mode) noexcept {
    return decode_record_list(from, mode,
                              [&](ByteView& payload) { return decode_items(payload, to.address, to.diligence); });
}

void encode(Bytes& to, const db::EpochInfo& info) {
    Bytes payload;
    encode(payload, info.epoch_num);
    encode(payload, info.block_num);
    encode_records(payload, info.candidates);
    encode(payload, info.validators);
    encode(payload, info.bls_public_keys);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::EpochInfo& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) -> DecodingResult {
        if (DecodingResult res{decode_items(payload, to.epoch_num, to.block_num)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_records(payload, to.candidates)}; !res) {
            return res;
        }
        return decode_items(payload, to.validators, to.bls_public_keys);
    });
}

void encode(Bytes& to, const db::WbftBlockRecord& record) {
    Bytes payload;
    encode(payload, record.block_num);
    encode(payload, record.block_hash);
    encode(payload, ByteView{record.randao_reveal});
    encode(payload, record.prev_round);
    encode_optional(payload, record.prev_prepared_seal);
    encode_optional(payload, record.prev_committed_seal);
    encode(payload, record.round);
    encode_optional(payload, record.prepared_seal);
    encode_optional(payload, record.committed_seal);
    encode(payload, record.gas_tip);
    encode_optional(payload, record.epoch_info);
    encode(payload, record.timestamp);
    encode(payload, record.prepared_signers);
    encode(payload, record.committed_signers);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::WbftBlockRecord& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) -> DecodingResult {
        if (DecodingResult res{decode_items(payload, to.block_num, to.block_hash, to.randao_reveal, to.prev_round)};
            !res) {
            return res;
        }
        if (DecodingResult res{decode_optional(payload, to.prev_prepared_seal)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_optional(payload, to.prev_committed_seal)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(payload, to.round, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_optional(payload, to.prepared_seal)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_optional(payload, to.committed_seal)}; !res) {
            return res;
        }
        if (DecodingResult res{decode(payload, to.gas_tip, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_optional(payload, to.epoch_info)}; !res) {
            return res;
        }
        return decode_items(payload, to.timestamp, to.prepared_signers, to.committed_signers);
    });
}

void encode(Bytes& to, const db::ValidatorSigningStats& stats) {
    Bytes payload;
    encode(payload, stats.validator);
    encode(payload, stats.validator_index);
    encode(payload, stats.prepare_sign_count);
    encode(payload, stats.prepare_miss_count);
    encode(payload, stats.commit_sign_count);
    encode(payload, stats.commit_miss_count);
    encode(payload, stats.from_block);
    encode(payload, stats.to_block);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::ValidatorSigningStats& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) {
        return decode_items(payload, to.validator, to.validator_index, to.prepare_sign_count, to.prepare_miss_count,
                            to.commit_sign_count, to.commit_miss_count, to.from_block, to.to_block);
    });
}

void encode(Bytes& to, const db::ValidatorSigningActivity& activity) {
    Bytes payload;
    encode(payload, activity.block_num);
    encode(payload, activity.block_hash);
    encode(payload, activity.validator);
    encode(payload, activity.validator_index);
    encode(payload, activity.signed_prepare);
    encode(payload, activity.signed_commit);
    encode(payload, activity.round);
    encode(payload, activity.timestamp);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::ValidatorSigningActivity& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) {
        return decode_items(payload, to.block_num, to.block_hash, to.validator, to.validator_index,
                            to.signed_prepare, to.signed_commit, to.round, to.timestamp);
    });
}

void encode(Bytes& to, const db::BalanceEntry& entry) {
    Bytes payload;
    encode(payload, entry.address);
    encode(payload, entry.block_num);
    encode(payload, entry.sequence);
    encode(payload, static_cast<uint8_t>(entry.kind));
    encode(payload, entry.negative);
    encode(payload, entry.amount);
    encode(payload, entry.tx_hash);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::BalanceEntry& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) -> DecodingResult {
        uint8_t kind{0};
        if (DecodingResult res{decode_items(payload, to.address, to.block_num, to.sequence, kind, to.negative,
                                            to.amount, to.tx_hash)};
            !res) {
            return res;
        }
        if (kind > static_cast<uint8_t>(db::BalanceEntry::Kind::kSnapshot)) {
            return tl::unexpected{DecodingError::kInvalidFieldset};
        }
        to.kind = static_cast<db::BalanceEntry::Kind>(kind);
        return {};
    });
}

void encode(Bytes& to, const db::SystemContractEvent& event) {
    Bytes payload;
    encode(payload, static_cast<uint8_t>(event.kind));
    encode(payload, event.contract);
    encode(payload, event.block_num);
    encode(payload, event.tx_hash);
    encode(payload, event.log_index);
    encode(payload, event.timestamp);
    encode(payload, event.account);
    encode(payload, event.counterparty);
    encode(payload, event.proposal_id);
    encode(payload, event.amount);
    encode(payload, event.previous_amount);
    encode(payload, event.approval);
    encode(payload, event.quorum);
    encode(payload, event.tag);
    encode(payload, ByteView{event.payload});
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::SystemContractEvent& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) -> DecodingResult {
        uint8_t kind{0};
        if (DecodingResult res{decode_items(payload, kind, to.contract, to.block_num, to.tx_hash, to.log_index,
                                            to.timestamp, to.account, to.counterparty, to.proposal_id, to.amount,
                                            to.previous_amount, to.approval, to.quorum, to.tag, to.payload)};
            !res) {
            return res;
        }
        const auto known_kind{magic_enum::enum_cast<db::SystemEventKind>(kind)};
        if (!known_kind) {
            return tl::unexpected{DecodingError::kInvalidFieldset};
        }
        to.kind = *known_kind;
        return {};
    });
}

void encode(Bytes& to, const db::BlacklistStatus& status) {
    Bytes payload;
    encode(payload, status.account);
    encode(payload, status.blacklisted);
    encode(payload, status.block_num);
    encode(payload, status.proposal_id);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::BlacklistStatus& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) {
        return decode_items(payload, to.account, to.blacklisted, to.block_num, to.proposal_id);
    });
}

void encode(Bytes& to, const db::Proposal& proposal) {
    Bytes payload;
    encode(payload, proposal.contract);
    encode(payload, proposal.proposal_id);
    encode(payload, proposal.proposer);
    encode(payload, proposal.action_type);
    encode(payload, ByteView{proposal.call_data});
    encode(payload, proposal.member_version);
    encode(payload, proposal.required_approvals);
    encode(payload, proposal.approved);
    encode(payload, proposal.rejected);
    encode(payload, static_cast<uint8_t>(proposal.status));
    encode(payload, proposal.created_at);
    encode(payload, proposal.executed_at);
    encode(payload, proposal.block_num);
    encode(payload, proposal.tx_hash);
    encode_list(to, payload);
}

DecodingResult decode(ByteView& from, db::Proposal& to, Leftover mode) noexcept {
    return decode_record_list(from, mode, [&](ByteView& payload) -> DecodingResult {
        uint8_t status{0};
        if (DecodingResult res{decode_items(payload, to.contract, to.proposal_id, to.proposer, to.action_type,
                                            to.call_data, to.member_version, to.required_approvals, to.approved,
                                            to.rejected, status, to.created_at, to.executed_at, to.block_num,
                                            to.tx_hash)};
            !res) {
            return res;
        }
        const auto known_status{magic_enum::enum_cast<db::ProposalStatus>(status)};
        if (!known_status) {
            return tl::unexpected{DecodingError::kInvalidFieldset};
        }
        to.status = *known_status;
        return {};
    });
}

}  // namespace quarry::rlp

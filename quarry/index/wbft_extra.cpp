// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "wbft_extra.hpp"

#include <algorithm>
#include <string>

#include <quarry/core/common/error.hpp>
#include <quarry/core/rlp/decode.hpp>
#include <quarry/core/rlp/encode.hpp>

namespace quarry::index {

namespace {

    //! \brief Peeks for the empty list standing for an absent item, otherwise decodes the item with func
    template <class T, class Func>
    DecodingResult decode_nullable(ByteView& from, std::optional<T>& to, Func&& func) noexcept {
        ByteView peek{from};
        const auto payload{rlp::decode_list(peek)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        if (payload->empty()) {
            from = peek;
            to.reset();
            return {};
        }
        T value;
        if (DecodingResult res{func(from, value)}; !res) {
            return res;
        }
        to = std::move(value);
        return {};
    }

    DecodingResult decode_seal(ByteView& from, db::WbftAggregatedSeal& to) noexcept {
        return rlp::decode(from, to, rlp::Leftover::kAllow);
    }

    DecodingResult decode_epoch(ByteView& from, WbftEpochAnnouncement& to) noexcept {
        auto payload{rlp::decode_list(from)};
        if (!payload) {
            return tl::unexpected{payload.error()};
        }
        auto candidates{rlp::decode_list(*payload)};
        if (!candidates) {
            return tl::unexpected{candidates.error()};
        }
        while (!candidates->empty()) {
            if (DecodingResult res{rlp::decode(*candidates, to.candidates.emplace_back(), rlp::Leftover::kAllow)};
                !res) {
                return res;
            }
        }
        if (DecodingResult res{rlp::decode_items(*payload, to.validators, to.bls_public_keys)}; !res) {
            return res;
        }
        return rlp::finalize_list(*payload, from, rlp::Leftover::kAllow);
    }

    void encode_nullable_seal(Bytes& to, const std::optional<db::WbftAggregatedSeal>& seal) {
        if (seal) {
            rlp::encode(to, *seal);
        } else {
            rlp::encode_list(to, {});
        }
    }

    void encode_epoch(Bytes& to, const std::optional<WbftEpochAnnouncement>& epoch) {
        if (!epoch) {
            rlp::encode_list(to, {});
            return;
        }
        Bytes candidates;
        for (const auto& candidate : epoch->candidates) {
            rlp::encode(candidates, candidate);
        }
        Bytes payload;
        rlp::encode_list(payload, candidates);
        rlp::encode(payload, epoch->validators);
        rlp::encode(payload, epoch->bls_public_keys);
        rlp::encode_list(to, payload);
    }

    std::vector<evmc::address> resolve_signers(const std::optional<db::WbftAggregatedSeal>& seal,
                                               const std::optional<db::EpochInfo>& epoch) {
        if (!seal || !epoch) {
            return {};
        }
        return extract_signers(seal->sealers, *epoch);
    }

}  // namespace

tl::expected<WbftExtra, DecodingError> decode_wbft_extra(ByteView extra) noexcept {
    if (extra.size() < kWbftVanityLength) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    WbftExtra decoded;
    decoded.vanity = Bytes{extra.substr(0, kWbftVanityLength)};
    ByteView from{extra.substr(kWbftVanityLength)};

    auto payload{rlp::decode_list(from)};
    if (!payload) {
        return tl::unexpected{payload.error()};
    }
    if (DecodingResult res{rlp::decode_items(*payload, decoded.randao_reveal, decoded.prev_round)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (DecodingResult res{decode_nullable(*payload, decoded.prev_prepared_seal, decode_seal)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (DecodingResult res{decode_nullable(*payload, decoded.prev_committed_seal, decode_seal)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (DecodingResult res{rlp::decode(*payload, decoded.round, rlp::Leftover::kAllow)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (DecodingResult res{decode_nullable(*payload, decoded.prepared_seal, decode_seal)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (DecodingResult res{decode_nullable(*payload, decoded.committed_seal, decode_seal)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (DecodingResult res{rlp::decode(*payload, decoded.gas_tip, rlp::Leftover::kAllow)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (DecodingResult res{decode_nullable(*payload, decoded.epoch, decode_epoch)}; !res) {
        return tl::unexpected{res.error()};
    }
    if (DecodingResult res{rlp::finalize_list(*payload, from, rlp::Leftover::kProhibit)}; !res) {
        return tl::unexpected{res.error()};
    }
    return decoded;
}

Bytes encode_wbft_extra(const WbftExtra& extra) {
    Bytes payload;
    rlp::encode(payload, ByteView{extra.randao_reveal});
    rlp::encode(payload, extra.prev_round);
    encode_nullable_seal(payload, extra.prev_prepared_seal);
    encode_nullable_seal(payload, extra.prev_committed_seal);
    rlp::encode(payload, extra.round);
    encode_nullable_seal(payload, extra.prepared_seal);
    encode_nullable_seal(payload, extra.committed_seal);
    rlp::encode(payload, extra.gas_tip);
    encode_epoch(payload, extra.epoch);

    Bytes out{extra.vanity.substr(0, kWbftVanityLength)};
    out.resize(kWbftVanityLength, 0);
    rlp::encode_list(out, payload);
    return out;
}

bool has_signed(ByteView sealers, size_t index) noexcept {
    const size_t byte_index{index / 8};
    if (byte_index >= sealers.size()) {
        return false;
    }
    return (sealers[byte_index] & (1u << (index % 8))) != 0;
}

std::vector<evmc::address> validator_addresses(const db::EpochInfo& epoch) {
    std::vector<evmc::address> addresses;
    addresses.reserve(epoch.validators.size());
    for (const uint32_t candidate_index : epoch.validators) {
        if (candidate_index >= epoch.candidates.size()) {
            throw Error{ErrorCode::kDecodeFailure, "epoch " + std::to_string(epoch.epoch_num) +
                                                       " references missing candidate " +
                                                       std::to_string(candidate_index)};
        }
        addresses.push_back(epoch.candidates[candidate_index].address);
    }
    return addresses;
}

std::vector<evmc::address> extract_signers(ByteView sealers, const db::EpochInfo& epoch) {
    const auto validators{validator_addresses(epoch)};
    std::vector<evmc::address> signers;
    for (size_t j{0}; j < sealers.size(); ++j) {
        for (size_t i{0}; i < 8; ++i) {
            const size_t index{j * 8 + i};
            if (index >= validators.size()) {
                return signers;
            }
            if (sealers[j] & (1u << i)) {
                signers.push_back(validators[index]);
            }
        }
    }
    return signers;
}

std::optional<db::EpochInfo> announced_epoch(const BlockHeader& header, const WbftExtra& extra,
                                             uint64_t epoch_length) {
    if (!extra.epoch) {
        return std::nullopt;
    }
    return db::EpochInfo{
        .epoch_num = epoch_length > 0 ? header.number / epoch_length : 0,
        .block_num = header.number,
        .candidates = extra.epoch->candidates,
        .validators = extra.epoch->validators,
        .bls_public_keys = extra.epoch->bls_public_keys,
    };
}

db::WbftBlockRecord make_wbft_block_record(const BlockHeader& header, const WbftExtra& extra,
                                           const std::optional<db::EpochInfo>& epoch_in_force,
                                           const std::optional<db::EpochInfo>& announced) {
    return db::WbftBlockRecord{
        .block_num = header.number,
        .block_hash = header.hash,
        .randao_reveal = extra.randao_reveal,
        .prev_round = extra.prev_round,
        .prev_prepared_seal = extra.prev_prepared_seal,
        .prev_committed_seal = extra.prev_committed_seal,
        .round = extra.round,
        .prepared_seal = extra.prepared_seal,
        .committed_seal = extra.committed_seal,
        .gas_tip = extra.gas_tip,
        .epoch_info = announced,
        .timestamp = header.timestamp,
        .prepared_signers = resolve_signers(extra.prepared_seal, epoch_in_force),
        .committed_signers = resolve_signers(extra.committed_seal, epoch_in_force),
    };
}

std::vector<db::ValidatorSigningActivity> make_signing_activity(const BlockHeader& header, const WbftExtra& extra,
                                                                const db::EpochInfo& epoch_in_force) {
    const auto validators{validator_addresses(epoch_in_force)};
    const ByteView prepared{extra.prepared_seal ? ByteView{extra.prepared_seal->sealers} : ByteView{}};
    const ByteView committed{extra.committed_seal ? ByteView{extra.committed_seal->sealers} : ByteView{}};

    std::vector<db::ValidatorSigningActivity> activity;
    activity.reserve(validators.size());
    for (uint32_t index{0}; index < validators.size(); ++index) {
        activity.push_back({
            .block_num = header.number,
            .block_hash = header.hash,
            .validator = validators[index],
            .validator_index = index,
            .signed_prepare = has_signed(prepared, index),
            .signed_commit = has_signed(committed, index),
            .round = extra.round,
            .timestamp = header.timestamp,
        });
    }
    return activity;
}

}  // namespace quarry::index

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// WBFT consensus data carried by the block header extra field:
// 32 bytes of vanity followed by
// rlp([randao, prev_round, prev_prepared?, prev_committed?, round, prepared?, committed?, gas_tip, epoch_info?])
// where an absent optional item is encoded as the empty list.

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <quarry/core/common/base.hpp>
#include <quarry/core/common/error.hpp>
#include <quarry/core/types/block.hpp>
#include <quarry/db/index/records.hpp>

namespace quarry::index {

inline constexpr size_t kWbftVanityLength{32};

//! \brief Validator set announced in the extra data, without the epoch coordinates assigned when stored
struct WbftEpochAnnouncement {
    std::vector<db::Candidate> candidates;
    std::vector<uint32_t> validators;
    std::vector<Bytes> bls_public_keys;

    friend bool operator==(const WbftEpochAnnouncement&, const WbftEpochAnnouncement&) = default;
};

struct WbftExtra {
    Bytes vanity;
    Bytes randao_reveal;
    uint32_t prev_round{0};
    std::optional<db::WbftAggregatedSeal> prev_prepared_seal;
    std::optional<db::WbftAggregatedSeal> prev_committed_seal;
    uint32_t round{0};
    std::optional<db::WbftAggregatedSeal> prepared_seal;
    std::optional<db::WbftAggregatedSeal> committed_seal;
    intx::uint256 gas_tip{0};
    std::optional<WbftEpochAnnouncement> epoch;

    friend bool operator==(const WbftExtra&, const WbftExtra&) = default;
};

tl::expected<WbftExtra, DecodingError> decode_wbft_extra(ByteView extra) noexcept;

//! \brief Builds the header extra field, the vanity is zero padded or truncated to 32 bytes
Bytes encode_wbft_extra(const WbftExtra& extra);

//! \brief Whether bit (index % 8) of byte (index / 8) is set in the sealers bitmap
bool has_signed(ByteView sealers, size_t index) noexcept;

//! \brief Addresses of the active validators of an epoch, in validator index order
//! \remarks Throws Error{kDecodeFailure} if a validator references a missing candidate
std::vector<evmc::address> validator_addresses(const db::EpochInfo& epoch);

//! \brief Resolves the sealers bitmap against the validators of an epoch
//! \remarks Bits beyond the validator count are ignored
std::vector<evmc::address> extract_signers(ByteView sealers, const db::EpochInfo& epoch);

//! \brief The epoch info announced by a block, stored under epoch block_num / epoch_length
std::optional<db::EpochInfo> announced_epoch(const BlockHeader& header, const WbftExtra& extra,
                                             uint64_t epoch_length);

//! \brief The consensus record of a block, signers resolved against the validator set in force if known
db::WbftBlockRecord make_wbft_block_record(const BlockHeader& header, const WbftExtra& extra,
                                           const std::optional<db::EpochInfo>& epoch_in_force,
                                           const std::optional<db::EpochInfo>& announced);

//! \brief One sign/miss entry per validator of the epoch in force for the prepare and commit seals of a block
std::vector<db::ValidatorSigningActivity> make_signing_activity(const BlockHeader& header, const WbftExtra& extra,
                                                                const db::EpochInfo& epoch_in_force);

}  // namespace quarry::index

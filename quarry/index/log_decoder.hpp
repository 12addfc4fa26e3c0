// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>
#include <evmc/evmc.hpp>

#include <quarry/core/common/base.hpp>
#include <quarry/core/types/log.hpp>
#include <quarry/db/index/records.hpp>

namespace quarry::index {

using evmc::literals::operator""_address;

inline constexpr evmc::address kNativeCoinAdapter{0x0000000000000000000000000000000000001000_address};
inline constexpr evmc::address kGovValidator{0x0000000000000000000000000000000000001001_address};
inline constexpr evmc::address kGovMasterMinter{0x0000000000000000000000000000000000001002_address};
inline constexpr evmc::address kGovMinter{0x0000000000000000000000000000000000001003_address};
inline constexpr evmc::address kGovCouncil{0x0000000000000000000000000000000000001004_address};

//! \brief keccak256 of a canonical event signature, i.e. the topic0 of the logs it emits
evmc::bytes32 event_topic(std::string_view signature);

//! \brief The event signatures and emitters a LogDecoder recognizes
struct SignatureRegistry {
    std::string transfer_signature{"Transfer(address,address,uint256)"};
    std::vector<std::pair<std::string, db::SystemEventKind>> system_events;
    std::vector<evmc::address> system_contracts;

    //! \brief Token transfers plus the events of the system contracts deployed at genesis
    static SignatureRegistry defaults();
};

//! \brief Outcome of decoding one log: nothing known, a token transfer or a system contract event
using DecodedLog = std::variant<std::monostate, db::Erc20Transfer, db::Erc721Transfer, db::SystemContractEvent>;

//! \brief Maps logs to the records of the token and system contract indexes.
//! \details The signature tables are immutable snapshots: reload() swaps in a new one while decode() calls
//! in flight keep using the snapshot they started with.
class LogDecoder {
  public:
    LogDecoder() = default;
    explicit LogDecoder(const SignatureRegistry& registry) { init(registry); }

    LogDecoder(const LogDecoder&) = delete;
    LogDecoder& operator=(const LogDecoder&) = delete;

    //! \brief Builds the signature tables
    //! \remarks Throws Error{kInvalidInput} if already initialized, use reload() to replace the tables
    void init(const SignatureRegistry& registry);

    //! \brief Atomically replaces the signature tables
    void reload(const SignatureRegistry& registry);

    bool is_initialized() const;

    //! \brief Decodes a log emitted in a block with the provided timestamp
    //! \return std::monostate for logs matching no known signature
    //! \remarks Throws Error{kDecodeFailure} when a log matches a known signature but not its layout
    DecodedLog decode(const Log& log, BlockTime timestamp) const;

    std::optional<db::SystemEventKind> system_event_kind(const evmc::bytes32& topic0) const;
    bool is_system_contract(const evmc::address& address) const;

  private:
    struct Tables {
        evmc::bytes32 transfer_topic;
        absl::flat_hash_map<evmc::bytes32, db::SystemEventKind> system_events;
        absl::flat_hash_set<evmc::address> system_contracts;
    };

    static std::shared_ptr<const Tables> build_tables(const SignatureRegistry& registry);

    //! \brief The current tables, throws Error{kInvalidInput} before init()
    std::shared_ptr<const Tables> tables() const;

    mutable std::mutex mutex_;
    std::shared_ptr<const Tables> tables_;
};

}  // namespace quarry::index

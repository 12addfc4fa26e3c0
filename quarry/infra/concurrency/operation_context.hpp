// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <optional>

#include <quarry/core/common/error.hpp>

namespace quarry {

//! \brief Cancellation flag plus optional deadline shared by the caller and a running operation
//! \details Long range scans check the context on every iteration, not only at entry
class OperationContext {
  public:
    using Clock = std::chrono::steady_clock;

    OperationContext() = default;
    explicit OperationContext(Clock::duration timeout) : deadline_{Clock::now() + timeout} {}

    OperationContext(const OperationContext&) = delete;
    OperationContext& operator=(const OperationContext&) = delete;

    //! \brief Requests cancellation, may be called from any thread
    void cancel() noexcept { cancelled_.store(true); }

    bool is_cancelled() const noexcept {
        if (cancelled_.load()) {
            return true;
        }
        return deadline_ && Clock::now() >= *deadline_;
    }

    //! \brief Throws Error{kCancelled} if cancellation has been requested or the deadline has passed
    void throw_if_cancelled() const {
        if (is_cancelled()) [[unlikely]] {
            throw Error{ErrorCode::kCancelled, cancelled_.load() ? "operation cancelled" : "operation deadline exceeded"};
        }
    }

    std::optional<Clock::time_point> deadline() const noexcept { return deadline_; }

  private:
    std::atomic_bool cancelled_{false};
    std::optional<Clock::time_point> deadline_;
};

}  // namespace quarry

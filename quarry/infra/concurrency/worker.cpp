// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "worker.hpp"

#include <chrono>
#include <stdexcept>

#include <quarry/infra/common/log.hpp>

namespace quarry {

Worker::~Worker() { stop(/*wait=*/true); }

void Worker::start(bool wait) {
    State expected_stopped{State::kStopped};
    if (!state_.compare_exchange_strong(expected_stopped, State::kStarting)) {
        return;
    }

    if (thread_ && thread_->joinable()) {
        thread_->join();
    }
    exception_ptr_ = nullptr;

    thread_ = std::make_unique<std::thread>([&]() {
        log::set_thread_name(name_.c_str());
        State expected_starting{State::kStarting};
        if (state_.compare_exchange_strong(expected_starting, State::kStarted)) {
            signal_worker_started(this);
            try {
                work();
            } catch (const std::exception& ex) {
                log::Error(name_, {"exception", std::string(ex.what())});
                exception_ptr_ = std::current_exception();
            }
        }
        state_.store(State::kStopped);
        signal_worker_stopped(this);
    });

    while (wait) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        if (auto state{get_state()}; state != State::kStarting) {
            break;
        }
    }
}

void Worker::stop(bool wait) {
    if (!thread_) return;

    State expected_started{State::kStarted};
    if (!state_.compare_exchange_strong(expected_started, State::kStopping)) {
        State expected_starting{State::kStarting};
        (void)state_.compare_exchange_strong(expected_starting, State::kStopping);
    }

    if (wait && thread_->joinable()) {
        thread_->join();
        thread_.reset();
    }
}

std::string Worker::what() {
    std::string ret{};
    try {
        rethrow();
    } catch (const std::exception& ex) {
        ret = ex.what();
    }
    return ret;
}

void Worker::rethrow() {
    if (has_exception()) {
        std::rethrow_exception(exception_ptr_);
    }
}

}  // namespace quarry

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <exception>
#include <memory>
#include <string>
#include <thread>

#include <boost/signals2/signal.hpp>

namespace quarry {

//! \brief A named thread running a work() loop until asked to stop
class Worker {
  public:
    enum class State {
        kStopped,
        kStarting,
        kStarted,
        kStopping
    };

    Worker() : name_{"worker"} {}
    explicit Worker(std::string name) : name_{std::move(name)} {}

    // Not movable nor copyable
    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    virtual ~Worker();

    void start(bool wait = true);          // Start worker thread (by default waits for status)
    virtual void stop(bool wait = false);  // Stops worker thread (optionally wait for complete stop)

    //! \brief Whether this worker/thread has received a stop request
    bool is_stopping() const { return state_.load() == State::kStopping; }

    //! \brief Retrieves current state of thread
    State get_state() const { return state_.load(); }

    //! \brief Whether this worker/thread has encountered an exception
    bool has_exception() const { return exception_ptr_ != nullptr; }

    //! \brief Returns the message of captured exception (if any)
    std::string what();

    //! \brief Rethrows captured exception (if any)
    void rethrow();

    //! \brief Signals connected handlers the underlying thread is about to start
    boost::signals2::signal<void(Worker* sender)> signal_worker_started;

    //! \brief Signals connected handlers the underlying thread is terminated
    boost::signals2::signal<void(Worker* sender)> signal_worker_stopped;

  protected:
    std::string name_;

  private:
    std::atomic<State> state_{State::kStopped};
    std::unique_ptr<std::thread> thread_{nullptr};
    std::exception_ptr exception_ptr_{nullptr};
    virtual void work() = 0;  // Derived classes must override
};

}  // namespace quarry

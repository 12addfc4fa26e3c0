// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <optional>
#include <utility>

#include <boost/chrono/duration.hpp>
#include <boost/circular_buffer.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>

namespace quarry {

/**
 * @class BoundedBuffer
 * @brief A thread-safe bounded buffer implementation.
 * It uses boost::circular_buffer as the underlying container. Producers either wait for free space (push_front)
 * or give up immediately when the buffer is full (try_push_front), so that a slow consumer can never stall a
 * producer which cannot afford to wait.
 * @tparam T The type of items stored in the buffer.
 */
template <class T>
class BoundedBuffer {
  public:
    using size_type = typename boost::circular_buffer<T>::size_type;
    using value_type = typename boost::circular_buffer<T>::value_type;

    explicit BoundedBuffer(size_type capacity) : capacity_{capacity}, unread_(0), container_(capacity) {}

    BoundedBuffer(const BoundedBuffer&) = delete;
    BoundedBuffer& operator=(const BoundedBuffer&) = delete;

    //! \brief Blocking push: waits until there is room or the buffer is stopped
    //! \return false if the buffer has been stopped
    bool push_front(value_type&& item) {
        boost::unique_lock<boost::mutex> lock(mutex_);

        not_full_.wait(lock, [&] { return stop_ || is_not_full(); });

        if (stop_) {
            return false;
        }

        container_.push_front(std::move(item));
        ++unread_;
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    //! \brief Non-blocking push
    //! \return false if the buffer is full or stopped, the item is left untouched
    bool try_push_front(const value_type& item) {
        boost::unique_lock<boost::mutex> lock(mutex_);
        if (stop_ || !is_not_full()) {
            return false;
        }
        container_.push_front(item);
        ++unread_;
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    //! \brief Blocking pop of the oldest item
    //! \return false if the buffer has been stopped
    bool pop_back(value_type* item) {
        boost::unique_lock<boost::mutex> lock(mutex_);

        not_empty_.wait(lock, [&] { return stop_ || is_not_empty(); });

        if (stop_) {
            return false;
        }

        *item = std::move(container_[--unread_]);
        lock.unlock();
        not_full_.notify_one();
        return true;
    }

    //! \brief Pops the oldest item waiting at most for the provided timeout
    //! \return std::nullopt on timeout or if the buffer has been stopped
    template <class Rep, class Period>
    std::optional<value_type> pop_back_for(std::chrono::duration<Rep, Period> timeout) {
        boost::unique_lock<boost::mutex> lock(mutex_);

        const auto wait_time{boost::chrono::nanoseconds{std::chrono::nanoseconds{timeout}.count()}};
        if (!not_empty_.wait_for(lock, wait_time, [&] { return stop_ || is_not_empty(); }) || stop_) {
            return std::nullopt;
        }

        std::optional<value_type> item{std::move(container_[--unread_])};
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    //! \brief Non-blocking pop of the oldest item
    std::optional<value_type> try_pop_back() {
        boost::unique_lock<boost::mutex> lock(mutex_);
        if (stop_ || !is_not_empty()) {
            return std::nullopt;
        }
        std::optional<value_type> item{std::move(container_[--unread_])};
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    void terminate_and_release_all() {
        boost::unique_lock<boost::mutex> lock(mutex_);
        stop_ = true;
        lock.unlock();
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_stopped() const {
        boost::unique_lock<boost::mutex> lock(mutex_);
        return stop_;
    }

    size_type size() const {
        boost::unique_lock<boost::mutex> lock(mutex_);
        return unread_;
    }

    size_type capacity() const {
        return capacity_;
    }

  private:
    bool is_not_empty() const { return unread_ > 0; }
    bool is_not_full() const { return unread_ < capacity_; }

    bool stop_{false};
    size_type capacity_;
    size_type unread_;
    boost::circular_buffer<T> container_;
    mutable boost::mutex mutex_;
    boost::condition_variable not_empty_;
    boost::condition_variable not_full_;
};

}  // namespace quarry

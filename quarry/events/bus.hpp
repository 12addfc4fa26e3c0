// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <absl/container/flat_hash_set.h>
#include <absl/time/time.h>
#include <boost/circular_buffer.hpp>

#include <quarry/events/filter.hpp>
#include <quarry/events/types.hpp>
#include <quarry/infra/concurrency/bounded_buffer.hpp>
#include <quarry/infra/concurrency/worker.hpp>

namespace quarry::events {

struct BusSettings {
    size_t ingress_capacity{1024};
    size_t default_subscriber_capacity{100};
    size_t history_size{100};  // events kept for replay to new subscribers
    std::chrono::milliseconds poll_interval{100};
};

struct SubscribeOptions {
    std::vector<EventType> types;  // empty means every type
    std::optional<Filter> filter;
    std::optional<size_t> capacity;  // BusSettings::default_subscriber_capacity when unset
    size_t replay_last{0};           // matching history events delivered right away, oldest first
};

struct SubscriberInfo {
    std::string id;
    std::vector<EventType> types;
    bool has_filter{false};
    uint64_t events_received{0};
    uint64_t events_dropped{0};
    absl::Time created_at;
    std::optional<absl::Time> last_event_at;
    absl::Duration uptime;
};

struct BusStats {
    uint64_t total_events{0};
    uint64_t total_deliveries{0};
    uint64_t dropped_events{0};
    uint64_t publish_rejections{0};
    size_t subscriber_count{0};
    size_t pending_events{0};  // published but not yet dispatched
};

//! \brief The receiving end of a subscription: a bounded queue filled by the bus dispatcher
class Subscription {
  public:
    Subscription(std::string id, std::vector<EventType> types, std::optional<Filter> filter, size_t capacity);

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    const std::string& id() const { return id_; }

    //! \brief Waits for the next event at most timeout
    //! \return std::nullopt on timeout or once the subscription is closed
    template <class Rep, class Period>
    std::optional<EventPtr> next(std::chrono::duration<Rep, Period> timeout) {
        return queue_.pop_back_for(timeout);
    }

    std::optional<EventPtr> try_next() { return queue_.try_pop_back(); }

    bool is_closed() const { return queue_.is_stopped(); }
    size_t pending() const { return queue_.size(); }
    size_t capacity() const { return queue_.capacity(); }

    SubscriberInfo info() const;

  private:
    friend class EventBus;

    //! \brief Whether the event is of a subscribed type and passes the filter
    bool accepts(const Event& event) const;

    //! \brief Non-blocking delivery counting the outcome
    bool deliver(const EventPtr& event);

    void close() { queue_.terminate_and_release_all(); }

    const std::string id_;
    const std::vector<EventType> types_;
    const absl::flat_hash_set<EventType> type_set_;
    const std::optional<Filter> filter_;
    const absl::Time created_at_;

    BoundedBuffer<EventPtr> queue_;
    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<int64_t> last_event_unix_ns_{0};  // 0 until the first delivery
};

//! \brief In-process publish/subscribe hub.
//! \details Publishers never block: events go into a bounded ingress buffer drained by a single dispatcher
//! thread, which records each event in the replay history and hands it to the bounded queue of every
//! subscription accepting it. A full subscriber queue drops the event for that subscriber only.
//! Events published before start() are queued and dispatched once the bus runs. A stopped bus cannot be restarted.
class EventBus final : public Worker {
  public:
    explicit EventBus(BusSettings settings = {});
    ~EventBus() override;

    //! \brief Queues an event for dispatch without blocking
    //! \return false if the bus is stopped or the ingress buffer is full
    bool publish(EventPtr event);

    //! \remarks Throws Error{kInvalidInput} for an empty or duplicate id, a zero capacity or an invalid filter
    std::shared_ptr<Subscription> subscribe(const std::string& id, SubscribeOptions options = {});

    //! \brief Removes and closes the subscription, no-op for unknown ids
    void unsubscribe(const std::string& id);

    std::optional<SubscriberInfo> get_subscriber_info(const std::string& id) const;
    std::vector<SubscriberInfo> get_all_subscriber_info() const;

    BusStats stats() const;
    size_t subscriber_count() const;
    bool is_closed() const { return closed_.load(); }

    //! \brief Stops dispatching and closes every subscription
    void stop(bool wait = false) override;

  private:
    void work() override;
    void dispatch(const EventPtr& event);

    const BusSettings settings_;
    BoundedBuffer<EventPtr> ingress_;
    std::atomic<bool> closed_{false};

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Subscription>> subscriptions_;
    boost::circular_buffer<EventPtr> history_;

    std::atomic<uint64_t> total_events_{0};
    std::atomic<uint64_t> total_deliveries_{0};
    std::atomic<uint64_t> dropped_events_{0};
    std::atomic<uint64_t> publish_rejections_{0};
};

}  // namespace quarry::events

// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "bus.hpp"

#include <absl/time/clock.h>

#include <quarry/core/common/error.hpp>
#include <quarry/infra/common/log.hpp>

namespace quarry::events {

Subscription::Subscription(std::string id, std::vector<EventType> types, std::optional<Filter> filter,
                           size_t capacity)
    : id_{std::move(id)},
      types_{std::move(types)},
      type_set_{types_.begin(), types_.end()},
      filter_{std::move(filter)},
      created_at_{absl::Now()},
      queue_{capacity} {}

SubscriberInfo Subscription::info() const {
    const int64_t last_ns{last_event_unix_ns_.load()};
    const absl::Time now{absl::Now()};
    return SubscriberInfo{
        .id = id_,
        .types = types_,
        .has_filter = filter_.has_value(),
        .events_received = received_.load(),
        .events_dropped = dropped_.load(),
        .created_at = created_at_,
        .last_event_at = last_ns != 0 ? std::make_optional(absl::FromUnixNanos(last_ns)) : std::nullopt,
        .uptime = now - created_at_,
    };
}

bool Subscription::accepts(const Event& event) const {
    if (!type_set_.empty() && !type_set_.contains(event.type())) {
        return false;
    }
    return !filter_ || filter_->matches(event);
}

bool Subscription::deliver(const EventPtr& event) {
    if (!queue_.try_push_front(event)) {
        ++dropped_;
        return false;
    }
    ++received_;
    last_event_unix_ns_.store(absl::ToUnixNanos(absl::Now()));
    return true;
}

EventBus::EventBus(BusSettings settings)
    : Worker{"event-bus"},
      settings_{settings},
      ingress_{settings.ingress_capacity},
      history_{settings.history_size} {
    ensure_input(settings_.ingress_capacity > 0, "event bus ingress capacity must be positive");
    ensure_input(settings_.default_subscriber_capacity > 0, "default subscriber capacity must be positive");
}

EventBus::~EventBus() {
    stop(/*wait=*/true);
}

bool EventBus::publish(EventPtr event) {
    if (!event) {
        return false;
    }
    if (closed_.load() || !ingress_.try_push_front(event)) {
        ++publish_rejections_;
        QUARRY_DEBUG_M("Event rejected", {"type", std::string{to_string(event->type())},
                                          "reason", closed_.load() ? "stopped" : "saturated"});
        return false;
    }
    return true;
}

std::shared_ptr<Subscription> EventBus::subscribe(const std::string& id, SubscribeOptions options) {
    ensure_input(!id.empty(), "subscriber id must not be empty");
    const size_t capacity{options.capacity.value_or(settings_.default_subscriber_capacity)};
    ensure_input(capacity > 0, "subscriber capacity must be positive");
    if (options.filter) {
        options.filter->validate();
    }
    ensure_input(!closed_.load(), "event bus is stopped");

    auto subscription{std::make_shared<Subscription>(id, std::move(options.types), std::move(options.filter),
                                                     capacity)};

    std::scoped_lock lock{mutex_};
    ensure_input(!subscriptions_.contains(id), "duplicate subscriber id " + id);

    if (options.replay_last > 0) {
        std::vector<EventPtr> matching;
        for (const auto& event : history_) {
            if (subscription->accepts(*event)) {
                matching.push_back(event);
            }
        }
        const size_t skip{matching.size() > options.replay_last ? matching.size() - options.replay_last : 0};
        for (size_t i{skip}; i < matching.size(); ++i) {
            (void)subscription->deliver(matching[i]);
        }
    }

    subscriptions_.emplace(id, subscription);
    log::Debug("Subscriber added", {"id", id, "capacity", std::to_string(capacity),
                                    "replayed", std::to_string(subscription->pending())});
    return subscription;
}

void EventBus::unsubscribe(const std::string& id) {
    std::shared_ptr<Subscription> subscription;
    {
        std::scoped_lock lock{mutex_};
        const auto it{subscriptions_.find(id)};
        if (it == subscriptions_.end()) {
            return;
        }
        subscription = std::move(it->second);
        subscriptions_.erase(it);
    }
    subscription->close();
    log::Debug("Subscriber removed", {"id", id});
}

std::optional<SubscriberInfo> EventBus::get_subscriber_info(const std::string& id) const {
    std::scoped_lock lock{mutex_};
    const auto it{subscriptions_.find(id)};
    if (it == subscriptions_.end()) {
        return std::nullopt;
    }
    return it->second->info();
}

std::vector<SubscriberInfo> EventBus::get_all_subscriber_info() const {
    std::scoped_lock lock{mutex_};
    std::vector<SubscriberInfo> infos;
    infos.reserve(subscriptions_.size());
    for (const auto& [_, subscription] : subscriptions_) {
        infos.push_back(subscription->info());
    }
    return infos;
}

BusStats EventBus::stats() const {
    return BusStats{
        .total_events = total_events_.load(),
        .total_deliveries = total_deliveries_.load(),
        .dropped_events = dropped_events_.load(),
        .publish_rejections = publish_rejections_.load(),
        .subscriber_count = subscriber_count(),
        .pending_events = ingress_.size(),
    };
}

size_t EventBus::subscriber_count() const {
    std::scoped_lock lock{mutex_};
    return subscriptions_.size();
}

void EventBus::stop(bool wait) {
    const bool already_closed{closed_.exchange(true)};
    Worker::stop(/*wait=*/false);
    ingress_.terminate_and_release_all();
    if (wait) {
        Worker::stop(/*wait=*/true);
    }
    if (already_closed) {
        return;
    }

    std::map<std::string, std::shared_ptr<Subscription>> subscriptions;
    {
        std::scoped_lock lock{mutex_};
        subscriptions.swap(subscriptions_);
    }
    for (const auto& [_, subscription] : subscriptions) {
        subscription->close();
    }
    log::Info("Event bus stopped", {"events", std::to_string(total_events_.load()),
                                    "deliveries", std::to_string(total_deliveries_.load()),
                                    "dropped", std::to_string(dropped_events_.load())});
}

void EventBus::work() {
    while (!is_stopping()) {
        const auto event{ingress_.pop_back_for(settings_.poll_interval)};
        if (!event) {
            continue;
        }
        dispatch(*event);
    }
}

void EventBus::dispatch(const EventPtr& event) {
    ++total_events_;
    std::scoped_lock lock{mutex_};
    history_.push_back(event);
    for (const auto& [_, subscription] : subscriptions_) {
        if (!subscription->accepts(*event)) {
            continue;
        }
        if (subscription->deliver(event)) {
            ++total_deliveries_;
        } else {
            ++dropped_events_;
            QUARRY_DEBUG_M("Subscriber queue full", {"id", subscription->id(),
                                                     "type", std::string{to_string(event->type())}});
        }
    }
}

}  // namespace quarry::events

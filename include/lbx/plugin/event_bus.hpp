#pragma once

/// @file event_bus.hpp
/// @brief Typed publish/subscribe bus between the game world and its presentation.

#include <algorithm>
#include <any>
#include <cstdint>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lbx::plugin {

/// Unique identifier for an event subscription.
using SubscriptionId = uint64_t;

/// Type-safe event bus with synchronous and deferred delivery.
///
/// Handlers for an event type run in priority order (lower value first);
/// equal priorities run in subscription order.
///
/// @code
///   EventBus bus;
///   auto id = bus.Subscribe<LootNotification>([](const LootNotification& n) {
///       show(n.message);
///   });
///   bus.PublishDeferred(LootNotification{...});
///   bus.ProcessDeferred();   // at the frame boundary
///   bus.Unsubscribe(id);
/// @endcode
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // -- Subscribe ------------------------------------------------------------

    /// Subscribe @p handler to events of type E.
    template <typename E>
    SubscriptionId Subscribe(std::function<void(const E&)> handler, int32_t priority = 0) {
        std::lock_guard lock(mutex_);

        Subscription sub;
        sub.id = nextId_++;
        sub.priority = priority;
        sub.invoke = [fn = std::move(handler)](const std::any& event) {
            fn(std::any_cast<const E&>(event));
        };

        auto& list = subscriptions_[std::type_index(typeid(E))];
        // Insert after every handler of equal or higher priority.
        auto pos = std::upper_bound(list.begin(), list.end(), priority,
                                    [](int32_t p, const Subscription& s) { return p < s.priority; });
        const auto id = sub.id;
        list.insert(pos, std::move(sub));
        return id;
    }

    /// Remove a subscription.  Unknown ids are ignored.
    void Unsubscribe(SubscriptionId id) {
        std::lock_guard lock(mutex_);
        for (auto it = subscriptions_.begin(); it != subscriptions_.end(); ++it) {
            auto& list = it->second;
            auto found = std::find_if(list.begin(), list.end(),
                                      [id](const Subscription& s) { return s.id == id; });
            if (found == list.end()) {
                continue;
            }
            list.erase(found);
            if (list.empty()) {
                subscriptions_.erase(it);
            }
            return;
        }
    }

    void UnsubscribeAll() {
        std::lock_guard lock(mutex_);
        subscriptions_.clear();
    }

    // -- Publish --------------------------------------------------------------

    /// Deliver @p event to every current handler on the calling thread.
    template <typename E>
    void Publish(const E& event) {
        std::vector<Subscription> targets;
        {
            std::lock_guard lock(mutex_);
            auto it = subscriptions_.find(std::type_index(typeid(E)));
            if (it == subscriptions_.end()) {
                return;
            }
            targets = it->second;
        }

        const std::any boxed = event;
        for (const auto& sub : targets) {
            sub.invoke(boxed);
        }
    }

    /// Queue a copy of @p event until the next ProcessDeferred().
    template <typename E>
    void PublishDeferred(E event) {
        std::lock_guard lock(mutex_);
        deferred_.emplace_back([this, evt = std::move(event)]() { Publish(evt); });
    }

    /// Deliver every queued event in FIFO order.
    ///
    /// Events queued by handlers during this call wait for the next one.
    void ProcessDeferred() {
        std::vector<std::function<void()>> batch;
        {
            std::lock_guard lock(mutex_);
            batch.swap(deferred_);
        }
        for (auto& deliver : batch) {
            deliver();
        }
    }

    // -- Queries --------------------------------------------------------------

    [[nodiscard]] std::size_t HandlerCount() const {
        std::lock_guard lock(mutex_);
        std::size_t total = 0;
        for (const auto& [type, list] : subscriptions_) {
            total += list.size();
        }
        return total;
    }

    template <typename E>
    [[nodiscard]] std::size_t HandlerCountFor() const {
        std::lock_guard lock(mutex_);
        auto it = subscriptions_.find(std::type_index(typeid(E)));
        return it == subscriptions_.end() ? 0 : it->second.size();
    }

    [[nodiscard]] std::size_t DeferredCount() const {
        std::lock_guard lock(mutex_);
        return deferred_.size();
    }

private:
    struct Subscription {
        SubscriptionId id = 0;
        int32_t priority = 0;
        std::function<void(const std::any&)> invoke;
    };

    /// Event type -> handlers sorted by priority.
    std::unordered_map<std::type_index, std::vector<Subscription>> subscriptions_;
    std::vector<std::function<void()>> deferred_;
    SubscriptionId nextId_ = 1;
    mutable std::mutex mutex_;
};

} // namespace lbx::plugin

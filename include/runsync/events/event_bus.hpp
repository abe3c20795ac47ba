/**
 * @file event_bus.hpp
 * @brief Type-safe event bus decoupling the engine from its observers
 *
 * The transfer engine and the inventory cache emit events without knowing
 * who listens; logging and metrics subscribe without knowing who emits.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<TransferCompletedEvent>([](const TransferCompletedEvent& e) { ... });
 * bus.emit(TransferCompletedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace runsync::events {

/**
 * @brief Type-erased publish/subscribe hub
 *
 * THREAD SAFETY:
 * - emit() may be called from several transfer workers at once
 * - Handlers run synchronously on the emitting thread, outside the lock,
 *   so a handler may subscribe or unsubscribe without deadlocking
 * - A handler that throws is logged; the remaining handlers still run
 */
class EventBus {
public:
    using HandlerId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const HandlerId id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].emplace_back(
            id, std::make_shared<HandlerImpl<EventType>>(std::move(handler)));
        return id;
    }

    template<typename EventType>
    void unsubscribe(HandlerId id) {
        unsubscribe(std::type_index(typeid(EventType)), id);
    }

    void unsubscribe(std::type_index type, HandlerId id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(type);
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const auto& entry) { return entry.first == id; }),
                   list.end());
    }

    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<HandlerBase>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            snapshot.reserve(it->second.size());
            for (const auto& entry : it->second) {
                snapshot.push_back(entry.second);
            }
        }

        for (const auto& handler : snapshot) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        explicit HandlerImpl(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            // Only ever stored under typeid(EventType).
            func(*static_cast<const EventType*>(event));
        }

        std::function<void(const EventType&)> func;
    };

    std::unordered_map<std::type_index, std::vector<std::pair<HandlerId, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    HandlerId next_handler_id_ = 0;
};

/**
 * @brief Subscriptions that are dropped together when the owner goes away
 *
 * Components capture `this` in their handlers, so they must unsubscribe
 * before they are destroyed.
 */
class SubscriptionSet {
public:
    explicit SubscriptionSet(EventBus& bus) : bus_(bus) {}
    ~SubscriptionSet() { reset(); }

    SubscriptionSet(const SubscriptionSet&) = delete;
    SubscriptionSet& operator=(const SubscriptionSet&) = delete;

    template<typename EventType, typename Handler>
    void add(Handler&& handler) {
        const auto id = bus_.subscribe<EventType>(std::function<void(const EventType&)>(std::forward<Handler>(handler)));
        ids_.emplace_back(std::type_index(typeid(EventType)), id);
    }

    void reset() {
        for (const auto& [type, id] : ids_) {
            bus_.unsubscribe(type, id);
        }
        ids_.clear();
    }

    std::size_t size() const noexcept { return ids_.size(); }

private:
    EventBus& bus_;
    std::vector<std::pair<std::type_index, EventBus::HandlerId>> ids_;
};

} // namespace runsync::events

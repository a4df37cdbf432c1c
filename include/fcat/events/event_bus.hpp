/**
 * @file event_bus.hpp
 * @brief Synchronous, type-keyed publish/subscribe for catalog events
 *
 * WHY THIS FILE EXISTS:
 * The ingestion engine reports what it changed (entries inserted, renamed,
 * soft-deleted) without depending on who cares. Logging, metrics and the
 * staleness cache attach themselves as subscribers.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<EntryInsertedEvent>([](const EntryInsertedEvent& e) { ... });
 * bus.emit(EntryInsertedEvent{entry});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fcat::events {

/**
 * @brief Type-keyed event bus
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe take an exclusive lock, emit a shared one
 * - Handlers run synchronously on the emitting thread, outside the lock,
 *   so a handler may subscribe or emit without deadlocking
 * - A throwing handler is logged; the remaining handlers still run
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
        auto erased = std::make_shared<Handler>(
            [fn = std::move(handler)](const void* event) {
                fn(*static_cast<const EventType*>(event));
            });
        handlers_[std::type_index(typeid(EventType))].emplace_back(id, std::move(erased));
        return id;
    }

    template<typename EventType>
    void unsubscribe(HandlerId handler_id) {
        std::unique_lock lock(mutex_);

        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [handler_id](const auto& slot) { return slot.first == handler_id; }),
                   list.end());
    }

    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<Handler>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            snapshot.reserve(it->second.size());
            for (const auto& [id, handler] : it->second) {
                snapshot.push_back(handler);
            }
        }

        for (const auto& handler : snapshot) {
            try {
                (*handler)(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
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
    using Handler = std::function<void(const void*)>;

    std::unordered_map<std::type_index, std::vector<std::pair<HandlerId, std::shared_ptr<Handler>>>> handlers_;
    mutable std::shared_mutex mutex_;
    HandlerId next_handler_id_ = 0;
};

} // namespace fcat::events

/**
 * @file event_bus.hpp
 * @brief Type-safe event bus between the uploader and its observers
 *
 * WHY THIS FILE EXISTS:
 * The uploader emits lifecycle events without knowing whether anything
 * logs or counts them; observers subscribe without holding the uploader.
 *
 * THREAD SAFETY:
 * - emit() is called from the uploader's worker threads concurrently
 * - Handlers run synchronously on the emitting thread
 * - The handler list is copied under a shared lock before dispatch, so a
 *   handler may subscribe or unsubscribe without deadlocking
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<UploadStartedEvent>([](const UploadStartedEvent& e) {
 *     spdlog::info("Upload started: {}", e.file_name);
 * });
 * bus.emit(UploadStartedEvent{"data.bin", 1024, 1, 2});
 * bus.unsubscribe<UploadStartedEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bulkup::events {

class EventBus {
public:
    using SubscriptionId = std::size_t;

    EventBus() = default;

    // Handlers capture observers by reference; copying would alias them.
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for EventType; returns an id for unsubscribe()
     */
    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<ErasedHandler>(
            [fn = std::move(handler)](const void* event) {
                fn(*static_cast<const EventType*>(event));
            });

        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        handlers_[std::type_index(typeid(EventType))].emplace_back(id, std::move(erased));
        return id;
    }

    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        const auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const Entry& entry) { return entry.first == id; }),
                   list.end());
    }

    /**
     * @brief Deliver an event to every current subscriber of its type
     *
     * A throwing handler is logged and skipped; the rest still run.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<ErasedHandler>> targets;
        {
            std::shared_lock lock(mutex_);
            const auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            targets.reserve(it->second.size());
            for (const auto& entry : it->second) {
                targets.push_back(entry.second);
            }
        }

        for (const auto& handler : targets) {
            try {
                (*handler)(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            } catch (...) {
                spdlog::error("Event handler for {} threw a non-standard exception", typeid(EventType).name());
            }
        }
    }

    template<typename EventType>
    [[nodiscard]] std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        const auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    using ErasedHandler = std::function<void(const void*)>;
    using Entry = std::pair<SubscriptionId, std::shared_ptr<ErasedHandler>>;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::vector<Entry>> handlers_;
    SubscriptionId next_id_ = 0;
};

} // namespace bulkup::events

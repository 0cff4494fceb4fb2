/**
 * @file event_bus.hpp
 * @brief Publish/subscribe hub between the sync stages and their observers
 *
 * The cycle and the action executor report what happened here; the log
 * and metrics components listen. Publishers never see who is listening.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace dirsync::events {

/**
 * Subscriptions are keyed by event type. emit() snapshots the slot list
 * under a shared lock and calls handlers outside it, on the caller's
 * thread, so a handler may itself subscribe or emit.
 */
class EventBus {
public:
    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// Returns a token accepted by unsubscribe<EventType>()
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        Slot slot;
        slot.handler = [fn = std::move(handler)](const void* event) {
            fn(*static_cast<const EventType*>(event));
        };

        std::unique_lock lock(mutex_);
        slot.token = next_token_++;
        slots_[key<EventType>()].push_back(std::move(slot));
        return slot.token;
    }

    template<typename EventType>
    void unsubscribe(size_t token) {
        std::unique_lock lock(mutex_);
        auto found = slots_.find(key<EventType>());
        if (found == slots_.end()) { return; }

        auto& list = found->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [token](const Slot& s) { return s.token == token; }),
                   list.end());
    }

    /// A throwing handler is logged; later handlers still run.
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<Slot> targets;
        {
            std::shared_lock lock(mutex_);
            auto found = slots_.find(key<EventType>());
            if (found == slots_.end()) { return; }
            targets = found->second;
        }

        for (const auto& slot : targets) {
            try {
                slot.handler(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto found = slots_.find(key<EventType>());
        return found == slots_.end() ? 0 : found->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

private:
    struct Slot {
        size_t token = 0;
        std::function<void(const void*)> handler;
    };

    template<typename EventType>
    static std::type_index key() { return std::type_index(typeid(EventType)); }

    std::unordered_map<std::type_index, std::vector<Slot>> slots_;
    mutable std::shared_mutex mutex_;
    size_t next_token_ = 0;
};

} // namespace dirsync::events

#pragma once

/**
 * @file event_bus.hpp
 * @brief Type-safe synchronous publish/subscribe bus
 *
 * WHAT IT DOES:
 * Lets the upload engine announce lifecycle events without knowing who listens.
 * Logging and metrics subscribe to the event types they care about.
 *
 * THREADING:
 * subscribe/unsubscribe/emit may be called from any thread. Handlers run on the
 * emitting thread, after the handler list has been copied, so a handler may
 * subscribe or unsubscribe without deadlocking.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<ChunkAcceptedEvent>([](const ChunkAcceptedEvent& e) {
 *     spdlog::debug("{} of {}", e.confirmed_bytes, e.total_bytes);
 * });
 * bus.emit(ChunkAcceptedEvent{...});
 * bus.unsubscribe<ChunkAcceptedEvent>(id);
 */

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace cbu::events {

/**
 * @brief Event bus keyed by event type
 *
 * Each event type has its own handler list; emitting one type never touches
 * the handlers of another. Handler ids are unique across all types.
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    // Components hold a reference to the bus, so it stays put
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of one type
     *
     * TEMPLATE PARAMETERS:
     * EventType - The event type to subscribe to (e.g., UploadCompletedEvent)
     *
     * PARAMETERS:
     * handler - Called with every emitted EventType
     *
     * RETURNS:
     * Subscription id for unsubscribe()
     *
     * EXAMPLE:
     * auto id = bus.subscribe<UploadFailedEvent>([](const UploadFailedEvent& e) {
     *     spdlog::error("{}: {}", e.file_name, e.error.summary());
     * });
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        size_t handler_id = next_handler_id_++;

        handlers_[type_id].push_back({handler_id, wrapper});
        return handler_id;
    }

    /**
     * @brief Remove one handler
     *
     * PARAMETERS:
     * handler_id - Id returned by subscribe<EventType>()
     *
     * An unknown id, or an id registered for another type, is ignored.
     */
    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it != handlers_.end()) {
            auto& handler_list = it->second;
            handler_list.erase(
                std::remove_if(handler_list.begin(), handler_list.end(),
                    [handler_id](const auto& pair) {
                        return pair.first == handler_id;
                    }),
                handler_list.end()
            );
        }
    }

    /**
     * @brief Deliver an event to every subscriber of its type
     *
     * HOW IT WORKS:
     * 1. Copy the handler list for EventType under a shared lock
     * 2. Release the lock
     * 3. Call each handler in subscription order on this thread
     *
     * EXCEPTION SAFETY:
     * A handler that throws is logged and skipped; the remaining handlers
     * still run and the exception never reaches the emitter.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    /**
     * @brief Number of handlers subscribed to EventType
     */
    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    /**
     * @brief Remove all handlers of every type
     */
    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    // ════════════════════════════════════════════════════════
    // Type Erasure
    // ════════════════════════════════════════════════════════

    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        // Only ever stored under typeid(EventType), so the cast is exact
        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    // ════════════════════════════════════════════════════════
    // State
    // ════════════════════════════════════════════════════════

    // event type -> (handler id, handler)
    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

} // namespace cbu::events

/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef CBZXL_EVENT_BUS_HPP
#define CBZXL_EVENT_BUS_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace cbzxl {

    /**
     * @brief Simple type-safe publish/subscribe event bus.
     *
     * @details The orchestrator broadcasts per-archive progress without
     * knowing who is listening; the CLI and the tests subscribe to the
     * event types they care about.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g. ArchiveCompleteEvent).
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            Callback erased = [h = std::move(handler)](const void* e) {
                h(*static_cast<const Event*>(e));
            };
            std::lock_guard lock(mtx_);
            subscribers_[std::type_index(typeid(Event))].push_back(std::move(erased));
        }

        /**
         * @brief Deliver @p event to the subscribers of its type, in subscription order.
         *
         * Handlers run on the publishing thread, outside the lock, so a handler
         * may publish or subscribe in turn.
         */
        template <typename Event>
        void publish(const Event& event) const {
            std::vector<Callback> handlers;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                handlers = it->second;
            }
            for (const auto& fn : handlers) {
                fn(&event);
            }
        }

        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() const {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            return it == subscribers_.end() ? 0 : it->second.size();
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        mutable std::mutex mtx_;
    };

} // namespace cbzxl

#endif // CBZXL_EVENT_BUS_HPP

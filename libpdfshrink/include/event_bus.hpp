/**
 * @file event_bus.hpp
 * @brief Type-indexed publish/subscribe bus for compression lifecycle events.
 */

#ifndef PDFSHRINK_EVENT_BUS_HPP
#define PDFSHRINK_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace pdfshrink {

    /**
     * @brief Decouples the orchestrator from whoever renders its progress.
     *
     * @details The CompressionOrchestrator publishes the events declared in
     * events.hpp; the CLI subscribes to print status lines, the progress bar
     * and the verbose engine echo. Events arrive from two threads (the
     * progress ticker and the thread waiting on the engine), so publication
     * is serialized: handlers of one publish() never overlap with handlers
     * of another. A handler must not publish on the same bus.
     */
    class EventBus {
    public:
        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to one event type.
         * @tparam Event The event struct type (e.g. ProgressEvent).
         * @param handler Invoked with a const reference to each published event.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            subscribers_[std::type_index(typeid(Event))].push_back(
                [handler = std::move(handler)](const void* e) {
                    handler(*static_cast<const Event*>(e));
                });
        }

        /**
         * @brief Deliver an event to every subscriber of its type, in
         * subscription order.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it == subscribers_.end()) {
                return;
            }
            for (const auto& fn : it->second) {
                fn(&event);
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace pdfshrink

#endif // PDFSHRINK_EVENT_BUS_HPP

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "spindle/core/event/listener.hpp"
#include "spindle/core/event/priority.hpp"

namespace spindle::core::event {

/*
===============================================================================
 event::Emitter
===============================================================================

Named-event publish/subscribe with prioritized listeners.

Responsibilities:
  - Keep listeners per event name ordered by priority (descending), ties in
    registration order
  - Dispatch an event to the listeners of a name until one stops propagation
  - One-shot listeners, removed right before their first invocation
  - Bulk registration through subscribers (attach / detach)

Dispatch runs over a snapshot of the listener list, so listeners may add or
remove registrations (including their own) while an emission is running.
A one-shot listener removed by an earlier listener of the same emission is
skipped.

Not thread-safe: an emitter belongs to one request, which is driven by one
thread at a time.
===============================================================================
*/
class Emitter {
public:
    Emitter() = default;

    Emitter(const Emitter&) = delete;
    Emitter& operator=(const Emitter&) = delete;
    Emitter(Emitter&&) noexcept = default;
    Emitter& operator=(Emitter&&) noexcept = default;

    ListenerId on(std::string_view name, Listener listener, Priority priority = 0);

    ListenerId once(std::string_view name, Listener listener, Priority priority = 0);

    // Returns false when nothing matched
    bool remove_listener(std::string_view name, ListenerId id);

    // Ids in dispatch order (empty when none)
    [[nodiscard]] std::vector<ListenerId> listeners(std::string_view name) const;

    // Every name with at least one listener
    [[nodiscard]] std::map<std::string, std::vector<ListenerId>> listeners() const;

    [[nodiscard]] bool has_listeners(std::string_view name) const noexcept;

    Event& emit(std::string_view name, Event& event);

    template<SubscriberConcept S>
    void attach(S& subscriber) {
        auto& owned = subscribers_[static_cast<const void*>(&subscriber)];
        for (auto& sub : subscriber.events()) {
            const ListenerId id = on(sub.name, std::move(sub.listener), sub.priority);
            owned.emplace_back(std::move(sub.name), id);
        }
    }

    // Removes every registration made by attach(subscriber)
    template<SubscriberConcept S>
    void detach(const S& subscriber) {
        auto it = subscribers_.find(static_cast<const void*>(&subscriber));
        if (it == subscribers_.end()) {
            return;
        }
        for (const auto& [name, id] : it->second) {
            remove_listener(name, id);
        }
        subscribers_.erase(it);
    }

private:
    struct Entry {
        ListenerId id;
        int priority;
        std::shared_ptr<Listener> fn;
        bool once;
    };

    using EntryList = std::vector<Entry>;

    ListenerId add_(std::string_view name, Listener listener, Priority priority, bool once);

    [[nodiscard]] int resolve_(const EntryList& list, Priority priority) const noexcept;

private:
    std::map<std::string, EntryList, std::less<>> listeners_;
    std::unordered_map<const void*, std::vector<std::pair<std::string, ListenerId>>> subscribers_;
    ListenerId next_id_{1};
};

} // namespace spindle::core::event

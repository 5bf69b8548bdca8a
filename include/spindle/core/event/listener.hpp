#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "spindle/core/event/priority.hpp"

namespace spindle::core::event {

class Event;
class Emitter;

using ListenerId = std::uint64_t;

// Listeners receive the event and the emitter dispatching it
using Listener = std::function<void(Event&, Emitter&)>;

// One registration contributed by a subscriber
struct Subscription {
    std::string name;
    Listener listener;
    Priority priority{0};
};

// A subscriber bundles several registrations that attach and detach together
template<class S>
concept SubscriberConcept = requires(S& s) {
    { s.events() } -> std::convertible_to<std::vector<Subscription>>;
};

} // namespace spindle::core::event

#include "spindle/core/event/emitter.hpp"
#include "spindle/core/event/event.hpp"

#include <algorithm>

#include "lcr/log/logger.hpp"

namespace spindle::core::event {

ListenerId Emitter::on(std::string_view name, Listener listener, Priority priority) {
    return add_(name, std::move(listener), priority, false);
}

ListenerId Emitter::once(std::string_view name, Listener listener, Priority priority) {
    return add_(name, std::move(listener), priority, true);
}

bool Emitter::remove_listener(std::string_view name, ListenerId id) {
    auto it = listeners_.find(name);
    if (it == listeners_.end()) {
        return false;
    }
    auto& list = it->second;
    auto pos = std::find_if(list.begin(), list.end(), [id](const Entry& e) { return e.id == id; });
    if (pos == list.end()) {
        return false;
    }
    list.erase(pos);
    if (list.empty()) {
        listeners_.erase(it);
    }
    return true;
}

std::vector<ListenerId> Emitter::listeners(std::string_view name) const {
    std::vector<ListenerId> ids;
    if (auto it = listeners_.find(name); it != listeners_.end()) {
        ids.reserve(it->second.size());
        for (const auto& e : it->second) {
            ids.push_back(e.id);
        }
    }
    return ids;
}

std::map<std::string, std::vector<ListenerId>> Emitter::listeners() const {
    std::map<std::string, std::vector<ListenerId>> all;
    for (const auto& [name, list] : listeners_) {
        auto& ids = all[name];
        for (const auto& e : list) {
            ids.push_back(e.id);
        }
    }
    return all;
}

bool Emitter::has_listeners(std::string_view name) const noexcept {
    return listeners_.find(name) != listeners_.end();
}

Event& Emitter::emit(std::string_view name, Event& event) {
    auto it = listeners_.find(name);
    if (it == listeners_.end()) {
        return event;
    }

    // Snapshot: listeners may mutate the registry while we dispatch
    const EntryList snapshot = it->second;

    for (const auto& entry : snapshot) {
        if (entry.once && !remove_listener(name, entry.id)) {
            continue; // removed by an earlier listener of this emission
        }
        (*entry.fn)(event, *this);
        if (event.is_propagation_stopped()) {
            SP_TRACE("[EMITTER] Propagation of '" << name << "' stopped by listener #" << entry.id);
            break;
        }
    }
    return event;
}

ListenerId Emitter::add_(std::string_view name, Listener listener, Priority priority, bool once) {
    auto it = listeners_.find(name);
    if (it == listeners_.end()) {
        it = listeners_.emplace(std::string(name), EntryList{}).first;
    }
    auto& list = it->second;

    const int value = resolve_(list, priority);
    const ListenerId id = next_id_++;

    // Insert after every entry with priority >= value (stable for ties)
    auto pos = std::find_if(list.begin(), list.end(), [value](const Entry& e) { return e.priority < value; });
    list.insert(pos, Entry{id, value, std::make_shared<Listener>(std::move(listener)), once});
    return id;
}

int Emitter::resolve_(const EntryList& list, Priority priority) const noexcept {
    switch (priority.mode()) {
    case Priority::Mode::Value:
        return priority.value();
    case Priority::Mode::First:
        // list is sorted descending: front holds the highest priority
        return list.empty() ? 1 : list.front().priority + 1;
    case Priority::Mode::Last:
        return list.empty() ? -1 : list.back().priority - 1;
    }
    return priority.value();
}

} // namespace spindle::core::event

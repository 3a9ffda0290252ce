#include "core/GameEvents.hpp"
#include <algorithm>
#include <stdexcept>

namespace blockfall::core {

EventDispatcher::SubscriptionId EventDispatcher::subscribe(Handler handler) {
    if (!handler) {
        throw std::invalid_argument("EventDispatcher: handler must not be empty");
    }
    const SubscriptionId id = nextId_++;
    handlers_.emplace_back(id, std::move(handler));
    return id;
}

bool EventDispatcher::unsubscribe(SubscriptionId id) {
    auto it = std::find_if(handlers_.begin(), handlers_.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == handlers_.end()) {
        return false;
    }
    handlers_.erase(it);
    return true;
}

void EventDispatcher::emit(const GameEvent& event) const {
    // Copy so a handler can (un)subscribe without invalidating the loop
    const auto handlersCopy = handlers_;
    for (const auto& [id, handler] : handlersCopy) {
        (void)id;
        handler(event);
    }
}

} // namespace blockfall::core

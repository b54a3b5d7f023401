//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostEvents.cpp
// Purpose: EventBus implementation
//==========================================================================================================

#include "toolhost/HostEvents.h"

#include <algorithm>
#include <exception>

#include "logging/Logger.h"

namespace toolhost {

const char* ToString(HostEventType type) {
    switch (type) {
        case HostEventType::ServerAdded: return "server_added";
        case HostEventType::ServerStarting: return "server_starting";
        case HostEventType::ServerStarted: return "server_started";
        case HostEventType::ServerStopped: return "server_stopped";
        case HostEventType::ServerError: return "server_error";
        case HostEventType::ToolsDiscovered: return "tools_discovered";
        case HostEventType::ServerMessage: return "server_message";
        case HostEventType::ServerStderr: return "server_stderr";
        case HostEventType::ServerRemoved: return "server_removed";
    }
    return "unknown";
}

EventBus::SubscriptionId EventBus::Subscribe(Handler handler) {
    SubscriptionId id = nextId++;
    subscribers.push_back(Subscriber{id, std::nullopt, std::move(handler)});
    return id;
}

EventBus::SubscriptionId EventBus::Subscribe(HostEventType type, Handler handler) {
    SubscriptionId id = nextId++;
    subscribers.push_back(Subscriber{id, type, std::move(handler)});
    return id;
}

bool EventBus::Unsubscribe(SubscriptionId id) {
    auto it = std::find_if(subscribers.begin(), subscribers.end(),
                           [id](const Subscriber& s) { return s.id == id; });
    if (it == subscribers.end()) {
        return false;
    }
    subscribers.erase(it);
    return true;
}

void EventBus::Publish(const HostEvent& event) {
    LOG_DEBUG("event {} server={}", ToString(event.type), event.serverId);
    // Iterate a copy so handlers may (un)subscribe
    const std::vector<Subscriber> current = subscribers;
    for (const auto& s : current) {
        if (s.filter.has_value() && s.filter.value() != event.type) {
            continue;
        }
        if (!s.handler) {
            continue;
        }
        try {
            s.handler(event);
        } catch (const std::exception& e) {
            LOG_ERROR("Event handler for {} threw: {}", ToString(event.type), e.what());
        }
    }
}

} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostEvents.h
// Purpose: Typed lifecycle events and the per-Host publish/subscribe registry
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/Protocol.h"

namespace toolhost {

enum class HostEventType {
    ServerAdded,
    ServerStarting,
    ServerStarted,
    ServerStopped,
    ServerError,
    ToolsDiscovered,
    ServerMessage,
    ServerStderr,
    ServerRemoved
};

// Wire-style event name, e.g. "server_added".
const char* ToString(HostEventType type);

//==========================================================================================================
// HostEvent
// Fields:
//   type, serverId: Always set.
//   text: Error message (ServerError), raw line (ServerMessage) or stderr text (ServerStderr).
//   tools: Catalog for ToolsDiscovered.
//   message: Parsed JSON for ServerMessage when the line was JSON.
//==========================================================================================================
struct HostEvent {
    HostEventType type;
    std::string serverId;
    std::string text;
    std::vector<Tool> tools;
    std::optional<JSONValue> message;
};

//==========================================================================================================
// EventBus
// Purpose: Callback registry; handlers run synchronously on the publishing thread.
// Notes:
//   Subscribing or unsubscribing from inside a handler is allowed and takes effect on the next Publish.
//   A handler that throws is logged and does not stop delivery to the others.
//==========================================================================================================
class EventBus {
public:
    using Handler = std::function<void(const HostEvent&)>;
    using SubscriptionId = uint64_t;

    SubscriptionId Subscribe(Handler handler);
    SubscriptionId Subscribe(HostEventType type, Handler handler);
    bool Unsubscribe(SubscriptionId id);
    void Publish(const HostEvent& event);
    std::size_t SubscriberCount() const { return subscribers.size(); }

private:
    struct Subscriber {
        SubscriptionId id;
        std::optional<HostEventType> filter;
        Handler handler;
    };
    std::vector<Subscriber> subscribers;
    SubscriptionId nextId{1};
};

} // namespace toolhost

//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Interface for classifying and dispatching lines received from a tool server
//========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <memory>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

//========================================================================================================
// RouterHandlers
// Purpose: Callbacks invoked by route(); unset handlers are skipped.
// Fields:
//   requestHandler: Server-initiated request; the returned response is sent back (id is forced).
//   notificationHandler: Server notification.
//   diagnosticHandler: Non-JSON text line (never parsed).
//   unknownHandler: Well-formed JSON that is neither request, response nor notification.
//   errorHandler: Line that looked like JSON but failed to parse.
//========================================================================================================
struct RouterHandlers {
    std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)> requestHandler;
    std::function<void(std::unique_ptr<JSONRPCNotification>)> notificationHandler;
    std::function<void(const std::string&)> diagnosticHandler;
    std::function<void(const std::string&)> unknownHandler;
    std::function<void(const std::string&)> errorHandler;
};

// Resolves a pending request; returns false when no PendingRequest matches the id.
using ResponseResolver = std::function<bool(JSONRPCResponse&&)>;

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Diagnostic,
        Malformed,
        Request,
        Response,
        Notification,
        Unknown
    };

    // Classify a line without invoking handlers.
    virtual MessageKind classify(const std::string& line) = 0;

    // Routes one line. Returns the serialized response payload when the line was a request
    // and a handler produced an answer; std::nullopt otherwise.
    virtual std::optional<std::string> route(
        const std::string& line,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) = 0;
};

// Lines whose first non-blank character is not '{' are diagnostic text.
bool LooksLikeJsonObject(const std::string& line);

// Factory: returns the default router implementation
std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

} // namespace toolhost

//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for tool-server line routing
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "toolhost/JsonRpcMessageRouter.h"
#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

bool LooksLikeJsonObject(const std::string& line) {
    for (char c : line) {
        if (c == ' ' || c == '\t' || c == '\r') continue;
        return c == '{';
    }
    return false;
}

namespace {
using MessageKind = IJsonRpcMessageRouter::MessageKind;

MessageKind kindOf(const JSONValue& doc) {
    if (!doc.isObject()) {
        return MessageKind::Unknown;
    }
    const bool hasId = FindMember(doc, "id") != nullptr;
    const bool hasMethod = GetStringMember(doc, "method").has_value();
    if (!hasMethod && hasId &&
        (FindMember(doc, "result") != nullptr || FindMember(doc, "error") != nullptr)) {
        return MessageKind::Response;
    }
    if (hasMethod) {
        return hasId ? MessageKind::Request : MessageKind::Notification;
    }
    return MessageKind::Unknown;
}

class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind classify(const std::string& line) override {
        if (!LooksLikeJsonObject(line)) {
            return MessageKind::Diagnostic;
        }
        auto doc = TryParseJSON(line);
        if (!doc.has_value()) {
            return MessageKind::Malformed;
        }
        return kindOf(doc.value());
    }

    std::optional<std::string> route(
        const std::string& line,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) override {
        if (!LooksLikeJsonObject(line)) {
            if (handlers.diagnosticHandler) {
                handlers.diagnosticHandler(line);
            }
            return std::nullopt;
        }

        JSONValue doc;
        try {
            doc = ParseJSON(line);
        } catch (const std::runtime_error& e) {
            LOG_WARN("Router: dropping malformed JSON line ({}): {}", e.what(), line);
            if (handlers.errorHandler) {
                handlers.errorHandler(e.what());
            }
            return std::nullopt;
        }

        switch (kindOf(doc)) {
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.FromValue(doc)) {
                    const std::string id = JSONRPCIdToString(response.id);
                    if (!resolve || !resolve(std::move(response))) {
                        LOG_DEBUG("Router: no pending request for response id {}", id);
                    }
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.FromValue(doc)) {
                    break;
                }
                if (!handlers.requestHandler) {
                    return std::nullopt;
                }
                std::unique_ptr<JSONRPCResponse> resp;
                try {
                    resp = handlers.requestHandler(request);
                } catch (const std::exception& e) {
                    LOG_ERROR("Request handler exception: {}", e.what());
                    resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
                }
                if (!resp) {
                    resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError,
                                               "Null response from handler");
                }
                resp->id = request.id;
                return resp->Serialize();
            }
            case MessageKind::Notification: {
                auto notification = std::make_unique<JSONRPCNotification>();
                if (notification->FromValue(doc)) {
                    if (handlers.notificationHandler) {
                        handlers.notificationHandler(std::move(notification));
                    }
                    return std::nullopt;
                }
                break;
            }
            default:
                break;
        }

        LOG_DEBUG("Router: unrecognized JSON-RPC message: {}", line);
        if (handlers.unknownHandler) {
            handlers.unknownHandler(line);
        }
        return std::nullopt;
    }
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace toolhost

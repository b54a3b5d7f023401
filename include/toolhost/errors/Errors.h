//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Host exception hierarchy plus typed JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace errors {

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpResourceNotFound,
    McpToolNotFound,
    McpPromptNotFound,
    Unknown
};

// Typed representation of a JSON-RPC error object received from a server.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* codeVal = FindMember(errVal, "code");
    auto message = GetStringMember(errVal, "message");
    if (codeVal == nullptr || !message.has_value()) {
        return std::nullopt;
    }
    const auto* code = std::get_if<int64_t>(&codeVal->value);
    if (code == nullptr) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(*code);
    e.message = std::move(message.value());
    if (const JSONValue* data = FindMember(errVal, "data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

///////////////////////////////////////// Host exceptions ///////////////////////////////////////////

// Discriminates HostError subclasses without RTTI at call sites (logging, CLI exit codes).
enum class ErrorKind {
    DuplicateServer,
    NotFound,
    Capacity,
    Handshake,
    NotRunning,
    ToolExecution,
    Timeout,
    Rpc,
    Process
};

//==========================================================================================================
// HostError
// Purpose: Base of every exception raised by host operations.
//==========================================================================================================
class HostError : public std::runtime_error {
public:
    HostError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class DuplicateServerError : public HostError {
public:
    explicit DuplicateServerError(const std::string& serverId)
        : HostError(ErrorKind::DuplicateServer, "Server with id '" + serverId + "' already exists") {}
};

class NotFoundError : public HostError {
public:
    explicit NotFoundError(const std::string& message)
        : HostError(ErrorKind::NotFound, message) {}
};

class CapacityError : public HostError {
public:
    explicit CapacityError(std::size_t maxServers)
        : HostError(ErrorKind::Capacity,
                    "Maximum number of running servers (" + std::to_string(maxServers) + ") reached") {}
};

// Spawn or handshake failure; cause() is the underlying reason without the server prefix.
class HandshakeError : public HostError {
public:
    HandshakeError(const std::string& serverId, const std::string& cause)
        : HostError(ErrorKind::Handshake, "Failed to start server '" + serverId + "': " + cause),
          cause_(cause) {}

    const std::string& cause() const noexcept { return cause_; }

private:
    std::string cause_;
};

class NotRunningError : public HostError {
public:
    NotRunningError(const std::string& serverId, const std::string& status)
        : HostError(ErrorKind::NotRunning,
                    "Server '" + serverId + "' is not running (status: " + status + ")") {}
};

// Final failure of a tool call after the retry budget is exhausted.
class ToolExecutionError : public HostError {
public:
    ToolExecutionError(const std::string& tool, const std::string& serverId,
                       int attempts, const std::string& lastError)
        : HostError(ErrorKind::ToolExecution,
                    "Tool '" + tool + "' on server '" + serverId + "' failed after " +
                    std::to_string(attempts) + " attempt(s): " + lastError),
          attempts_(attempts), lastError_(lastError) {}

    int attempts() const noexcept { return attempts_; }
    const std::string& lastError() const noexcept { return lastError_; }

private:
    int attempts_;
    std::string lastError_;
};

class TimeoutError : public HostError {
public:
    explicit TimeoutError(const std::string& message)
        : HostError(ErrorKind::Timeout, message) {}
};

// A JSON-RPC error response received for a request.
class RpcError : public HostError {
public:
    explicit RpcError(McpError error)
        : HostError(ErrorKind::Rpc,
                    "JSON-RPC error " + std::to_string(error.code) + ": " + error.message),
          error_(std::move(error)) {}

    const McpError& error() const noexcept { return error_; }

private:
    McpError error_;
};

// Subprocess plumbing failure (spawn, pipe write, server gone).
class ProcessError : public HostError {
public:
    explicit ProcessError(const std::string& message)
        : HostError(ErrorKind::Process, message) {}
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DuplicateServer: return "DuplicateServer";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Capacity: return "Capacity";
        case ErrorKind::Handshake: return "Handshake";
        case ErrorKind::NotRunning: return "NotRunning";
        case ErrorKind::ToolExecution: return "ToolExecution";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::Rpc: return "Rpc";
        case ErrorKind::Process: return "Process";
    }
    return "Unknown";
}

} // namespace errors
} // namespace toolhost

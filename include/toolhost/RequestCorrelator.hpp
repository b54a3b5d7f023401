//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.hpp
// Purpose: Matches JSON-RPC responses to outstanding requests by id, with per-request timeouts
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

//==========================================================================================================
// RequestCorrelator
// Purpose: Owns the id counter and the PendingRequest table shared by every server of one Host.
// Notes:
//   Not thread-safe; every call must run on the executor passed to the constructor.
//   An entry is removed from the table before its outcome is applied, so each request completes once.
//==========================================================================================================
class RequestCorrelator {
public:
    // Receives one framed line ("<json>\n"); throws to report a failed write.
    using Writer = std::function<void(const std::string& frame)>;

    explicit RequestCorrelator(boost::asio::any_io_executor executor);
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    //==========================================================================================================
    // Send
    // Purpose: Allocates the next id, registers a PendingRequest, writes the request and suspends.
    // Args:
    //   serverId: Owning server, used by FailServer.
    //   method, params: Request content.
    //   timeout: Time allowed for the response.
    //   writer: Sink for the framed request.
    // Returns:
    //   The response "result" (null when absent). Throws errors::RpcError for an error response,
    //   errors::TimeoutError on expiry, errors::ProcessError when failed via FailServer or when
    //   the writer throws.
    //==========================================================================================================
    boost::asio::awaitable<JSONValue> Send(std::string serverId,
                                           std::string method,
                                           std::optional<JSONValue> params,
                                           std::chrono::milliseconds timeout,
                                           Writer writer);

    // Writes a notification; nothing is registered.
    void Notify(const std::string& method, std::optional<JSONValue> params, const Writer& writer);

    // Applies a response to its PendingRequest. Returns false when no entry matches the id.
    bool Resolve(JSONRPCResponse&& response);

    // Fires the timeout for one request now. Returns false when the id is not pending.
    bool Expire(int64_t id);

    // Rejects every pending request of one server; returns the number failed.
    std::size_t FailServer(const std::string& serverId, const std::string& reason);

    std::size_t PendingCount() const;
    std::size_t PendingCount(const std::string& serverId) const;

    // Id that the next Send will use.
    int64_t PeekNextId() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace toolhost

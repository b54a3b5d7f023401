//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.cpp
// Purpose: PendingRequest table, id allocation and timeout handling
//==========================================================================================================

#include "toolhost/RequestCorrelator.hpp"

#include <exception>
#include <format>
#include <unordered_map>
#include <vector>

#include <boost/asio/async_result.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "toolhost/LineFramer.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {
struct PendingRequest {
    std::string serverId;
    std::string method;
    std::chrono::milliseconds timeout{0};
    std::function<void(JSONValue)> resolve;
    std::function<void(std::exception_ptr)> reject;
    std::unique_ptr<boost::asio::steady_timer> timer;
};
} // namespace

class RequestCorrelator::Impl : public std::enable_shared_from_this<RequestCorrelator::Impl> {
public:
    explicit Impl(boost::asio::any_io_executor ex)
        : executor(std::move(ex)), framer(MakeNewlineFramer()) {}

    boost::asio::any_io_executor executor;
    std::unique_ptr<IMessageFramer> framer;
    std::unordered_map<int64_t, PendingRequest> pending;
    int64_t nextId{1};

    // Removes the entry first, then applies the outcome
    std::optional<PendingRequest> take(int64_t id) {
        auto it = pending.find(id);
        if (it == pending.end()) {
            return std::nullopt;
        }
        PendingRequest entry = std::move(it->second);
        pending.erase(it);
        if (entry.timer) {
            entry.timer->cancel();
        }
        return entry;
    }

    void armTimer(int64_t id, PendingRequest& entry) {
        entry.timer = std::make_unique<boost::asio::steady_timer>(executor);
        entry.timer->expires_after(entry.timeout);
        std::weak_ptr<Impl> weak = weak_from_this();
        entry.timer->async_wait([weak, id](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            if (auto self = weak.lock()) {
                self->expire(id);
            }
        });
    }

    bool expire(int64_t id) {
        auto entry = take(id);
        if (!entry.has_value()) {
            return false;
        }
        LOG_WARN("Request {} ({}) to server '{}' timed out after {} ms",
                 id, entry->method, entry->serverId, static_cast<long long>(entry->timeout.count()));
        entry->reject(std::make_exception_ptr(errors::TimeoutError(
            std::format("Request '{}' to server '{}' timed out after {} ms",
                        entry->method, entry->serverId, static_cast<long long>(entry->timeout.count())))));
        return true;
    }
};

RequestCorrelator::RequestCorrelator(boost::asio::any_io_executor executor)
    : pImpl(std::make_shared<Impl>(std::move(executor))) {
    FUNC_SCOPE();
}

RequestCorrelator::~RequestCorrelator() {
    FUNC_SCOPE();
    for (auto& [id, entry] : pImpl->pending) {
        if (entry.timer) {
            entry.timer->cancel();
        }
    }
    pImpl->pending.clear();
}

boost::asio::awaitable<JSONValue> RequestCorrelator::Send(std::string serverId,
                                                          std::string method,
                                                          std::optional<JSONValue> params,
                                                          std::chrono::milliseconds timeout,
                                                          Writer writer) {
    FUNC_SCOPE();
    std::shared_ptr<Impl> impl = pImpl;
    const int64_t id = impl->nextId++;
    JSONRPCRequest request(id, method, std::move(params));
    const std::string frame = impl->framer->encode(request.Serialize());

    auto initiation = [impl, id, &serverId, &method, timeout, &writer, &frame](auto handler) {
        using Handler = std::decay_t<decltype(handler)>;
        auto shared = std::make_shared<Handler>(std::move(handler));
        auto ex = impl->executor;

        PendingRequest entry;
        entry.serverId = serverId;
        entry.method = method;
        entry.timeout = timeout;
        entry.resolve = [shared, ex](JSONValue value) {
            boost::asio::post(ex, [shared, value = std::move(value)]() mutable {
                (*shared)(std::exception_ptr{}, std::move(value));
            });
        };
        entry.reject = [shared, ex](std::exception_ptr error) {
            boost::asio::post(ex, [shared, error]() {
                (*shared)(error, JSONValue{});
            });
        };
        impl->armTimer(id, entry);
        impl->pending.emplace(id, std::move(entry));

        LOG_DEBUG("-> [{}] {} id={}", serverId, method, id);
        try {
            writer(frame);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to write request {} to server '{}': {}", id, serverId, e.what());
            if (auto failed = impl->take(id)) {
                failed->reject(std::make_exception_ptr(errors::ProcessError(
                    std::format("Failed to write '{}' to server '{}': {}", method, serverId, e.what()))));
            }
        }
    };

    JSONValue result = co_await boost::asio::async_initiate<
        const boost::asio::use_awaitable_t<>&, void(std::exception_ptr, JSONValue)>(
            std::move(initiation), boost::asio::use_awaitable);
    co_return result;
}

void RequestCorrelator::Notify(const std::string& method, std::optional<JSONValue> params,
                               const Writer& writer) {
    FUNC_SCOPE();
    JSONRPCNotification notification(method, std::move(params));
    writer(pImpl->framer->encode(notification.Serialize()));
}

bool RequestCorrelator::Resolve(JSONRPCResponse&& response) {
    FUNC_SCOPE();
    const auto* numericId = std::get_if<int64_t>(&response.id);
    if (numericId == nullptr) {
        return false;
    }
    auto entry = pImpl->take(*numericId);
    if (!entry.has_value()) {
        return false;
    }
    LOG_DEBUG("<- [{}] {} id={}{}", entry->serverId, entry->method, *numericId,
              response.IsError() ? " (error)" : "");
    if (response.IsError()) {
        auto typed = errors::mcpErrorFromResponse(response);
        if (!typed.has_value()) {
            errors::McpError fallback;
            fallback.code = JSONRPCErrorCodes::InternalError;
            fallback.message = "Malformed error object: " + SerializeJSON(response.error.value());
            fallback.data = response.error;
            typed = std::move(fallback);
        }
        entry->reject(std::make_exception_ptr(errors::RpcError(std::move(typed.value()))));
        return true;
    }
    entry->resolve(response.result.has_value() ? std::move(response.result.value()) : JSONValue{});
    return true;
}

bool RequestCorrelator::Expire(int64_t id) {
    FUNC_SCOPE();
    return pImpl->expire(id);
}

std::size_t RequestCorrelator::FailServer(const std::string& serverId, const std::string& reason) {
    FUNC_SCOPE();
    std::vector<int64_t> ids;
    for (const auto& [id, entry] : pImpl->pending) {
        if (entry.serverId == serverId) {
            ids.push_back(id);
        }
    }
    for (int64_t id : ids) {
        if (auto entry = pImpl->take(id)) {
            entry->reject(std::make_exception_ptr(errors::ProcessError(
                std::format("Request '{}' to server '{}' failed: {}", entry->method, serverId, reason))));
        }
    }
    if (!ids.empty()) {
        LOG_INFO("Failed {} pending request(s) of server '{}': {}", ids.size(), serverId, reason);
    }
    return ids.size();
}

std::size_t RequestCorrelator::PendingCount() const {
    return pImpl->pending.size();
}

std::size_t RequestCorrelator::PendingCount(const std::string& serverId) const {
    std::size_t n = 0;
    for (const auto& [id, entry] : pImpl->pending) {
        if (entry.serverId == serverId) {
            ++n;
        }
    }
    return n;
}

int64_t RequestCorrelator::PeekNextId() const {
    return pImpl->nextId;
}

} // namespace toolhost

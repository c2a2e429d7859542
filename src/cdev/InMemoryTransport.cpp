//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-process transport handing requests to a handler function
//==========================================================================================================

#include "cdev/InMemoryTransport.hpp"
#include "cdev/errors/Errors.h"
#include "logging/Logger.h"

#include <atomic>
#include <mutex>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

namespace cdev {

class InMemoryTransport::Impl {
public:
    std::mutex mutex;
    Handler handler;
    std::shared_ptr<auth::IAuth> auth;
    ErrorHandler errorHandler;
    std::atomic<bool> running{false};

    explicit Impl(Handler h) : handler(std::move(h)) {}

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    // Auth providers expose an awaitable readiness hook; drive it to completion on a local context.
    void applyAuth(const std::shared_ptr<auth::IAuth>& a, HttpRequest& request) {
        if (!a) {
            return;
        }
        boost::asio::io_context ctx;
        auto ready = boost::asio::co_spawn(ctx, a->ensureReady(), boost::asio::use_future);
        ctx.run();
        ready.get();
        for (const auto& h : a->headers()) {
            request.headers.push_back(h);
        }
    }
};

InMemoryTransport::InMemoryTransport(Handler handler)
    : pImpl(std::make_unique<Impl>(std::move(handler))) {}

InMemoryTransport::~InMemoryTransport() = default;

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    pImpl->running.store(true);
    ready.set_value();
    return ready.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done;
    pImpl->running.store(false);
    done.set_value();
    return done.get_future();
}

bool InMemoryTransport::IsRunning() const {
    return pImpl->running.load();
}

std::future<HttpResponse> InMemoryTransport::SendRequest(HttpRequest request) {
    FUNC_SCOPE();
    std::promise<HttpResponse> promise;
    auto fut = promise.get_future();
    if (!pImpl->running.load()) {
        promise.set_exception(std::make_exception_ptr(errors::TransportError("Transport not started")));
        return fut;
    }

    Handler handler;
    std::shared_ptr<auth::IAuth> authCopy;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        handler = pImpl->handler;
        authCopy = pImpl->auth;
    }
    if (!handler) {
        promise.set_exception(std::make_exception_ptr(errors::TransportError("No handler installed")));
        return fut;
    }

    try {
        pImpl->applyAuth(authCopy, request);
        promise.set_value(handler(request));
    } catch (const errors::TransportError& e) {
        pImpl->setError(e.what());
        promise.set_exception(std::current_exception());
    } catch (const std::exception& e) {
        pImpl->setError(std::string("InMemoryTransport: handler failed: ") + e.what());
        promise.set_exception(std::make_exception_ptr(errors::TransportError(e.what())));
    }
    return fut;
}

void InMemoryTransport::SetAuth(std::shared_ptr<auth::IAuth> auth) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->auth = std::move(auth);
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

void InMemoryTransport::SetHandler(Handler handler) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->handler = std::move(handler);
}

} // namespace cdev

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-process transport for tests and embedding
//==========================================================================================================
#pragma once

#include "cdev/Transport.h"
#include <functional>
#include <memory>

namespace cdev {

//==========================================================================================================
// InMemoryTransport
// Purpose: Implements ITransport by handing each request to a handler function in the calling thread,
//          without networking. Authentication headers are applied exactly as HTTPTransport applies them,
//          so handlers observe the same request a server would.
// Notes:
//   An exception thrown by the handler is delivered through the future as errors::TransportError
//   (TransportError itself is passed through unchanged).
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    explicit InMemoryTransport(Handler handler);
    ~InMemoryTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsRunning() const override;
    std::future<HttpResponse> SendRequest(HttpRequest request) override;
    void SetAuth(std::shared_ptr<auth::IAuth> auth) override;
    void SetErrorHandler(ErrorHandler handler) override;

    // Replaces the request handler.
    void SetHandler(Handler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace cdev

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.hpp
// Purpose: Coroutine-based HTTP/HTTPS client transport using Boost.Beast
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <future>

#include "cdev/Transport.h"
#include "cdev/auth/IAuth.hpp"

namespace cdev {

//==========================================================================================================
// HTTPTransport
// Purpose: Concrete HTTP/HTTPS transport implementing ITransport. Each request opens its own connection
//          (Connection: close) on a private io_context served by one worker thread.
//==========================================================================================================
class HTTPTransport : public ITransport {
public:
    //==========================================================================================================
    // Options
    // Purpose: Timeouts and TLS verification settings. Scheme, host and port come from each request URL.
    // Fields:
    //   connectTimeoutMs: Resolve + connect (+ TLS handshake) timeout in milliseconds
    //   readTimeoutMs: Write + read timeout in milliseconds
    //   serverName: TLS SNI and hostname verification override (defaults to the URL host)
    //   caFile/caPath: Optional CA bundle/path for trust store (https only)
    //   userAgent: Value of the User-Agent header
    //==========================================================================================================
    struct Options {
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{30000};
        std::string serverName;
        std::string caFile;
        std::string caPath;
        std::string userAgent{"cdev"};
    };

    explicit HTTPTransport(const Options& opts);
    ~HTTPTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsRunning() const override;

    //==========================================================================================================
    // Sends one request; see ITransport::SendRequest.
    //==========================================================================================================
    std::future<HttpResponse> SendRequest(HttpRequest request) override;

    void SetAuth(std::shared_ptr<auth::IAuth> auth) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // UrlParts
    // Purpose: Components of an absolute http(s) URL. Missing port defaults to 80/443, missing path to "/".
    //==========================================================================================================
    struct UrlParts {
        std::string scheme;
        std::string host;
        std::string port;
        std::string target;
    };
    static UrlParts ParseUrl(const std::string& url);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace cdev

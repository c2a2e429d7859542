//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: HTTP transport interfaces - COM-style abstractions for request/response exchange
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>
#include <optional>
#include <vector>
#include <cstdint>

#include "cdev/auth/IAuth.hpp"

namespace cdev {

//==========================================================================================================
// HttpMethod
// Purpose: Verbs used by the development API. There is no DELETE.
//==========================================================================================================
enum class HttpMethod {
    Get,
    Put,
    Post
};

inline const char* methodName(HttpMethod m) {
    switch (m) {
        case HttpMethod::Get: return "GET";
        case HttpMethod::Put: return "PUT";
        case HttpMethod::Post: return "POST";
    }
    return "GET";
}

//==========================================================================================================
// HttpRequest
// Purpose: One outgoing request.
// Fields:
//   method: GET, PUT or POST.
//   url: Absolute URL, "{scheme}://{host}:{port}{locator}".
//   body: JSON text; when present it is sent with Content-Type: application/json.
//   headers: Extra headers; authentication headers are added by the transport.
//==========================================================================================================
struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;
    std::optional<std::string> body;
    std::vector<auth::HeaderKV> headers;
};

//==========================================================================================================
// HttpResponse
// Purpose: Status line, headers and body of a completed exchange.
//==========================================================================================================
struct HttpResponse {
    int status{0};
    std::string reason;
    std::vector<auth::HeaderKV> headers;
    std::string body;

    bool IsSuccess() const { return status >= 200 && status < 300; }
};

//==========================================================================================================
// Transport interface
// Purpose: Performs HTTP exchanges on behalf of the client.
//==========================================================================================================
class ITransport {
public:
    using ErrorHandler = std::function<void(const std::string& error)>;

    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loop.
    // Returns:
    //   A future that completes when the transport accepts requests.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops the transport. Requests still in flight fail with errors::TransportError.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the transport has been started and not closed.
    //==========================================================================================================
    virtual bool IsRunning() const = 0;

    /////////////////////////////////////////// Requests ///////////////////////////////////////////
    //==========================================================================================================
    // Sends one request.
    // Args:
    //   request: Method, absolute URL, optional JSON body.
    // Returns:
    //   Future resolving to the response for any HTTP status. A failure to complete the exchange
    //   (resolve, connect, TLS, write, read, timeout, transport not running) is stored in the future
    //   as errors::TransportError.
    //==========================================================================================================
    virtual std::future<HttpResponse> SendRequest(HttpRequest request) = 0;

    /////////////////////////////////////////// Configuration ///////////////////////////////////////////
    //==========================================================================================================
    // Installs an authentication provider consulted for every request (nullptr clears it).
    //==========================================================================================================
    virtual void SetAuth(std::shared_ptr<auth::IAuth> auth) = 0;

    //==========================================================================================================
    // Registers a sink for diagnostic lines (progress and failures).
    //==========================================================================================================
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

} // namespace cdev

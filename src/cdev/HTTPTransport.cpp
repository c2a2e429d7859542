//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/cdev/HTTPTransport.cpp
// Purpose: HTTP/HTTPS client transport using Boost.Beast coroutines
//==========================================================================================================

//==========================================================================================================
#include <utility>
#include <thread>
#include <atomic>
#include <sstream>
#include <mutex>
#include <limits>
#include <unordered_map>
#include <chrono>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "cdev/HTTPTransport.hpp"
#include "cdev/errors/Errors.h"

#include <openssl/ssl.h>

namespace cdev {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

std::string toStdString(boost::beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

http::verb toVerb(HttpMethod m) {
    switch (m) {
        case HttpMethod::Put: return http::verb::put;
        case HttpMethod::Post: return http::verb::post;
        case HttpMethod::Get: break;
    }
    return http::verb::get;
}

} // namespace

class HTTPTransport::Impl {
public:
    HTTPTransport::Options opts;
    std::atomic<bool> running{false};

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx; // created on first https request
    bool caInitOk{true};
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;

    HTTPTransport::ErrorHandler errorHandler;
    std::shared_ptr<auth::IAuth> auth;

    std::atomic<std::uint64_t> requestCounter{0u};
    std::mutex requestMutex;
    std::unordered_map<std::uint64_t, std::promise<HttpResponse>> pendingRequests;

    explicit Impl(const HTTPTransport::Options& o) : opts(o) {}

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    // Runs on the io thread only.
    ssl::context& tlsContext() {
        if (!sslCtx) {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_2_VERSION);
            const bool userProvidedCA = !opts.caFile.empty() || !opts.caPath.empty();
            if (userProvidedCA) {
                try {
                    if (!opts.caFile.empty()) { sslCtx->load_verify_file(opts.caFile); }
                    if (!opts.caPath.empty()) { sslCtx->add_verify_path(opts.caPath); }
                } catch (const std::exception& e) {
                    setError(std::string("HTTPS: failed to load user-provided CA file/path: ") + e.what());
                    caInitOk = false;
                }
            } else {
                boost::system::error_code ec;
                sslCtx->set_default_verify_paths(ec);
                if (ec) {
                    LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", ec.message());
                }
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        }
        return *sslCtx;
    }

    // Coroutine: builds the Beast request including auth headers
    net::awaitable<http::request<http::string_body>> coBuildRequest(const HttpRequest& in,
                                                                  const HTTPTransport::UrlParts& u) {
        http::request<http::string_body> req{toVerb(in.method), u.target, 11};
        req.set(http::field::host, u.host + ":" + u.port);
        req.set(http::field::accept, "application/json");
        req.set(http::field::user_agent, opts.userAgent);
        req.set(http::field::connection, "close");
        if (in.body.has_value()) {
            req.set(http::field::content_type, "application/json");
            req.body() = *in.body;
        }
        for (const auto& h : in.headers) {
            req.set(h.name, h.value);
        }
        if (auth) {
            co_await auth->ensureReady();
            for (const auto& h : auth->headers()) {
                req.set(h.name, h.value);
            }
        }
        req.prepare_payload();
        co_return req;
    }

    static HttpResponse toResponse(http::response<http::string_body>& res) {
        HttpResponse out;
        out.status = static_cast<int>(res.result_int());
        out.reason = toStdString(res.reason());
        for (const auto& f : res) {
            out.headers.push_back(auth::HeaderKV{ toStdString(f.name_string()), toStdString(f.value()) });
        }
        out.body = std::move(res.body());
        return out;
    }

    // Coroutine: one complete exchange over a fresh connection
    net::awaitable<HttpResponse> coSend(HttpRequest in) {
        const HTTPTransport::UrlParts u = HTTPTransport::ParseUrl(in.url);
        if (u.host.empty()) {
            throw errors::TransportError("URL has no host: " + in.url);
        }
        http::request<http::string_body> req = co_await coBuildRequest(in, u);

        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
        setError(std::string("HTTP DEBUG: resolved ") + u.host + ":" + u.port + " target=" + u.target);

        http::response_parser<http::string_body> parser;
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        boost::beast::flat_buffer buffer;

        if (u.scheme == "https") {
            ssl::context& ctx = tlsContext();
            if (!caInitOk) {
                throw errors::TransportError("HTTPS: CA initialization failed (bad caFile/caPath)");
            }
            const std::string serverName = opts.serverName.empty() ? u.host : opts.serverName;
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, ctx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), serverName.c_str())) {
                setError("HTTPS: failed to set SNI hostname");
            }
            (void)::SSL_set1_host(stream.native_handle(), serverName.c_str());
            boost::beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await boost::beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            boost::beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, parser, net::use_awaitable);
            setError(std::string("HTTP DEBUG: https read response bytes=") + std::to_string(parser.get().body().size()));
            boost::system::error_code ec;
            stream.shutdown(ec);
        } else if (u.scheme == "http") {
            boost::beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);
            setError("HTTP DEBUG: http connected");
            stream.expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            co_await http::async_read(stream, buffer, parser, net::use_awaitable);
            setError(std::string("HTTP DEBUG: http read response bytes=") + std::to_string(parser.get().body().size()));
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        } else {
            throw errors::TransportError("Unsupported URL scheme: " + u.scheme);
        }

        http::response<http::string_body> res = parser.release();
        co_return toResponse(res);
    }

    void deliver(std::uint64_t key, std::exception_ptr eptr, HttpResponse response) {
        std::promise<HttpResponse> deliverPromise;
        bool havePromise = false;
        {
            std::lock_guard<std::mutex> lk(requestMutex);
            auto it = pendingRequests.find(key);
            if (it != pendingRequests.end()) {
                deliverPromise = std::move(it->second);
                pendingRequests.erase(it);
                havePromise = true;
            }
        }
        if (!havePromise) {
            return;
        }
        if (!eptr) {
            deliverPromise.set_value(std::move(response));
            return;
        }
        try {
            std::rethrow_exception(eptr);
        } catch (const errors::TransportError& e) {
            setError(e.what());
            deliverPromise.set_exception(std::current_exception());
        } catch (const std::exception& e) {
            setError(std::string("HTTP request failed: ") + e.what());
            deliverPromise.set_exception(std::make_exception_ptr(errors::TransportError(e.what())));
        }
    }
};

HTTPTransport::HTTPTransport(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPTransport::~HTTPTransport() = default;

HTTPTransport::UrlParts HTTPTransport::ParseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;

    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        parts.scheme = std::string("http");
        pos = 0;
    }

    std::size_t slash = url.find('/', pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.target = std::string("/");
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.target = url.substr(slash);
    }

    std::size_t colon = hostPort.rfind(':');
    if (colon == std::string::npos || hostPort.find(']', colon) != std::string::npos) {
        parts.host = hostPort;
        parts.port = (parts.scheme == std::string("https")) ? std::string("443") : std::string("80");
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    // Bracketed IPv6 literal
    if (parts.host.size() > 1 && parts.host.front() == '[' && parts.host.back() == ']') {
        parts.host = parts.host.substr(1, parts.host.size() - 2);
    }
    return parts;
}

std::future<void> HTTPTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready; auto fut = ready.get_future();
    if (pImpl->running.load()) {
        ready.set_value();
        return fut;
    }
    pImpl->ioc.restart();
    pImpl->running.store(true);
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    pImpl->ioThread = std::thread([this, pr = std::move(ready)]() mutable {
        pr.set_value();
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(std::string("HTTP io loop terminated: ") + e.what());
        }
    });
    return fut;
}

std::future<void> HTTPTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->workGuard) {
        pImpl->workGuard->reset(); pImpl->workGuard.reset();
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }

    // Fail requests that never completed
    std::unordered_map<std::uint64_t, std::promise<HttpResponse>> orphaned;
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        orphaned.swap(pImpl->pendingRequests);
    }
    if (!orphaned.empty()) {
        pImpl->setError(std::string("HTTP Close: failing pending size=") + std::to_string(orphaned.size()));
    }
    for (auto& kv : orphaned) {
        kv.second.set_exception(std::make_exception_ptr(errors::TransportError("Transport closed")));
    }
    done.set_value();
    return fut;
}

bool HTTPTransport::IsRunning() const {
    return pImpl->running.load();
}

std::future<HttpResponse> HTTPTransport::SendRequest(HttpRequest request) {
    FUNC_SCOPE();
    std::promise<HttpResponse> promise;
    auto fut = promise.get_future();

    if (!pImpl->running.load()) {
        promise.set_exception(std::make_exception_ptr(errors::TransportError("Transport not started")));
        return fut;
    }

    const std::uint64_t key = ++pImpl->requestCounter;
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        pImpl->pendingRequests[key] = std::move(promise);
    }
    pImpl->setError(std::string("HTTP DEBUG: ") + methodName(request.method) + " " + request.url);

    net::co_spawn(pImpl->ioc, pImpl->coSend(std::move(request)),
        [this, key](std::exception_ptr eptr, HttpResponse response) {
            pImpl->deliver(key, eptr, std::move(response));
        });

    return fut;
}

void HTTPTransport::SetAuth(std::shared_ptr<auth::IAuth> auth) {
    FUNC_SCOPE();
    pImpl->auth = std::move(auth);
}

void HTTPTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->errorHandler = std::move(handler);
}

} // namespace cdev

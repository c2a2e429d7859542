//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_transport.cpp
// Purpose: HTTPTransport against a loopback Beast server (headers, bodies, status, network failures)
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "cdev/HTTPTransport.hpp"
#include "cdev/auth/BasicAuth.hpp"
#include "cdev/errors/Errors.h"

namespace {

namespace http = boost::beast::http;

struct CapturedRequest {
    std::string method;
    std::string target;
    std::string body;
    std::string authorization;
    std::string contentType;
    bool hasContentType{false};
    bool hasAuthorization{false};
    std::string host;
    std::string accept;
};

struct MiniServer {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor{io};
    std::thread thr;
    std::atomic<bool> running{false};
    unsigned short port{0};

    std::mutex mutex;
    CapturedRequest last;

    static void writeResponse(boost::beast::tcp_stream& stream, const http::request<http::string_body>& req,
                              http::status status, const std::string& body) {
        http::response<http::string_body> res{status, req.version()};
        res.set(http::field::server, "mini-server");
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);
        res.body() = body;
        res.prepare_payload();
        http::write(stream, res);
    }

    void runOnce() {
        using boost::asio::ip::tcp;
        try {
            tcp::socket socket{io};
            acceptor.accept(socket);
            if (!running.load()) {
                return;
            }
            boost::beast::tcp_stream stream{std::move(socket)};
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            http::read(stream, buffer, req);
            {
                std::lock_guard<std::mutex> lk(mutex);
                last = CapturedRequest{};
                last.method = std::string(req.method_string());
                last.target = std::string(req.target());
                last.body = req.body();
                last.hasAuthorization = req.find(http::field::authorization) != req.end();
                if (last.hasAuthorization) last.authorization = std::string(req[http::field::authorization]);
                last.hasContentType = req.find(http::field::content_type) != req.end();
                if (last.hasContentType) last.contentType = std::string(req[http::field::content_type]);
                last.host = std::string(req[http::field::host]);
                last.accept = std::string(req[http::field::accept]);
            }
            const std::string target = std::string(req.target());
            if (target == "/fail") {
                writeResponse(stream, req, http::status::internal_server_error, "{\"error\":\"boom\"}");
            } else if (target == "/large") {
                writeResponse(stream, req, http::status::ok, "\"" + std::string(2 * 1024 * 1024, 'x') + "\"");
            } else {
                writeResponse(stream, req, http::status::ok, "{\"ok\":true}");
            }
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        } catch (const std::exception&) {
            // Client-side aborts are expected in negative tests
        }
    }

    void start() {
        using boost::asio::ip::tcp;
        tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        running.store(true);
        thr = std::thread([this]() {
            while (running.load()) {
                runOnce();
            }
        });
    }

    void stop() {
        running.store(false);
        boost::system::error_code ec;
        // Wake the blocking accept
        boost::asio::ip::tcp::socket poke{io};
        poke.connect({boost::asio::ip::make_address("127.0.0.1"), port}, ec);
        poke.close(ec);
        if (thr.joinable()) {
            thr.join();
        }
        acceptor.close(ec);
    }

    CapturedRequest captured() {
        std::lock_guard<std::mutex> lk(mutex);
        return last;
    }

    std::string url(const std::string& path) const {
        std::ostringstream oss;
        oss << "http://127.0.0.1:" << port << path;
        return oss.str();
    }
};

unsigned short unusedPort() {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor a{io, {boost::asio::ip::make_address("127.0.0.1"), 0}};
    const unsigned short p = a.local_endpoint().port();
    a.close();
    return p;
}

std::unique_ptr<cdev::ITransport> makeTransport() {
    cdev::HTTPTransport::Options o;
    o.connectTimeoutMs = 1000;
    o.readTimeoutMs = 3000;
    o.userAgent = "cdev-tests";
    return std::make_unique<cdev::HTTPTransport>(o);
}

} // namespace

TEST(HTTPTransport, PutSendsJsonBodyAndBasicAuth) {
    MiniServer srv;
    srv.start();
    auto t = makeTransport();
    t->SetAuth(std::make_shared<cdev::auth::BasicAuth>("_SYSTEM", "SYS"));
    t->Start().get();

    cdev::HttpRequest req;
    req.method = cdev::HttpMethod::Put;
    req.url = srv.url("/csp/sys/dev/namespaces/USER/files/");
    req.body = "{\"name\":\"A.mac\"}";
    auto fut = t->SendRequest(req);
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    cdev::HttpResponse res = fut.get();
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "{\"ok\":true}");

    auto seen = srv.captured();
    EXPECT_EQ(seen.method, "PUT");
    EXPECT_EQ(seen.target, "/csp/sys/dev/namespaces/USER/files/");
    EXPECT_EQ(seen.body, "{\"name\":\"A.mac\"}");
    ASSERT_TRUE(seen.hasAuthorization);
    EXPECT_EQ(seen.authorization, "Basic X1NZU1RFTTpTWVM=");
    ASSERT_TRUE(seen.hasContentType);
    EXPECT_EQ(seen.contentType, "application/json");
    EXPECT_EQ(seen.accept, "application/json");
    EXPECT_EQ(seen.host, "127.0.0.1:" + std::to_string(srv.port));

    t->Close().get();
    srv.stop();
}

TEST(HTTPTransport, GetWithoutBodyHasNoContentType) {
    MiniServer srv;
    srv.start();
    auto t = makeTransport();
    t->Start().get();

    cdev::HttpRequest req;
    req.url = srv.url("/csp/sys/dev/");
    cdev::HttpResponse res = t->SendRequest(req).get();
    EXPECT_EQ(res.status, 200);

    auto seen = srv.captured();
    EXPECT_EQ(seen.method, "GET");
    EXPECT_FALSE(seen.hasContentType);
    EXPECT_FALSE(seen.hasAuthorization);

    t->Close().get();
    srv.stop();
}

TEST(HTTPTransport, EmptyCredentialsSendNoAuthorization) {
    MiniServer srv;
    srv.start();
    auto t = makeTransport();
    t->SetAuth(std::make_shared<cdev::auth::BasicAuth>("_SYSTEM", ""));
    t->Start().get();

    cdev::HttpRequest req;
    req.url = srv.url("/csp/sys/dev/");
    (void)t->SendRequest(req).get();
    EXPECT_FALSE(srv.captured().hasAuthorization);

    t->Close().get();
    srv.stop();
}

TEST(HTTPTransport, ErrorStatusIsReturnedWithBody) {
    MiniServer srv;
    srv.start();
    auto t = makeTransport();
    t->Start().get();

    cdev::HttpRequest req;
    req.method = cdev::HttpMethod::Post;
    req.url = srv.url("/fail");
    req.body = "{\"action\":\"compile\"}";
    cdev::HttpResponse res = t->SendRequest(req).get();
    EXPECT_EQ(res.status, 500);
    EXPECT_FALSE(res.IsSuccess());
    EXPECT_EQ(res.body, "{\"error\":\"boom\"}");
    EXPECT_EQ(srv.captured().method, "POST");

    t->Close().get();
    srv.stop();
}

TEST(HTTPTransport, LargeBodiesAreNotTruncated) {
    MiniServer srv;
    srv.start();
    auto t = makeTransport();
    t->Start().get();

    cdev::HttpRequest req;
    req.url = srv.url("/large");
    cdev::HttpResponse res = t->SendRequest(req).get();
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body.size(), 2u * 1024u * 1024u + 2u);

    t->Close().get();
    srv.stop();
}

TEST(HTTPTransport, ConnectionRefusedIsTransportError) {
    auto t = makeTransport();
    std::atomic<bool> sawError{false};
    t->SetErrorHandler([&](const std::string&) { sawError.store(true); });
    t->Start().get();

    cdev::HttpRequest req;
    req.url = "http://127.0.0.1:" + std::to_string(unusedPort()) + "/csp/sys/dev/";
    auto fut = t->SendRequest(req);
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_THROW(fut.get(), cdev::errors::TransportError);
    EXPECT_TRUE(sawError.load());

    t->Close().get();
}

TEST(HTTPTransport, SendBeforeStartFails) {
    auto t = makeTransport();
    cdev::HttpRequest req;
    req.url = "http://127.0.0.1:1/";
    EXPECT_THROW(t->SendRequest(req).get(), cdev::errors::TransportError);
    EXPECT_FALSE(t->IsRunning());
}

TEST(HTTPTransport, UnsupportedSchemeIsTransportError) {
    auto t = makeTransport();
    t->Start().get();
    cdev::HttpRequest req;
    req.url = "ftp://127.0.0.1:21/file";
    EXPECT_THROW(t->SendRequest(req).get(), cdev::errors::TransportError);
    t->Close().get();
}

TEST(HTTPTransport, ParseUrlSplitsComponents) {
    auto u = cdev::HTTPTransport::ParseUrl("http://localhost:57772/csp/sys/dev/");
    EXPECT_EQ(u.scheme, "http");
    EXPECT_EQ(u.host, "localhost");
    EXPECT_EQ(u.port, "57772");
    EXPECT_EQ(u.target, "/csp/sys/dev/");

    auto s = cdev::HTTPTransport::ParseUrl("https://db.example.com/api");
    EXPECT_EQ(s.scheme, "https");
    EXPECT_EQ(s.port, "443");
    EXPECT_EQ(s.target, "/api");

    auto d = cdev::HTTPTransport::ParseUrl("http://example.com");
    EXPECT_EQ(d.port, "80");
    EXPECT_EQ(d.target, "/");

    auto v6 = cdev::HTTPTransport::ParseUrl("http://[::1]:8080/x");
    EXPECT_EQ(v6.host, "::1");
    EXPECT_EQ(v6.port, "8080");
}

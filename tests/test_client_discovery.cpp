//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_client_discovery.cpp
// Purpose: Client construction (discovery handshake, authentication, construction failures)
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include <boost/asio.hpp>

#include "cdev/Client.h"
#include "cdev/InMemoryTransport.hpp"
#include "cdev/errors/Errors.h"
#include "support/FakeDevServer.h"

using namespace cdev;

namespace {

HttpResponse respond(int status, const std::string& body) {
    HttpResponse r;
    r.status = status;
    r.reason = status == 200 ? "OK" : "Internal Server Error";
    r.body = body;
    return r;
}

std::unique_ptr<ITransport> fixed(int status, const std::string& body) {
    return std::make_unique<InMemoryTransport>([status, body](const HttpRequest&) { return respond(status, body); });
}

std::string headerValue(const HttpRequest& req, const std::string& name) {
    for (const auto& h : req.headers) {
        if (h.name == name) return h.value;
    }
    return std::string();
}

bool hasHeader(const HttpRequest& req, const std::string& name) {
    for (const auto& h : req.headers) {
        if (h.name == name) return true;
    }
    return false;
}

} // namespace

TEST(ClientDiscovery, LearnsNamespacesLocator) {
    fake::FakeDevServer server;
    auto client = server.Connect();
    EXPECT_EQ(client->NamespacesLocator(), "/csp/sys/dev/namespaces/");
    EXPECT_EQ(client->UrlPrefix(), "http://localhost:57772");

    ASSERT_EQ(server.requests.size(), 1u);
    EXPECT_EQ(server.requests[0].method, HttpMethod::Get);
    EXPECT_EQ(server.requests[0].url, "http://localhost:57772/csp/sys/dev/");
    EXPECT_FALSE(server.requests[0].body.has_value());
}

TEST(ClientDiscovery, SendsBasicAuthWhenBothCredentialsSet) {
    fake::FakeDevServer server;
    auto client = server.Connect();
    ASSERT_FALSE(server.requests.empty());
    EXPECT_EQ(headerValue(server.requests[0], "Authorization"), "Basic X1NZU1RFTTpTWVM=");
}

TEST(ClientDiscovery, OmitsAuthWhenPasswordEmpty) {
    fake::FakeDevServer server;
    Client::Options opts;
    opts.username = "_SYSTEM";
    Client client(opts, server.MakeTransport());
    ASSERT_FALSE(server.requests.empty());
    EXPECT_FALSE(hasHeader(server.requests[0], "Authorization"));
}

TEST(ClientDiscovery, HonoursCustomHostAndRootPath) {
    std::string seenUrl;
    auto transport = std::make_unique<InMemoryTransport>([&](const HttpRequest& req) {
        seenUrl = req.url;
        return respond(200, R"({"namespaces":"/api/dev/namespaces/"})");
    });
    Client::Options opts;
    opts.host = "db.example.com";
    opts.port = 52773;
    opts.rootPath = "/api/dev/";
    Client client(opts, std::move(transport));
    EXPECT_EQ(seenUrl, "http://db.example.com:52773/api/dev/");
    EXPECT_EQ(client.NamespacesLocator(), "/api/dev/namespaces/");
}

TEST(ClientDiscovery, MalformedJsonIsProtocolError) {
    EXPECT_THROW(Client(Client::Options{}, fixed(200, "<html>login</html>")), errors::ProtocolError);
}

TEST(ClientDiscovery, RootWithoutNamespacesIsProtocolError) {
    EXPECT_THROW(Client(Client::Options{}, fixed(200, R"({"version":2})")), errors::ProtocolError);
}

TEST(ClientDiscovery, ErrorStatusIsProtocolError) {
    try {
        Client client(Client::Options{}, fixed(500, "oops"));
        FAIL() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_EQ(e.code(), 54);
        EXPECT_NE(std::string(e.what()).find("500"), std::string::npos);
    }
}

TEST(ClientDiscovery, NetworkFailureIsConnectionError) {
    auto transport = std::make_unique<InMemoryTransport>([](const HttpRequest&) -> HttpResponse {
        throw std::runtime_error("connection refused");
    });
    EXPECT_THROW(Client(Client::Options{}, std::move(transport)), errors::ConnectionError);
}

TEST(ClientDiscovery, UnreachableServerIsConnectionError) {
    unsigned short port = 0;
    {
        boost::asio::io_context io;
        boost::asio::ip::tcp::acceptor a{io, {boost::asio::ip::make_address("127.0.0.1"), 0}};
        port = a.local_endpoint().port();
    }
    Client::Options opts;
    opts.host = "127.0.0.1";
    opts.port = port;
    opts.connectTimeoutMs = 1000;
    opts.readTimeoutMs = 1000;
    try {
        Client client(opts);
        FAIL() << "expected ConnectionError";
    } catch (const errors::ConnectionError& e) {
        EXPECT_EQ(e.code(), 44);
        EXPECT_EQ(std::string(e.what()).rfind("CDev Exception #44: Cannot Connect to Server", 0), 0u);
    }
}

TEST(ClientDiscovery, NullTransportIsRejected) {
    EXPECT_THROW(Client(Client::Options{}, nullptr), std::invalid_argument);
}

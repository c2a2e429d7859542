//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_inmemory_transport.cpp
// Purpose: InMemoryTransport basic tests
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>

#include "cdev/InMemoryTransport.hpp"
#include "cdev/auth/BasicAuth.hpp"
#include "cdev/errors/Errors.h"

using namespace cdev;

TEST(InMemoryTransport, HandlerSeesAuthHeaders) {
    std::string authorization;
    InMemoryTransport t([&](const HttpRequest& req) {
        for (const auto& h : req.headers) {
            if (h.name == "Authorization") authorization = h.value;
        }
        HttpResponse r;
        r.status = 200;
        r.body = "{}";
        return r;
    });
    t.SetAuth(std::make_shared<auth::BasicAuth>("a", "b"));
    t.Start().get();

    HttpRequest req;
    req.url = "http://localhost:57772/csp/sys/dev/";
    auto fut = t.SendRequest(req);
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(fut.get().body, "{}");
    EXPECT_EQ(authorization, "Basic YTpi");

    t.Close().get();
    EXPECT_FALSE(t.IsRunning());
}

TEST(InMemoryTransport, HandlerExceptionBecomesTransportError) {
    std::string reported;
    InMemoryTransport t([](const HttpRequest&) -> HttpResponse { throw std::runtime_error("reset"); });
    t.SetErrorHandler([&](const std::string& msg) { reported = msg; });
    t.Start().get();
    EXPECT_THROW(t.SendRequest(HttpRequest{}).get(), errors::TransportError);
    EXPECT_NE(reported.find("reset"), std::string::npos);
}

TEST(InMemoryTransport, RequiresStart) {
    InMemoryTransport t([](const HttpRequest&) { return HttpResponse{}; });
    EXPECT_THROW(t.SendRequest(HttpRequest{}).get(), errors::TransportError);
}

TEST(InMemoryTransport, SetHandlerReplacesHandler) {
    InMemoryTransport t([](const HttpRequest&) { return HttpResponse{}; });
    t.SetHandler([](const HttpRequest& req) {
        HttpResponse r;
        r.status = 204;
        r.body = req.url;
        return r;
    });
    t.Start().get();
    HttpRequest req;
    req.url = "http://x:1/y";
    HttpResponse res = t.SendRequest(req).get();
    EXPECT_EQ(res.status, 204);
    EXPECT_TRUE(res.IsSuccess());
    EXPECT_EQ(res.body, "http://x:1/y");
}

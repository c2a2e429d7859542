//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/cdev/auth/BasicAuth.hpp
// Purpose: HTTP Basic authentication implementing IAuth
//==========================================================================================================
#pragma once

#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <utility>
#include <boost/asio/awaitable.hpp>

#include "cdev/auth/IAuth.hpp"

namespace cdev::auth {

//==========================================================================================================
// BasicAuth
// Purpose: Adds "Authorization: Basic base64(username:password)" to every request. No header is produced
//          unless both username and password are non-empty.
//==========================================================================================================
class BasicAuth final : public IAuth {
public:
    BasicAuth(std::string username, std::string password)
        : username(std::move(username)), password(std::move(password)) {}

    boost::asio::awaitable<void> ensureReady() override {
        co_return;
    }

    std::vector<HeaderKV> headers() const override;

    void setErrorHandler(std::function<void(const std::string&)> fn) override {
        (void)fn; // nothing to report for static credentials
    }

    // Standard base64 (RFC 4648, padded) of arbitrary bytes.
    static std::string Base64Encode(const std::string& bytes);

private:
    std::string username;
    std::string password;
};

using BasicAuthPtr = std::shared_ptr<BasicAuth>;

} // namespace cdev::auth

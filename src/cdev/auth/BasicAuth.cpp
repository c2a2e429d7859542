//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/cdev/auth/BasicAuth.cpp
// Purpose: HTTP Basic authentication header construction
//==========================================================================================================

#include <string>
#include <vector>

#include <openssl/evp.h>

#include "cdev/auth/BasicAuth.hpp"

namespace cdev::auth {

std::string BasicAuth::Base64Encode(const std::string& bytes) {
    if (bytes.empty()) {
        return std::string();
    }
    // EVP_EncodeBlock writes 4 output chars per 3 input bytes plus a NUL terminator
    const std::vector<unsigned char> in(bytes.begin(), bytes.end());
    std::vector<unsigned char> out(4 * ((in.size() + 2) / 3) + 1);
    const int n = ::EVP_EncodeBlock(out.data(), in.data(), static_cast<int>(in.size()));
    return std::string(out.begin(), out.begin() + n);
}

std::vector<HeaderKV> BasicAuth::headers() const {
    if (username.empty() || password.empty()) {
        return {};
    }
    return { HeaderKV{ "Authorization", std::string("Basic ") + Base64Encode(username + ":" + password) } };
}

} // namespace cdev::auth

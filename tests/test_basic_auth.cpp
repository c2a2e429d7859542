//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_basic_auth.cpp
// Purpose: BasicAuth header generation
//==========================================================================================================

#include <gtest/gtest.h>

#include "cdev/auth/BasicAuth.hpp"

using cdev::auth::BasicAuth;

TEST(BasicAuth, Base64MatchesRfc4648) {
    EXPECT_EQ(BasicAuth::Base64Encode(""), "");
    EXPECT_EQ(BasicAuth::Base64Encode("a:b"), "YTpi");
    EXPECT_EQ(BasicAuth::Base64Encode("_SYSTEM:SYS"), "X1NZU1RFTTpTWVM=");
    EXPECT_EQ(BasicAuth::Base64Encode("admin:s3cret!"), "YWRtaW46czNjcmV0IQ==");
}

TEST(BasicAuth, HeaderWhenBothCredentialsPresent) {
    BasicAuth auth("_SYSTEM", "SYS");
    auto headers = auth.headers();
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers[0].name, "Authorization");
    EXPECT_EQ(headers[0].value, "Basic X1NZU1RFTTpTWVM=");
}

TEST(BasicAuth, NoHeaderWhenEitherCredentialEmpty) {
    EXPECT_TRUE(BasicAuth("", "SYS").headers().empty());
    EXPECT_TRUE(BasicAuth("_SYSTEM", "").headers().empty());
    EXPECT_TRUE(BasicAuth("", "").headers().empty());
}

TEST(BasicAuth, Base64HandlesHighBytes) {
    EXPECT_EQ(BasicAuth::Base64Encode("\xC3\xA9:\xFF"), "w6k6/w==");
}

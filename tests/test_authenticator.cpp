//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_authenticator.cpp
// Purpose: GoogleTests for shared-secret token verification
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcpgate/security/Authenticator.hpp"

using namespace mcpgate::security;

TEST(Authenticator, AcceptsOnlyTheConfiguredSecret) {
    Authenticator auth(std::string("s3cret"));
    EXPECT_TRUE(auth.Enabled());
    EXPECT_TRUE(auth.VerifyToken("s3cret"));
    EXPECT_FALSE(auth.VerifyToken("s3cre"));
    EXPECT_FALSE(auth.VerifyToken("s3cret "));
    EXPECT_FALSE(auth.VerifyToken(""));
}

TEST(Authenticator, VerifyReportsReason) {
    Authenticator auth(std::string("abc"));
    std::string why;
    EXPECT_TRUE(auth.Verify("abc", why));
    EXPECT_TRUE(why.empty());
    EXPECT_FALSE(auth.Verify("xyz", why));
    EXPECT_EQ(why, "Invalid authentication token");
}

TEST(Authenticator, LongTokensCompareByDigest) {
    const std::string secret(4096, 'a');
    Authenticator auth(secret);
    std::string almost = secret;
    almost.back() = 'b';
    EXPECT_TRUE(auth.VerifyToken(secret));
    EXPECT_FALSE(auth.VerifyToken(almost));
}

TEST(Authenticator, EmptySecretDisablesVerification) {
    Authenticator none;
    Authenticator empty(std::string(""));
    EXPECT_FALSE(none.Enabled());
    EXPECT_FALSE(empty.Enabled());
    EXPECT_TRUE(none.VerifyToken("anything"));
}

/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/internal/router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace ktrest::internal;

class RouterTest : public ::testing::Test {
protected:
    Router router;

    void SetUp() override {
        router.add("/v2/users/{user_id}", "GET", 0);
        router.add("/v2/users/{user_id}", "PUT", 1);
        router.add("/v2/users/{user_id}/history", "GET", 2);
        router.add("/v2/seh", "GET", 3);
    }
};

TEST_F(RouterTest, LiteralRoute) {
    auto m = router.match("GET", "/v2/seh");
    ASSERT_EQ(m.kind, Router::MatchKind::Matched);
    EXPECT_EQ(m.binding_id, 3u);
    EXPECT_TRUE(m.vars.empty());
}

TEST_F(RouterTest, VariableCapturedPerMethod) {
    auto g = router.match("GET", "/v2/users/alice");
    ASSERT_EQ(g.kind, Router::MatchKind::Matched);
    EXPECT_EQ(g.binding_id, 0u);
    EXPECT_EQ(g.vars.at("user_id"), "alice");

    auto p = router.match("PUT", "/v2/users/bob");
    ASSERT_EQ(p.kind, Router::MatchKind::Matched);
    EXPECT_EQ(p.binding_id, 1u);
    EXPECT_EQ(p.vars.at("user_id"), "bob");
}

TEST_F(RouterTest, VariableFollowedByLiteral) {
    auto m = router.match("GET", "/v2/users/e2eshare.test@gmail.com/history");
    ASSERT_EQ(m.kind, Router::MatchKind::Matched);
    EXPECT_EQ(m.binding_id, 2u);
    EXPECT_EQ(m.vars.at("user_id"), "e2eshare.test@gmail.com");
}

TEST_F(RouterTest, VariableIsPercentDecoded) {
    auto m = router.match("GET", "/v2/users/a%2Fb%40c");
    ASSERT_EQ(m.kind, Router::MatchKind::Matched);
    EXPECT_EQ(m.vars.at("user_id"), "a/b@c");
}

TEST_F(RouterTest, EmptyVariableSegmentDoesNotMatch) {
    EXPECT_EQ(router.match("GET", "/v2/users/").kind, Router::MatchKind::NotFound);
    EXPECT_EQ(router.match("GET", "/v2/users//history").kind, Router::MatchKind::NotFound);
}

TEST_F(RouterTest, UnknownPathIsNotFound) {
    EXPECT_EQ(router.match("GET", "/v3/seh").kind, Router::MatchKind::NotFound);
    EXPECT_EQ(router.match("GET", "/v2/seh/extra").kind, Router::MatchKind::NotFound);
    EXPECT_EQ(router.match("GET", "/").kind, Router::MatchKind::NotFound);
}

TEST_F(RouterTest, KnownPathWrongMethod) {
    EXPECT_EQ(router.match("DELETE", "/v2/users/alice").kind, Router::MatchKind::MethodNotAllowed);
    EXPECT_EQ(router.match("POST", "/v2/seh").kind, Router::MatchKind::MethodNotAllowed);
}

TEST_F(RouterTest, DuplicateRouteThrows) {
    EXPECT_THROW(router.add("/v2/seh", "GET", 9), std::runtime_error);
    EXPECT_NO_THROW(router.add("/v2/seh", "HEAD", 9));
}

TEST(RouterTemplateTest, MalformedTemplatesThrow) {
    Router r;
    EXPECT_THROW(r.add("/users/{}", "GET", 0), std::runtime_error);
    EXPECT_THROW(r.add("/users/x{id}", "GET", 0), std::runtime_error);
    EXPECT_THROW(r.add("/users/{id", "GET", 0), std::runtime_error);
}

TEST(RouterTemplateTest, FirstRegisteredTemplateWins) {
    Router r;
    r.add("/v2/users/{user_id}", "GET", 0);
    r.add("/v2/users/me", "GET", 1);
    auto m = r.match("GET", "/v2/users/me");
    ASSERT_EQ(m.kind, Router::MatchKind::Matched);
    EXPECT_EQ(m.binding_id, 0u);
}

/*
 * Part of the ktrest (Key Transparency REST front end) project.
 *
 * SPDX-FileCopyrightText: 2025 ktrest contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ktrest. See LICENSE for details.
 */

#include "ktrest/server.hpp"

#include <gtest/gtest.h>

#include <string>

#include "fake_key_server.hpp"

using namespace ktrest;
using ktrest::test_support::FakeKeyServer;

TEST(ServerTest, PlainServerOpensNothingBeforeRun) {
    FakeKeyServer fake;
    RestServer rest(fake);
    ServerConfig cfg;
    Server srv(cfg, rest);
    EXPECT_FALSE(srv.tls_enabled());
}

TEST(ServerTest, MissingCertificateThrowsTlsError) {
    FakeKeyServer fake;
    RestServer rest(fake);
    ServerConfig cfg;
    cfg.tls_cert_file = "/nonexistent/ktrest/server.crt";
    cfg.tls_key_file  = "/nonexistent/ktrest/server.key";
    ASSERT_TRUE(cfg.tls_enabled());

    try {
        Server srv(cfg, rest);
        FAIL() << "expected TlsError";
    } catch (const internal::TlsError& e) {
        EXPECT_NE(std::string(e.what()).find("/nonexistent/ktrest/server.crt"), std::string::npos)
            << e.what();
    }
}

TEST(ServerTest, TlsContextThrowsDirectly) {
    ServerConfig cfg;
    cfg.tls_cert_file = "/nonexistent/ktrest/server.crt";
    cfg.tls_key_file  = "/nonexistent/ktrest/server.key";
    EXPECT_THROW(internal::TlsContext ctx(cfg), internal::TlsError);
}

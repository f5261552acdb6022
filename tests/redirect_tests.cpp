/*
 * The MIT License (MIT)
 *
 * Copyright (c) 2025 Yaroslav Riabtsev <yaroslav.riabtsev@rwth-aachen.de>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NON-INFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include "redirect.hpp"

#include <gtest/gtest.h>

using namespace irisspace;
using namespace corespace;

namespace {
request post_to(const std::string& url) {
    request req = parse_url(url);
    req.method = "POST";
    req.body = request_body::from_bytes("payload");
    req.headers.emplace_back("X-Trace", "abc");
    req.redirect_count = 4;
    req.raw_body = true;
    return req;
}
}

TEST(Redirect, NonRedirectStatusStops) {
    const auto current = post_to("http://example.com/a");
    EXPECT_FALSE(next_hop(200, { { "Location", "/b" } }, current).has_value());
    EXPECT_FALSE(next_hop(404, { { "Location", "/b" } }, current).has_value());
    EXPECT_FALSE(next_hop(299, { { "Location", "/b" } }, current).has_value());
    EXPECT_FALSE(next_hop(400, { { "Location", "/b" } }, current).has_value());
}

TEST(Redirect, MissingLocationStops) {
    const auto current = post_to("http://example.com/a");
    EXPECT_FALSE(next_hop(301, {}, current).has_value());
    EXPECT_FALSE(next_hop(302, { { "Retry-After", "1" } }, current).has_value());
}

TEST(Redirect, PathAbsoluteKeepsOrigin) {
    const auto current = parse_url("https://example.com:8443/bar?x=1");
    const auto next = next_hop(301, { { "Location", "/foo" } }, current);
    ASSERT_TRUE(next.has_value());
    EXPECT_TRUE(next->secure);
    EXPECT_EQ(next->host, "example.com");
    EXPECT_EQ(next->port, 8443);
    EXPECT_EQ(next->path, "/foo");
    EXPECT_EQ(next->query, "");
    EXPECT_EQ(next->url(), "https://example.com:8443/foo");
}

TEST(Redirect, PathAbsoluteWithQuery) {
    const auto current = parse_url("http://example.com/bar");
    const auto next
        = next_hop(307, { { "location", "  /search?q=iris  " } }, current);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->path, "/search");
    EXPECT_EQ(next->query, "q=iris");
    EXPECT_EQ(next->port, 80);
}

TEST(Redirect, AbsoluteLocationChangesTarget) {
    const auto current = parse_url("http://example.com/bar");
    const auto next
        = next_hop(301, { { "Location", "https://other.test/landing" } }, current);
    ASSERT_TRUE(next.has_value());
    EXPECT_TRUE(next->secure);
    EXPECT_EQ(next->host, "other.test");
    EXPECT_EQ(next->port, 443);
    EXPECT_EQ(next->path, "/landing");
    EXPECT_NE(next->key(), current.key());
}

TEST(Redirect, SeeOtherAndFoundBecomeGet) {
    const auto current = post_to("http://example.com/form");
    for (const int status : { 302, 303 }) {
        const auto next = next_hop(status, { { "Location", "/done" } }, current);
        ASSERT_TRUE(next.has_value()) << status;
        EXPECT_EQ(next->method, "GET") << status;
    }
}

TEST(Redirect, OtherRedirectsKeepMethod) {
    const auto current = post_to("http://example.com/form");
    for (const int status : { 300, 301, 307, 308 }) {
        const auto next = next_hop(status, { { "Location", "/moved" } }, current);
        ASSERT_TRUE(next.has_value()) << status;
        EXPECT_EQ(next->method, "POST") << status;
    }
}

TEST(Redirect, InheritsEverythingElse) {
    const auto current = add_proxy("proxy.local", 3128, post_to("http://example.com/a"));
    const auto next
        = next_hop(308, { { "Location", "http://example.com/b" } }, current);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->headers, current.headers);
    EXPECT_EQ(next->body.type, request_body::kind::bytes);
    EXPECT_EQ(next->body.bytes, "payload");
    EXPECT_EQ(next->redirect_count, current.redirect_count);
    EXPECT_TRUE(next->raw_body);
    ASSERT_TRUE(next->proxy.has_value());
    EXPECT_EQ(next->proxy->host, "proxy.local");
    EXPECT_TRUE(next->check_status(204, {}));
    EXPECT_TRUE(next->decompress("text/html"));
}

TEST(Redirect, CurrentIsNotModified) {
    const auto current = post_to("http://example.com/a");
    const auto next = next_hop(302, { { "Location", "/b" } }, current);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(current.method, "POST");
    EXPECT_EQ(current.path, "/a");
}

TEST(Redirect, UnparseableLocationThrows) {
    const auto current = parse_url("http://example.com/a");
    EXPECT_THROW(
        (void)next_hop(302, { { "Location", "::not a url::" } }, current),
        invalid_url
    );
    EXPECT_THROW(
        (void)next_hop(302, { { "Location", "ftp://example.com/file" } }, current),
        invalid_url
    );
}

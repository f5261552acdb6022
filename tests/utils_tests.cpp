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

#include "utils.hpp"

#include <gtest/gtest.h>

using namespace corespace;

TEST(Headers, CaseInsensitiveLookup) {
    const header_list headers { { "Content-Type", "text/plain" },
                                { "set-cookie", "a=1" },
                                { "Set-Cookie", "b=2" } };

    EXPECT_EQ(find_header(headers, "content-type"), "text/plain");
    EXPECT_EQ(find_header(headers, "SET-COOKIE"), "a=1");
    EXPECT_EQ(
        find_headers(headers, "Set-Cookie"),
        (std::vector<std::string> { "a=1", "b=2" })
    );
    EXPECT_FALSE(find_header(headers, "Location").has_value());
    EXPECT_TRUE(has_header(headers, "CONTENT-TYPE"));
}

TEST(Headers, TokenLists) {
    const header_list headers { { "Connection", "Upgrade, Close" },
                                { "Transfer-Encoding", "gzip,chunked" } };

    EXPECT_TRUE(header_has_token(headers, "connection", "close"));
    EXPECT_TRUE(header_has_token(headers, "Transfer-Encoding", "chunked"));
    EXPECT_FALSE(header_has_token(headers, "Transfer-Encoding", "chunk"));
    EXPECT_FALSE(header_has_token(headers, "Keep-Alive", "close"));
}

TEST(Strings, TrimAndLower) {
    EXPECT_EQ(trim(" \t value \t"), "value");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(to_lower("GZip"), "gzip");
    EXPECT_TRUE(iequals("Content-Length", "content-length"));
    EXPECT_FALSE(iequals("Content-Length", "Content-Lengths"));
}

TEST(Strings, Base64) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foob"), "Zm9vYg==");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
}

TEST(NetworkMetrics, DefaultInitialization) {
    const network_metrics metrics;
    EXPECT_EQ(metrics.requests.load(), 0u);
    EXPECT_EQ(metrics.retries.load(), 0u);
    EXPECT_EQ(metrics.redirects.load(), 0u);
    EXPECT_EQ(metrics.bytes_received.load(), 0u);
    for (const auto& status : metrics.statuses) {
        EXPECT_EQ(status.load(), 0u);
    }
}

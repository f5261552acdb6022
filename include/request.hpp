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

#ifndef IRIS_REQUEST_HPP
#define IRIS_REQUEST_HPP
#include "errors.hpp"

#include <compare>
#include <cstdint>
#include <functional>

namespace irisspace {

/**
 * @brief Pull-based byte producer.
 *
 * Each call returns the next chunk; `std::nullopt` marks the end.
 */
using chunk_producer = std::function<std::optional<std::string>()>;

/**
 * @struct request_body
 * @brief Body attached to a request.
 *
 * Kinds:
 *  - `none`: no body and no `Content-Length` header.
 *  - `bytes`: a fixed buffer sent as-is.
 *  - `stream`: `length` bytes pulled from a producer. `stream` is a
 *    factory so the body can be produced again when an attempt is retried
 *    on a fresh connection.
 */
struct request_body {
    enum class kind { none, bytes, stream };

    kind type = kind::none;
    std::string bytes;
    std::uint64_t length = 0;
    std::function<chunk_producer()> stream;

    static request_body from_bytes(std::string data);
    static request_body
    from_stream(std::uint64_t length, std::function<chunk_producer()> stream);

    /// Value of the computed `Content-Length` header, if any.
    [[nodiscard]] std::optional<std::uint64_t> content_length() const;
};

/// @brief HTTP proxy the request is sent through.
struct proxy_address {
    std::string host;
    int port = 80;

    auto operator<=>(const proxy_address&) const = default;
};

/**
 * @brief Decide from the response `Content-Type` whether a compressed body
 * is inflated before it reaches the caller.
 */
using decompress_predicate = std::function<bool(std::string_view)>;

/**
 * @brief Decide whether a final (non-redirect) response counts as success.
 */
using status_checker
    = std::function<bool(int status_code, const corespace::header_list&)>;

/// Accept 2xx and 3xx, reject everything else.
[[nodiscard]] bool
default_check_status(int status_code, const corespace::header_list& header);

/// Inflate everything except tarballs.
[[nodiscard]] bool browser_decompress(std::string_view content_type);
[[nodiscard]] bool always_decompress(std::string_view content_type);
[[nodiscard]] bool never_decompress(std::string_view content_type);

/**
 * @struct connection_key
 * @brief Identity of a pool bucket.
 *
 * Two requests with equal keys may share a connection; connections are
 * never shared between different keys.
 */
struct connection_key {
    std::string host;
    int port = 80;
    bool secure = false;
    std::optional<proxy_address> proxy;

    auto operator<=>(const connection_key&) const = default;
};

/// @brief Human readable form used in log lines.
[[nodiscard]] std::string to_string(const connection_key& key);

/**
 * @struct request
 * @brief Description of one HTTP exchange.
 *
 * A request is treated as an immutable value: the helpers below and the
 * redirect policy return modified copies.
 *
 * The `Host` and `Content-Length` headers are computed during
 * serialization and must not appear in `headers`.
 */
struct request {
    std::string method = "GET";
    bool secure = false;
    std::string host = "localhost";
    int port = 80;
    std::string path = "/";
    std::string query; ///< Query string without the leading '?'.
    corespace::header_list headers;
    request_body body;
    std::optional<proxy_address> proxy;
    bool raw_body = false; ///< Pass chunked framing through untouched.
    decompress_predicate decompress = browser_decompress;
    status_checker check_status = default_check_status;
    int redirect_count = 10; ///< Redirect hops followed before failing.

    /// Pool bucket this request is sent over.
    [[nodiscard]] connection_key key() const;
    /// Absolute URL with an explicit port, e.g. `http://host:80/p?q`.
    [[nodiscard]] std::string url() const;
};

/**
 * @brief Parse an absolute http(s) URL into a request with default fields.
 * @throws corespace::invalid_url if the URL is malformed or not http(s).
 */
request parse_url(std::string_view url);

/**
 * @brief Parse @p url and apply its target onto a copy of @p base.
 *
 * Only `secure`, `host`, `port`, `path` and `query` are taken from the URL;
 * every other field comes from @p base.
 *
 * @throws corespace::invalid_url if the URL is malformed or not http(s).
 */
request parse_url(std::string_view url, const request& base);

/// Add an `Authorization: Basic` header.
request apply_basic_auth(
    std::string_view user, std::string_view password, request req
);

/// Route the request through an HTTP proxy.
request add_proxy(std::string host, int port, request req);

/**
 * @brief Turn the request into a form submission.
 *
 * Sets the method to `POST`, the body to the URL-encoded @p form and the
 * `Content-Type` header to `application/x-www-form-urlencoded`.
 */
request url_encoded_body(const corespace::parameter_list& form, request req);
}
#endif // IRIS_REQUEST_HPP

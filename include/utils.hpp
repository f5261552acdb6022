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

#ifndef IRIS_UTILS_HPP
#define IRIS_UTILS_HPP
#include <array>
#include <atomic>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace corespace {

/// @brief Single key/value pair (header field or form parameter).
using parameter = std::pair<std::string, std::string>;
/// @brief Ordered list of form or query parameters.
using parameter_list = std::vector<parameter>;

/**
 * @brief Insertion-ordered header multimap.
 *
 * Field names keep the spelling they were inserted with; lookups through
 * `find_header` / `find_headers` compare names case-insensitively, as HTTP
 * requires.
 */
using header_list = std::vector<parameter>;

/**
 * @brief ASCII case-insensitive comparison of two header tokens.
 * @return true if both strings are equal ignoring ASCII case.
 */
[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs);

/**
 * @brief First value stored under @p name.
 * @return The value or `std::nullopt` if the header is absent.
 */
[[nodiscard]] std::optional<std::string>
find_header(const header_list& headers, std::string_view name);

/**
 * @brief Every value stored under @p name, in insertion order.
 */
[[nodiscard]] std::vector<std::string>
find_headers(const header_list& headers, std::string_view name);

/// @brief Whether a header named @p name exists.
[[nodiscard]] bool has_header(const header_list& headers, std::string_view name);

/// @brief Whether the comma-separated header @p name lists token @p token.
[[nodiscard]] bool header_has_token(
    const header_list& headers, std::string_view name, std::string_view token
);

/// @brief Strip leading and trailing spaces and horizontal tabs.
[[nodiscard]] std::string_view trim(std::string_view text);

/// @brief Lower-case ASCII copy of @p text.
[[nodiscard]] std::string to_lower(std::string_view text);

/// @brief Standard base64 encoding (RFC 4648, with padding).
[[nodiscard]] std::string base64_encode(std::string_view data);

/**
 * @struct network_metrics
 * @brief Thread-safe counters describing client-side networking activity.
 *
 * Semantics:
 *  - `requests` counts attempts whose request bytes were handed to a
 *    connection (including the one that may fail on a stale connection).
 *  - `retries` counts stale pooled connections replaced by a fresh dial.
 *  - `redirects` counts redirect hops that were followed.
 *  - `bytes_received` sums decoded body bytes buffered by `http_lbs`.
 *  - `statuses[i]` counts parsed responses with HTTP status `i` (0..599).
 *    Values outside the array bounds are ignored.
 *
 * All counters are atomics; readers observe eventually consistent snapshots
 * without additional synchronization.
 */
struct network_metrics final {
    std::atomic<unsigned> requests { 0 }; ///< Attempts made.
    std::atomic<unsigned> retries { 0 }; ///< Stale-connection retries.
    std::atomic<unsigned> redirects { 0 }; ///< Redirect hops followed.
    std::atomic<size_t> bytes_received {
        0
    }; ///< Sum of decoded body bytes (bytes).
    std::array<std::atomic<unsigned>, 600>
        statuses; ///< Per-code histogram for HTTP 0..599.

    /**
     * @brief Zero-initialize per-status counters.
     */
    network_metrics();
};

/**
 * @struct manager_settings
 * @brief Fixed options for a connection manager and its transport.
 *
 * Pooling:
 *  - `connection_count`: idle connections retained per connection key;
 *    connections returned beyond that are closed.
 *
 * Transport:
 *  - `check_certs`: verify TLS peer certificate and host name.
 *  - `connect_timeout_ms`: dial timeout (TCP and TLS handshake).
 *  - `io_timeout_ms`: maximum wait for a single read or write to progress.
 */
struct manager_settings {
    size_t connection_count = 10; ///< Idle connections kept per key.
    bool check_certs = true; ///< Strict certificate verification.
    int connect_timeout_ms = 3000; ///< Dial timeout (ms).
    int io_timeout_ms = 10000; ///< Per-operation socket timeout (ms).
};

}
#endif // IRIS_UTILS_HPP

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

#ifndef IRIS_HTTP_CLIENT_HPP
#define IRIS_HTTP_CLIENT_HPP
#include "redirect.hpp"
#include "response.hpp"

namespace irisspace {
/// @brief Observer handed every outbound chunk before it is written.
using request_sink = std::function<void(std::string_view)>;

/**
 * @class http_client
 * @brief Executes requests over a shared connection manager.
 *
 * Responsibilities:
 *  - Lease a connection, serialize the request and write it.
 *  - Replace a pooled connection that turns out to be stale: when writing
 *    to a reused connection fails, the connection is discarded and the
 *    attempt is repeated once on a freshly dialed one. A failure on a fresh
 *    connection is reported as-is.
 *  - Follow redirects up to `request::redirect_count` hops.
 *  - Apply the request's status check to the final response.
 *  - Aggregate lightweight, thread-safe network metrics.
 *
 * Lifetime and thread-safety:
 *  - The client holds a reference to its manager, which must outlive it.
 *  - All state is either atomic or owned by the manager, so one instance
 *    can serve many threads.
 */
class http_client final {
public:
    explicit http_client(manager& pool);

    /**
     * @brief Perform @p req and return the response with its body unread.
     *
     * Behavior:
     *  - `redirect_count == 0`: a single attempt, 3xx responses are
     *    returned as they are.
     *  - Otherwise redirects are followed while hops remain. The body of
     *    every intermediate response is drained (or closed if it is large)
     *    before the next hop.
     *  - The final response is checked with `req.check_status`.
     *
     * Failure (the connection is disposed of and any body closed before
     * anything is thrown):
     *  - `corespace::transport_error` on dial, write or read failure.
     *  - `corespace::protocol_parse_error` on a malformed response head.
     *  - `corespace::too_many_redirects` when a redirect arrives with no
     *    hops left.
     *  - `corespace::status_rejected` when the status check fails.
     *  - `corespace::invalid_url` for an unparseable `Location`.
     *
     * @return Response whose body must be consumed or closed by the caller;
     *         the connection goes back to the pool once the body was read
     *         to its end.
     */
    streaming_response http(const request& req);
    /**
     * @brief Like `http(req)`, additionally handing every outbound chunk to
     * @p sink (e.g. for request logging).
     */
    streaming_response http(const request& req, const request_sink& sink);

    /**
     * @brief Perform @p req and read the whole body into memory.
     *
     * Equivalent to `lbs_response(http(req))`.
     */
    http_response http_lbs(const request& req);
    http_response http_lbs(const request& req, const request_sink& sink);

    /**
     * @brief Access aggregated network metrics.
     * @return Const reference to the metrics snapshot.
     */
    [[nodiscard]] const corespace::network_metrics& metrics_info() const;

private:
    /**
     * @brief One exchange without redirect handling.
     *
     * Retries once on a fresh connection when the request could not be
     * written to a reused one.
     */
    streaming_response http_raw(const request& req, const request_sink& sink);
    /// Loop over `http_raw` while the redirect policy yields a next hop.
    streaming_response
    follow_redirects(const request& req, const request_sink& sink);
    /**
     * @brief Parse the response head and bind the body to @p conn.
     *
     * On failure @p conn is discarded by its destructor.
     */
    streaming_response read_response(const request& req, lease conn);
    /// Bump the per-status histogram.
    void update_metrics(const response_head& head);

    static void write_request(
        chunk_producer& produce, corespace::connection& conn,
        const request_sink& sink
    );

    manager& pool; ///< Shared connection pool.
    corespace::network_metrics metrics; ///< Aggregated metrics (atomic).
};

/**
 * @brief Download @p url and return its body.
 *
 * Uses a private manager with default settings, follows up to 10
 * redirects and rejects statuses outside 2xx/3xx.
 *
 * @throws corespace::invalid_url, or any error of `http_client::http`.
 */
std::string simple_http(std::string_view url);
}
#endif // IRIS_HTTP_CLIENT_HPP

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

#include "http_client.hpp"

#include <spdlog/spdlog.h>

namespace irisspace {
namespace {
    // Intermediate redirect bodies up to this size are drained so their
    // connection can be reused; larger ones are closed.
    constexpr size_t redirect_drain_limit = 64 * 1024;
}

http_client::http_client(manager& pool)
    : pool(pool) { }

const corespace::network_metrics& http_client::metrics_info() const {
    return metrics;
}

streaming_response http_client::http(const request& req) {
    return http(req, {});
}

streaming_response
http_client::http(const request& req, const request_sink& sink) {
    if (req.redirect_count < 0) {
        throw std::invalid_argument("redirect_count must not be negative");
    }
    streaming_response response = req.redirect_count == 0
        ? http_raw(req, sink)
        : follow_redirects(req, sink);

    if (req.check_status
        && !req.check_status(response.status_code, response.header)) {
        response.body.close();
        spdlog::debug(
            "status {} from {} rejected", response.status_code, response.url
        );
        throw corespace::status_rejected(
            response.status_code, std::move(response.reason),
            std::move(response.header), std::move(response.url)
        );
    }
    return response;
}

http_response http_client::http_lbs(const request& req) {
    return http_lbs(req, {});
}

http_response
http_client::http_lbs(const request& req, const request_sink& sink) {
    http_response response = lbs_response(http(req, sink));
    metrics.bytes_received += response.text.size();
    return response;
}

streaming_response
http_client::follow_redirects(const request& req, const request_sink& sink) {
    request current = req;
    for (int remaining = req.redirect_count;; --remaining) {
        streaming_response response = http_raw(current, sink);
        auto next = next_hop(response.status_code, response.header, current);
        if (!next) {
            return response;
        }
        if (remaining == 0) {
            response.body.close();
            throw corespace::too_many_redirects(current.url());
        }

        ++metrics.redirects;
        spdlog::debug(
            "{} redirect from {} to {}", response.status_code, current.url(),
            next->url()
        );
        response.body.drain(redirect_drain_limit);
        current = std::move(*next);
    }
}

streaming_response
http_client::http_raw(const request& req, const request_sink& sink) {
    const connection_key key = req.key();
    for (bool allow_reuse = true;; allow_reuse = false) {
        chunk_producer produce = serialize(req);
        lease conn = pool.acquire(key, allow_reuse);
        ++metrics.requests;
        try {
            write_request(produce, conn.get(), sink);
        } catch (const corespace::transport_error& e) {
            const bool stale = conn.origin() == provenance::reused;
            pool.release(std::move(conn), disposition::discard);
            if (!stale) {
                throw;
            }
            ++metrics.retries;
            spdlog::debug(
                "pooled connection for {} failed ({}), retrying on a fresh one",
                to_string(key), e.what()
            );
            continue;
        }
        return read_response(req, std::move(conn));
    }
}

void http_client::write_request(
    chunk_producer& produce, corespace::connection& conn,
    const request_sink& sink
) {
    while (auto chunk = produce()) {
        if (chunk->empty()) {
            continue;
        }
        if (sink) {
            sink(*chunk);
        }
        conn.write(*chunk);
    }
}

streaming_response
http_client::read_response(const request& req, lease conn) {
    auto source = std::make_unique<byte_source>(conn.get());
    response_head head = parse_response_head(*source);
    update_metrics(head);
    auto decoder = make_body_decoder(req, head, *source);

    return streaming_response {
        .status_code = head.status_code,
        .reason = std::move(head.reason),
        .version = std::move(head.version),
        .header = std::move(head.header),
        .url = req.url(),
        .body = body_reader(std::move(conn), std::move(source), std::move(decoder)),
    };
}

void http_client::update_metrics(const response_head& head) {
    if (head.status_code >= 0
        && static_cast<size_t>(head.status_code) < metrics.statuses.size()) {
        ++metrics.statuses[static_cast<size_t>(head.status_code)];
    }
}

std::string simple_http(const std::string_view url) {
    const request req = parse_url(url);
    manager pool;
    http_client client(pool);
    return client.http_lbs(req).text;
}
}

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

#ifndef IRIS_TESTS_MOCK_TRANSPORT_HPP
#define IRIS_TESTS_MOCK_TRANSPORT_HPP
#include "transport.hpp"

#include <algorithm>
#include <deque>
#include <mutex>

namespace mock {
/**
 * Server side of one scripted connection. Every request written to the
 * connection releases the next reply; replies are read back in small
 * pieces to exercise buffering.
 */
struct peer {
    std::deque<std::string> replies;
    std::string current;
    std::string written;
    int failing_writes = 0;
    size_t read_chunk = 7;
    bool closed = false;

    std::string host;
    int port = 0;
    bool secure = false;
    bool check_certs = false;
};

class connection final : public corespace::connection {
public:
    explicit connection(std::shared_ptr<peer> remote)
        : remote(std::move(remote)) { }

    void write(const std::string_view data) override {
        if (remote->closed) {
            throw corespace::transport_error("write on a closed connection");
        }
        if (remote->failing_writes > 0) {
            --remote->failing_writes;
            throw corespace::transport_error("connection reset by peer");
        }
        remote->written.append(data);
        if (remote->current.empty() && !remote->replies.empty()) {
            remote->current = std::move(remote->replies.front());
            remote->replies.pop_front();
        }
    }

    std::string read(const size_t max) override {
        if (remote->closed) {
            throw corespace::transport_error("read on a closed connection");
        }
        const size_t n
            = std::min({ max, remote->read_chunk, remote->current.size() });
        std::string out = remote->current.substr(0, n);
        remote->current.erase(0, n);
        return out;
    }

    void close() noexcept override { remote->closed = true; }

private:
    std::shared_ptr<peer> remote;
};

/**
 * Hands out scripted peers in order. With `open_on_demand` set, a blank
 * peer is created when none is queued; otherwise dialing fails.
 */
class dialer final : public corespace::dialer {
public:
    std::shared_ptr<peer> expect(std::deque<std::string> replies = {}) {
        auto remote = std::make_shared<peer>();
        remote->replies = std::move(replies);
        std::lock_guard lk(mu);
        pending.push_back(remote);
        return remote;
    }

    std::unique_ptr<corespace::connection> dial(
        const std::string& host, const int port, const bool secure,
        const bool check_certs
    ) override {
        std::lock_guard lk(mu);
        ++dials;
        if (pending.empty() && !open_on_demand) {
            throw corespace::transport_error("connection refused");
        }
        std::shared_ptr<peer> remote;
        if (pending.empty()) {
            remote = std::make_shared<peer>();
        } else {
            remote = pending.front();
            pending.pop_front();
        }
        remote->host = host;
        remote->port = port;
        remote->secure = secure;
        remote->check_certs = check_certs;
        return std::make_unique<connection>(remote);
    }

    [[nodiscard]] int dial_count() const {
        std::lock_guard lk(mu);
        return dials;
    }

    bool open_on_demand = false;

private:
    mutable std::mutex mu;
    std::deque<std::shared_ptr<peer>> pending;
    int dials = 0;
};

/// Response with a `Content-Length` matching @p body.
inline std::string reply(
    const int status, const std::string& reason, const std::string& body,
    const std::string& extra_headers = {}
) {
    return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n"
        + extra_headers + "Content-Length: " + std::to_string(body.size())
        + "\r\n\r\n" + body;
}

/// Number of requests with method @p method written to @p remote. Requests
/// are split on their head terminator and `Content-Length`.
inline int requests_written(const peer& remote, const std::string& method) {
    int count = 0;
    size_t pos = 0;
    const std::string& wire = remote.written;
    while (pos < wire.size()) {
        const size_t head_end = wire.find("\r\n\r\n", pos);
        if (head_end == std::string::npos) {
            break;
        }
        const std::string head = wire.substr(pos, head_end - pos);
        if (head.starts_with(method + " ")) {
            ++count;
        }
        size_t length = 0;
        if (const auto at = head.find("\r\nContent-Length: ");
            at != std::string::npos) {
            length = std::stoul(head.substr(at + 18));
        }
        pos = head_end + 4 + length;
    }
    return count;
}
}
#endif // IRIS_TESTS_MOCK_TRANSPORT_HPP

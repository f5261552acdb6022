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

#include "transport.hpp"

#include <cerrno>
#include <cstring>
#include <mutex>
#include <poll.h>
#include <spdlog/spdlog.h>

namespace corespace {
namespace {
    std::once_flag global_curl;

    void curl_inited() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != 0) {
            throw std::runtime_error("curl_global_init failed");
        }
    }

    void wait_socket(
        const curl_socket_t socket, const bool for_read, const int timeout_ms
    ) {
        pollfd pfd {};
        pfd.fd = socket;
        pfd.events = for_read ? POLLIN : POLLOUT;
        int rc = 0;
        do {
            rc = ::poll(&pfd, 1, timeout_ms);
        } while (rc < 0 && errno == EINTR);
        if (rc < 0) {
            throw transport_error(
                std::string("poll failed: ") + std::strerror(errno)
            );
        }
        if (rc == 0) {
            throw transport_error(
                for_read ? "timed out waiting for data"
                         : "timed out waiting to send"
            );
        }
    }
}

void global_init() { std::call_once(global_curl, curl_inited); }

curl_connection::curl_connection(
    curl_ptr handle, const curl_socket_t socket, const int timeout_ms
)
    : curl(std::move(handle))
    , socket(socket)
    , timeout_ms(timeout_ms) { }

curl_connection::~curl_connection() { close(); }

void curl_connection::write(const std::string_view data) {
    if (!curl) {
        throw transport_error("write on a closed connection");
    }
    size_t total = 0;
    while (total < data.size()) {
        size_t sent = 0;
        const CURLcode rc = curl_easy_send(
            curl.get(), data.data() + total, data.size() - total, &sent
        );
        if (rc == CURLE_AGAIN) {
            wait_socket(socket, false, timeout_ms);
            continue;
        }
        if (rc != CURLE_OK) {
            throw transport_error(
                std::string("send failed: ") + curl_easy_strerror(rc)
            );
        }
        total += sent;
    }
}

std::string curl_connection::read(const size_t max) {
    if (!curl) {
        throw transport_error("read on a closed connection");
    }
    std::string buffer(max, '\0');
    for (;;) {
        size_t received = 0;
        const CURLcode rc = curl_easy_recv(
            curl.get(), buffer.data(), buffer.size(), &received
        );
        if (rc == CURLE_AGAIN) {
            wait_socket(socket, true, timeout_ms);
            continue;
        }
        if (rc != CURLE_OK) {
            throw transport_error(
                std::string("recv failed: ") + curl_easy_strerror(rc)
            );
        }
        buffer.resize(received);
        return buffer;
    }
}

void curl_connection::close() noexcept { curl.reset(); }

curl_dialer::curl_dialer(const int connect_timeout_ms, const int io_timeout_ms)
    : connect_timeout_ms(connect_timeout_ms)
    , io_timeout_ms(io_timeout_ms) { }

std::unique_ptr<connection> curl_dialer::dial(
    const std::string& host, const int port, const bool secure,
    const bool check_certs
) {
    global_init();

    curl_connection::curl_ptr curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw transport_error("curl_easy_init failed");
    }

    const std::string url = std::string(secure ? "https" : "http") + "://"
        + host + ":" + std::to_string(port) + "/";
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECT_ONLY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    // Proxying is decided per request, never by the environment.
    curl_easy_setopt(curl.get(), CURLOPT_PROXY, "");
    curl_easy_setopt(
        curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
        static_cast<long>(connect_timeout_ms)
    );
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, check_certs ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, check_certs ? 2L : 0L);

    if (const CURLcode rc = curl_easy_perform(curl.get()); rc != CURLE_OK) {
        throw transport_error(
            "connect to " + host + ":" + std::to_string(port)
            + " failed: " + curl_easy_strerror(rc)
        );
    }

    curl_socket_t socket = CURL_SOCKET_BAD;
    if (curl_easy_getinfo(curl.get(), CURLINFO_ACTIVESOCKET, &socket)
            != CURLE_OK
        || socket == CURL_SOCKET_BAD) {
        throw transport_error("no active socket after connect");
    }
    spdlog::debug(
        "connected to {}:{}{}", host, port, secure ? " (tls)" : ""
    );
    return std::make_unique<curl_connection>(
        std::move(curl), socket, io_timeout_ms
    );
}
}

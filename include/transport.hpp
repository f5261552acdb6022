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

#ifndef IRIS_TRANSPORT_HPP
#define IRIS_TRANSPORT_HPP
#include "errors.hpp"

#include <curl/curl.h>
#include <memory>

namespace corespace {
/**
 * @brief Run `curl_global_init` once per process.
 * @throws std::runtime_error if libcurl initialization fails.
 */
void global_init();

/**
 * @class connection
 * @brief Byte sink and byte source over one established connection.
 *
 * A connection is used by a single owner at a time; implementations do not
 * need to be thread-safe.
 */
class connection {
public:
    virtual ~connection() = default;

    /**
     * @brief Write all of @p data.
     * @throws transport_error on failure (peer gone, timeout, TLS error).
     */
    virtual void write(std::string_view data) = 0;
    /**
     * @brief Read at most @p max bytes, blocking until at least one arrives.
     * @return The bytes read; an empty string means the peer closed.
     * @throws transport_error on failure.
     */
    virtual std::string read(size_t max) = 0;
    /// Close the underlying socket. Safe to call more than once.
    virtual void close() noexcept = 0;
};

/**
 * @class dialer
 * @brief Opens new connections for the connection manager.
 */
class dialer {
public:
    virtual ~dialer() = default;

    /**
     * @brief Establish a connection to @p host : @p port.
     * @param secure      Wrap the connection in TLS.
     * @param check_certs Verify the peer certificate and host name.
     * @throws transport_error if the connection cannot be established.
     */
    virtual std::unique_ptr<connection> dial(
        const std::string& host, int port, bool secure, bool check_certs
    ) = 0;
};

/**
 * @class curl_connection
 * @brief Connection backed by a libcurl easy handle in connect-only mode.
 *
 * Reads and writes go through `curl_easy_recv` / `curl_easy_send`, so TLS
 * is handled by whatever backend libcurl was built with. When libcurl
 * reports `CURLE_AGAIN` the socket is polled for readiness for at most
 * `timeout_ms`.
 */
class curl_connection final : public connection {
public:
    using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    curl_connection(curl_ptr handle, curl_socket_t socket, int timeout_ms);
    ~curl_connection() override;

    void write(std::string_view data) override;
    std::string read(size_t max) override;
    void close() noexcept override;

private:
    curl_ptr curl;
    curl_socket_t socket;
    int timeout_ms;
};

/**
 * @class curl_dialer
 * @brief Default dialer: TCP/TLS connections established by libcurl.
 */
class curl_dialer final : public dialer {
public:
    /**
     * @param connect_timeout_ms Limit for TCP connect plus TLS handshake.
     * @param io_timeout_ms      Per-operation limit for the connections
     *                           produced by this dialer.
     */
    curl_dialer(int connect_timeout_ms, int io_timeout_ms);

    std::unique_ptr<connection> dial(
        const std::string& host, int port, bool secure, bool check_certs
    ) override;

private:
    int connect_timeout_ms;
    int io_timeout_ms;
};
}
#endif // IRIS_TRANSPORT_HPP

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

#ifndef IRIS_RESPONSE_HPP
#define IRIS_RESPONSE_HPP
#include "manager.hpp"
#include "wire_codec.hpp"

namespace irisspace {
/**
 * @class body_reader
 * @brief Lazy, single-consumer, forward-only response body.
 *
 * The reader owns the lease of the connection the body arrives on. The
 * lease is disposed of exactly once:
 *  - as `reuse` when the body was read to its end and the framing allows
 *    another exchange on the connection,
 *  - as `discard` when the body is closed (or the reader destroyed) before
 *    its end, when reading fails, or when the connection cannot be reused.
 *
 * No lock is held between two calls to `next_chunk()`.
 */
class body_reader final {
public:
    body_reader() = default;
    body_reader(
        lease held, std::unique_ptr<byte_source> source,
        std::unique_ptr<body_decoder> decoder
    );
    ~body_reader();

    body_reader(body_reader&&) noexcept = default;
    body_reader& operator=(body_reader&& other) noexcept;
    body_reader(const body_reader&) = delete;
    body_reader& operator=(const body_reader&) = delete;

    /**
     * @brief Pull the next chunk of the body.
     * @return Body bytes, or `std::nullopt` at the end (and on every call
     *         after the reader was closed).
     * @throws corespace::transport_error, corespace::protocol_parse_error;
     *         the connection has been discarded when either escapes.
     */
    std::optional<std::string> next_chunk();

    /// Abandon the rest of the body. Idempotent.
    void close() noexcept;

    /**
     * @brief Read and drop the rest of the body, at most @p limit bytes.
     * @return true if the end was reached, false if the body was larger and
     *         has been closed instead.
     */
    bool drain(size_t limit);

    /// Whether the reader still holds its connection.
    [[nodiscard]] bool is_open() const noexcept {
        return static_cast<bool>(held);
    }

private:
    void finish(disposition how) noexcept;

    lease held;
    std::unique_ptr<byte_source> source;
    std::unique_ptr<body_decoder> decoder;
};

/**
 * @struct streaming_response
 * @brief Response whose body is still on the wire.
 */
struct streaming_response {
    int status_code = 0; ///< HTTP status code (e.g., 200, 404).
    std::string reason; ///< Reason phrase from the status line.
    std::string version; ///< Protocol version from the status line.
    corespace::header_list header; ///< Response headers, in wire order.
    std::string url; ///< Target that produced this response.
    body_reader body; ///< Lazily consumed body bound to the connection.
};

/**
 * @struct http_response
 * @brief Response with the body fully read into memory.
 */
struct http_response {
    int status_code = 0; ///< HTTP status code (e.g., 200, 404).
    std::string reason; ///< Reason phrase from the status line.
    corespace::header_list header; ///< Response headers, in wire order.
    std::string url; ///< Target that produced this response.
    std::string text; ///< Complete response body.
};

/**
 * @brief Read the whole body of @p response into memory.
 *
 * The connection is returned to its pool (or closed) once the body ended.
 */
http_response lbs_response(streaming_response&& response);
}
#endif // IRIS_RESPONSE_HPP

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

#ifndef IRIS_WIRE_CODEC_HPP
#define IRIS_WIRE_CODEC_HPP
#include "request.hpp"
#include "transport.hpp"

namespace irisspace {
/**
 * @class byte_source
 * @brief Buffered reader over a connection.
 *
 * Bytes read from the connection but not yet consumed stay in the buffer,
 * so header parsing and body framing can share one source without losing
 * data at their boundary.
 */
class byte_source final {
public:
    explicit byte_source(corespace::connection& conn);

    /**
     * @brief Read one line, stripping the trailing CRLF (or bare LF).
     * @param limit Maximum line length accepted.
     * @return The line, or `std::nullopt` if the stream ended before any
     *         byte of the line arrived.
     * @throws corespace::protocol_parse_error if the line is too long or the
     *         stream ends inside it.
     */
    std::optional<std::string> read_line(size_t limit);

    /**
     * @brief Return between 1 and @p max bytes; empty at end of stream.
     */
    std::string read_some(size_t max);

private:
    bool fill();

    corespace::connection* conn;
    std::string buffer;
    size_t offset = 0;
};

/// @brief Status line and header block of a response.
struct response_head {
    std::string version; ///< e.g. "HTTP/1.1".
    int status_code = 0;
    std::string reason;
    corespace::header_list header;
};

/**
 * @class body_decoder
 * @brief Lazily de-frames (and optionally inflates) a response body.
 */
class body_decoder {
public:
    virtual ~body_decoder() = default;

    /**
     * @brief Next chunk of body bytes; `std::nullopt` once the body ended.
     * @throws corespace::protocol_parse_error on malformed framing.
     * @throws corespace::transport_error on read failure.
     */
    virtual std::optional<std::string> next() = 0;

    /**
     * @brief Whether the connection can carry another exchange.
     *
     * Meaningful only after `next()` returned `std::nullopt`.
     */
    [[nodiscard]] virtual bool reusable() const = 0;
};

/**
 * @brief Serialize @p req into a producer of outbound bytes.
 *
 * The first chunk holds the request line and the header block, including
 * the computed `Host` and `Content-Length` headers; the following chunks are
 * body bytes. Streaming bodies are pulled from a new producer for every call
 * and are never buffered as a whole.
 *
 * @throws std::invalid_argument if `req.headers` sets `Host` or
 *         `Content-Length`. The returned producer throws it when a streaming
 *         body yields more or fewer bytes than its declared length.
 */
chunk_producer serialize(const request& req);

/**
 * @brief Parse a header block up to and including the empty line.
 *
 * Obsolete line folding is joined into the previous value.
 *
 * @throws corespace::protocol_parse_error on malformed lines, an oversized
 *         block or end of stream.
 */
corespace::header_list read_headers(byte_source& source);

/**
 * @brief Read the status line and header block of the final response head.
 *
 * Interim 1xx responses (except 101) are skipped, up to a fixed number
 * of them.
 *
 * @throws corespace::protocol_parse_error on malformed input or if the
 *         stream ends before the header block is complete.
 */
response_head parse_response_head(byte_source& source);

/**
 * @brief Choose the body framing for a parsed head.
 *
 * Framing, in order: no body (HEAD request, 1xx/204/304), chunked,
 * `Content-Length`, read until close. Compressed bodies are inflated when
 * `req.decompress` accepts the response `Content-Type` and `req.raw_body`
 * is not set.
 *
 * The decoder reads through @p source, which must outlive it.
 */
std::unique_ptr<body_decoder> make_body_decoder(
    const request& req, const response_head& head, byte_source& source
);
}
#endif // IRIS_WIRE_CODEC_HPP

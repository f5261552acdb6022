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

#include "wire_codec.hpp"

#include <algorithm>
#include <charconv>
#include <spdlog/spdlog.h>
#include <zlib.h>

namespace irisspace {
using corespace::protocol_parse_error;

namespace {
    constexpr size_t read_block = 16384;
    constexpr size_t max_line = 8192;
    constexpr size_t max_header_count = 100;
    constexpr size_t max_interim_heads = 16;

    bool is_default_port(const request& req) {
        return req.port == (req.secure ? 443 : 80);
    }

    std::string request_target(const request& req) {
        if (req.proxy) {
            return req.url();
        }
        std::string target = req.path.empty() ? "/" : req.path;
        if (!req.query.empty()) {
            target += "?" + req.query;
        }
        return target;
    }

    std::uint64_t parse_content_length(const std::string& value) {
        const auto text = corespace::trim(value);
        std::uint64_t length = 0;
        const auto [end, ec]
            = std::from_chars(text.data(), text.data() + text.size(), length);
        if (text.empty() || ec != std::errc {}
            || end != text.data() + text.size()) {
            throw protocol_parse_error("invalid Content-Length: " + value);
        }
        return length;
    }

    std::uint64_t parse_chunk_size(const std::string& line) {
        const auto text
            = corespace::trim(std::string_view(line).substr(0, line.find(';')));
        std::uint64_t size = 0;
        const auto [end, ec] = std::from_chars(
            text.data(), text.data() + text.size(), size, 16
        );
        if (text.empty() || ec != std::errc {}
            || end != text.data() + text.size()) {
            throw protocol_parse_error("invalid chunk size line: " + line);
        }
        return size;
    }

    class empty_decoder final : public body_decoder {
    public:
        explicit empty_decoder(const bool persistent)
            : persistent(persistent) { }

        std::optional<std::string> next() override { return std::nullopt; }
        [[nodiscard]] bool reusable() const override { return persistent; }

    private:
        bool persistent;
    };

    class length_decoder final : public body_decoder {
    public:
        length_decoder(
            byte_source& source, const std::uint64_t length,
            const bool persistent
        )
            : source(source)
            , remaining(length)
            , persistent(persistent) { }

        std::optional<std::string> next() override {
            if (remaining == 0) {
                return std::nullopt;
            }
            auto data = source.read_some(
                static_cast<size_t>(std::min<std::uint64_t>(remaining, read_block))
            );
            if (data.empty()) {
                throw protocol_parse_error(
                    "connection closed with " + std::to_string(remaining)
                    + " body bytes outstanding"
                );
            }
            remaining -= data.size();
            return data;
        }

        [[nodiscard]] bool reusable() const override {
            return persistent && remaining == 0;
        }

    private:
        byte_source& source;
        std::uint64_t remaining;
        bool persistent;
    };

    class until_close_decoder final : public body_decoder {
    public:
        explicit until_close_decoder(byte_source& source)
            : source(source) { }

        std::optional<std::string> next() override {
            auto data = source.read_some(read_block);
            if (data.empty()) {
                return std::nullopt;
            }
            return data;
        }

        // The end of the body is the end of the connection.
        [[nodiscard]] bool reusable() const override { return false; }

    private:
        byte_source& source;
    };

    /**
     * Removes chunked transfer framing. With `raw` set the framing bytes
     * are passed through unchanged while the end of the body is still
     * tracked.
     */
    class chunked_decoder final : public body_decoder {
    public:
        chunked_decoder(byte_source& source, const bool raw, const bool persistent)
            : source(source)
            , raw(raw)
            , persistent(persistent) { }

        std::optional<std::string> next() override {
            while (!done) {
                if (remaining == 0) {
                    auto line = required_line("chunk size");
                    const auto size = parse_chunk_size(line);
                    if (size == 0) {
                        return last_chunk(std::move(line));
                    }
                    remaining = size;
                    if (raw) {
                        return line + "\r\n";
                    }
                    continue;
                }
                auto data = source.read_some(static_cast<size_t>(
                    std::min<std::uint64_t>(remaining, read_block)
                ));
                if (data.empty()) {
                    throw protocol_parse_error(
                        "connection closed inside a chunk"
                    );
                }
                remaining -= data.size();
                if (remaining == 0) {
                    if (!required_line("chunk terminator").empty()) {
                        throw protocol_parse_error(
                            "missing CRLF after chunk data"
                        );
                    }
                    if (raw) {
                        data += "\r\n";
                    }
                }
                return data;
            }
            return std::nullopt;
        }

        [[nodiscard]] bool reusable() const override {
            return persistent && done;
        }

    private:
        std::string required_line(const char* what) {
            auto line = source.read_line(max_line);
            if (!line) {
                throw protocol_parse_error(
                    std::string("connection closed before ") + what
                );
            }
            return std::move(*line);
        }

        std::optional<std::string> last_chunk(std::string size_line) {
            std::string framing = size_line + "\r\n";
            for (;;) {
                auto trailer = required_line("end of trailers");
                if (trailer.empty()) {
                    break;
                }
                framing += trailer + "\r\n";
            }
            framing += "\r\n";
            done = true;
            if (raw) {
                return framing;
            }
            return std::nullopt;
        }

        byte_source& source;
        bool raw;
        bool persistent;
        std::uint64_t remaining = 0;
        bool done = false;
    };

    /// Inflates gzip or zlib-wrapped deflate data produced by another decoder.
    class inflate_decoder final : public body_decoder {
    public:
        explicit inflate_decoder(std::unique_ptr<body_decoder> inner)
            : inner(std::move(inner)) {
            // 32 + MAX_WBITS: detect gzip or zlib header automatically
            if (inflateInit2(&stream, 32 + MAX_WBITS) != Z_OK) {
                throw std::runtime_error("inflateInit2 failed");
            }
        }

        ~inflate_decoder() override { inflateEnd(&stream); }

        inflate_decoder(const inflate_decoder&) = delete;
        inflate_decoder& operator=(const inflate_decoder&) = delete;

        std::optional<std::string> next() override {
            while (!finished) {
                // A full output block may leave inflated bytes inside zlib.
                if (stream.avail_in == 0 && !pending) {
                    auto chunk = inner->next();
                    if (!chunk) {
                        inner_done = true;
                        if (started) {
                            throw protocol_parse_error(
                                "compressed body ended prematurely"
                            );
                        }
                        finished = true;
                        break;
                    }
                    started = true;
                    input = std::move(*chunk);
                    stream.next_in = reinterpret_cast<Bytef*>(input.data());
                    stream.avail_in = static_cast<uInt>(input.size());
                }

                std::string output(read_block, '\0');
                stream.next_out = reinterpret_cast<Bytef*>(output.data());
                stream.avail_out = static_cast<uInt>(output.size());
                const int ret = inflate(&stream, Z_NO_FLUSH);
                if (ret == Z_STREAM_END) {
                    finished = true;
                } else if (ret != Z_OK && ret != Z_BUF_ERROR) {
                    spdlog::warn(
                        "zlib inflate error {}: {}", ret,
                        stream.msg ? stream.msg : "unknown"
                    );
                    throw protocol_parse_error("invalid compressed body");
                }
                pending = stream.avail_out == 0;
                output.resize(output.size() - stream.avail_out);
                if (!output.empty()) {
                    return output;
                }
            }
            // Consume whatever framing is left so the connection ends in a
            // known position.
            while (!inner_done) {
                inner_done = !inner->next();
            }
            return std::nullopt;
        }

        [[nodiscard]] bool reusable() const override {
            return inner->reusable();
        }

    private:
        std::unique_ptr<body_decoder> inner;
        z_stream stream {};
        std::string input;
        bool started = false;
        bool finished = false;
        bool pending = false;
        bool inner_done = false;
    };

    bool compressed(const corespace::header_list& header) {
        const auto encoding = corespace::find_header(header, "Content-Encoding");
        if (!encoding) {
            return false;
        }
        const auto value = corespace::to_lower(corespace::trim(*encoding));
        return value == "gzip" || value == "x-gzip" || value == "deflate";
    }
}

byte_source::byte_source(corespace::connection& conn)
    : conn(&conn) { }

bool byte_source::fill() {
    if (offset > 0) {
        buffer.erase(0, offset);
        offset = 0;
    }
    auto data = conn->read(read_block);
    if (data.empty()) {
        return false;
    }
    buffer += data;
    return true;
}

std::optional<std::string> byte_source::read_line(const size_t limit) {
    size_t scanned = offset;
    for (;;) {
        if (const auto lf = buffer.find('\n', scanned);
            lf != std::string::npos) {
            std::string line = buffer.substr(offset, lf - offset);
            offset = lf + 1;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.size() > limit) {
                throw protocol_parse_error("line exceeds length limit");
            }
            return line;
        }
        if (buffer.size() - offset > limit + 1) {
            throw protocol_parse_error("line exceeds length limit");
        }
        const size_t pending = buffer.size() - offset;
        if (!fill()) {
            if (pending == 0) {
                return std::nullopt;
            }
            throw protocol_parse_error("connection closed inside a line");
        }
        scanned = pending;
    }
}

std::string byte_source::read_some(const size_t max) {
    if (offset == buffer.size() && !fill()) {
        return {};
    }
    const size_t n = std::min(max, buffer.size() - offset);
    std::string data = buffer.substr(offset, n);
    offset += n;
    return data;
}

chunk_producer serialize(const request& req) {
    if (corespace::has_header(req.headers, "Host")) {
        throw std::invalid_argument(
            "Host header is computed from the request target"
        );
    }
    if (corespace::has_header(req.headers, "Content-Length")) {
        throw std::invalid_argument(
            "Content-Length header is computed from the request body"
        );
    }

    std::string head = req.method + " " + request_target(req) + " HTTP/1.1\r\n";
    head += "Host: " + req.host;
    if (!is_default_port(req)) {
        head += ":" + std::to_string(req.port);
    }
    head += "\r\n";
    if (const auto length = req.body.content_length()) {
        head += "Content-Length: " + std::to_string(*length) + "\r\n";
    }
    for (const auto& [name, value] : req.headers) {
        head += name + ": " + value + "\r\n";
    }
    head += "\r\n";

    chunk_producer body;
    switch (req.body.type) {
    case request_body::kind::none:
        break;
    case request_body::kind::bytes:
        body = [bytes = req.body.bytes,
                sent = false]() mutable -> std::optional<std::string> {
            if (sent || bytes.empty()) {
                return std::nullopt;
            }
            sent = true;
            return std::move(bytes);
        };
        break;
    case request_body::kind::stream:
        if (!req.body.stream) {
            throw std::invalid_argument("streaming body without a producer");
        }
        body = [produce = req.body.stream(), declared = req.body.length,
                sent = std::uint64_t { 0 }]() mutable
            -> std::optional<std::string> {
            std::optional<std::string> chunk;
            if (produce) {
                chunk = produce();
            }
            if (!chunk) {
                if (sent != declared) {
                    throw std::invalid_argument(
                        "streaming body ended after " + std::to_string(sent)
                        + " of " + std::to_string(declared) + " bytes"
                    );
                }
                return std::nullopt;
            }
            sent += chunk->size();
            if (sent > declared) {
                throw std::invalid_argument(
                    "streaming body exceeds its declared length of "
                    + std::to_string(declared) + " bytes"
                );
            }
            return chunk;
        };
        break;
    }

    return [head = std::move(head), body = std::move(body),
            head_sent = false]() mutable -> std::optional<std::string> {
        if (!head_sent) {
            head_sent = true;
            return std::move(head);
        }
        if (!body) {
            return std::nullopt;
        }
        return body();
    };
}

corespace::header_list read_headers(byte_source& source) {
    corespace::header_list header;
    for (;;) {
        auto line = source.read_line(max_line);
        if (!line) {
            throw protocol_parse_error("connection closed inside header block");
        }
        if (line->empty()) {
            return header;
        }
        if (line->front() == ' ' || line->front() == '\t') {
            if (header.empty()) {
                throw protocol_parse_error("continuation line without header");
            }
            header.back().second += " ";
            header.back().second += corespace::trim(*line);
            continue;
        }
        const auto colon = line->find(':');
        if (colon == std::string::npos || colon == 0) {
            throw protocol_parse_error("malformed header line: " + *line);
        }
        std::string name = line->substr(0, colon);
        if (name.find_first_of(" \t") != std::string::npos) {
            throw protocol_parse_error("whitespace in header name: " + name);
        }
        if (header.size() == max_header_count) {
            throw protocol_parse_error("too many header fields");
        }
        header.emplace_back(
            std::move(name),
            std::string(corespace::trim(std::string_view(*line).substr(colon + 1)))
        );
    }
}

response_head parse_response_head(byte_source& source) {
    for (size_t interim = 0;; ++interim) {
        if (interim == max_interim_heads) {
            throw protocol_parse_error("too many interim responses");
        }
        auto line = source.read_line(max_line);
        if (!line) {
            throw protocol_parse_error("connection closed before status line");
        }

        response_head head;
        const std::string_view text { *line };
        const auto first_space = text.find(' ');
        if (!text.starts_with("HTTP/") || first_space == std::string_view::npos) {
            throw protocol_parse_error("malformed status line: " + *line);
        }
        head.version = std::string(text.substr(0, first_space));

        const auto rest = text.substr(first_space + 1);
        const auto code = rest.substr(0, rest.find(' '));
        const auto [end, ec] = std::from_chars(
            code.data(), code.data() + code.size(), head.status_code
        );
        if (code.size() != 3
            || !std::ranges::all_of(
                code, [](const char c) { return c >= '0' && c <= '9'; }
            )
            || ec != std::errc {}
            || end != code.data() + code.size()) {
            throw protocol_parse_error("malformed status code: " + *line);
        }
        if (rest.size() > 4) {
            head.reason = std::string(rest.substr(4));
        }
        head.header = read_headers(source);

        if (head.status_code >= 100 && head.status_code < 200
            && head.status_code != 101) {
            spdlog::debug("skipping interim response {}", head.status_code);
            continue;
        }
        return head;
    }
}

std::unique_ptr<body_decoder> make_body_decoder(
    const request& req, const response_head& head, byte_source& source
) {
    const bool persistent = head.version == "HTTP/1.0"
        ? corespace::header_has_token(head.header, "Connection", "keep-alive")
        : !corespace::header_has_token(head.header, "Connection", "close");

    if (corespace::iequals(req.method, "HEAD")
        || (head.status_code >= 100 && head.status_code < 200)
        || head.status_code == 204 || head.status_code == 304) {
        return std::make_unique<empty_decoder>(persistent);
    }

    std::unique_ptr<body_decoder> framing;
    if (corespace::header_has_token(head.header, "Transfer-Encoding", "chunked")) {
        framing
            = std::make_unique<chunked_decoder>(source, req.raw_body, persistent);
    } else if (const auto lengths
               = corespace::find_headers(head.header, "Content-Length");
               !lengths.empty()) {
        const auto length = parse_content_length(lengths.front());
        for (const auto& other : lengths) {
            if (parse_content_length(other) != length) {
                throw protocol_parse_error("conflicting Content-Length headers");
            }
        }
        framing = std::make_unique<length_decoder>(source, length, persistent);
    } else {
        framing = std::make_unique<until_close_decoder>(source);
    }

    if (!req.raw_body && compressed(head.header)) {
        const auto content_type
            = corespace::find_header(head.header, "Content-Type")
                  .value_or(std::string {});
        const auto media_type = corespace::trim(
            std::string_view(content_type).substr(0, content_type.find(';'))
        );
        if (req.decompress && req.decompress(media_type)) {
            return std::make_unique<inflate_decoder>(std::move(framing));
        }
    }
    return framing;
}
}

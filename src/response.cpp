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

#include "response.hpp"

namespace irisspace {
body_reader::body_reader(
    lease held, std::unique_ptr<byte_source> source,
    std::unique_ptr<body_decoder> decoder
)
    : held(std::move(held))
    , source(std::move(source))
    , decoder(std::move(decoder)) { }

body_reader::~body_reader() { close(); }

body_reader& body_reader::operator=(body_reader&& other) noexcept {
    if (this != &other) {
        close();
        held = std::move(other.held);
        source = std::move(other.source);
        decoder = std::move(other.decoder);
    }
    return *this;
}

std::optional<std::string> body_reader::next_chunk() {
    if (!held) {
        return std::nullopt;
    }
    std::optional<std::string> chunk;
    try {
        chunk = decoder->next();
    } catch (...) {
        finish(disposition::discard);
        throw;
    }
    if (!chunk) {
        finish(
            decoder->reusable() ? disposition::reuse : disposition::discard
        );
    }
    return chunk;
}

void body_reader::close() noexcept {
    if (held) {
        finish(disposition::discard);
    }
}

bool body_reader::drain(const size_t limit) {
    size_t skipped = 0;
    while (const auto chunk = next_chunk()) {
        skipped += chunk->size();
        if (skipped > limit) {
            close();
            return false;
        }
    }
    return true;
}

void body_reader::finish(const disposition how) noexcept {
    // The decoder and source point into the connection; drop them before the
    // connection changes hands.
    decoder.reset();
    source.reset();
    if (held) {
        lease done = std::move(held);
        done.release(how);
    }
}

http_response lbs_response(streaming_response&& response) {
    http_response buffered {
        .status_code = response.status_code,
        .reason = std::move(response.reason),
        .header = std::move(response.header),
        .url = std::move(response.url),
        .text = {},
    };
    while (auto chunk = response.body.next_chunk()) {
        buffered.text += *chunk;
    }
    return buffered;
}
}

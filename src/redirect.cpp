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

#include "redirect.hpp"

namespace irisspace {
std::optional<request> next_hop(
    const int status_code, const corespace::header_list& header,
    const request& current
) {
    if (status_code < 300 || status_code >= 400) {
        return std::nullopt;
    }
    const auto location = corespace::find_header(header, "Location");
    if (!location) {
        return std::nullopt;
    }

    const std::string target { corespace::trim(*location) };
    request next;
    if (target.starts_with('/')) {
        const std::string origin = std::string(current.secure ? "https" : "http")
            + "://" + current.host + ":" + std::to_string(current.port);
        next = parse_url(origin + target, current);
    } else {
        next = parse_url(target, current);
    }

    if (status_code == 302 || status_code == 303) {
        next.method = "GET";
    }
    return next;
}
}

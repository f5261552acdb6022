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

#include "errors.hpp"

namespace corespace {
invalid_url::invalid_url(std::string url, std::string reason)
    : http_exception("invalid url '" + url + "': " + reason)
    , target(std::move(url))
    , why(std::move(reason)) { }

too_many_redirects::too_many_redirects(std::string url)
    : http_exception("too many redirects, last target: " + url)
    , target(std::move(url)) { }

status_rejected::status_rejected(
    const int status_code, std::string reason, header_list header,
    std::string url
)
    : http_exception(
          "http error: " + std::to_string(status_code) + " " + reason + " ("
          + url + ")"
      )
    , code(status_code)
    , phrase(std::move(reason))
    , fields(std::move(header))
    , target(std::move(url)) { }
}

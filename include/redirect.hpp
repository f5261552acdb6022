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

#ifndef IRIS_REDIRECT_HPP
#define IRIS_REDIRECT_HPP
#include "request.hpp"

namespace irisspace {
/**
 * @brief Decide whether a response redirects, and where to.
 *
 * Rules:
 *  - Only 3xx statuses carrying a `Location` header redirect.
 *  - A location starting with '/' is resolved against the scheme, host and
 *    port of @p current; anything else must be an absolute URL.
 *  - 302 and 303 switch the method to GET (what browsers do, even though
 *    302 nominally keeps it). Other codes keep the method of the resolved
 *    target, which starts out as the method of @p current.
 *  - Headers, body and policy fields are inherited from @p current.
 *
 * @return The next request, or `std::nullopt` to stop.
 * @throws corespace::invalid_url if the location cannot be parsed.
 */
std::optional<request> next_hop(
    int status_code, const corespace::header_list& header,
    const request& current
);
}
#endif // IRIS_REDIRECT_HPP

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

#ifndef IRIS_ERRORS_HPP
#define IRIS_ERRORS_HPP
#include "utils.hpp"

#include <stdexcept>

namespace corespace {
/**
 * @class http_exception
 * @brief Base of every error raised by an HTTP exchange.
 *
 * Caller mistakes (malformed descriptors, double release of a lease) are
 * reported with the standard `std::invalid_argument` / `std::logic_error`
 * instead; this hierarchy covers what can go wrong on the wire.
 */
class http_exception : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class invalid_url
 * @brief A URL could not be turned into a request target.
 */
class invalid_url final : public http_exception {
public:
    invalid_url(std::string url, std::string reason);

    [[nodiscard]] const std::string& url() const noexcept { return target; }
    [[nodiscard]] const std::string& reason() const noexcept { return why; }

private:
    std::string target;
    std::string why;
};

/**
 * @class transport_error
 * @brief Dial, read or write failure at the byte level.
 */
class transport_error final : public http_exception {
public:
    using http_exception::http_exception;
};

/**
 * @class protocol_parse_error
 * @brief The peer sent a malformed status line, header block or framing.
 */
class protocol_parse_error final : public http_exception {
public:
    using http_exception::http_exception;
};

/**
 * @class too_many_redirects
 * @brief The redirect budget ran out while the server still redirected.
 */
class too_many_redirects final : public http_exception {
public:
    /// @param url Target of the last request made (the one that redirected).
    explicit too_many_redirects(std::string url);

    [[nodiscard]] const std::string& url() const noexcept { return target; }

private:
    std::string target;
};

/**
 * @class status_rejected
 * @brief The final response failed the request's status check.
 *
 * Carries the full response metadata so the failure can be diagnosed
 * without replaying the request. The body is closed before this is thrown.
 */
class status_rejected final : public http_exception {
public:
    status_rejected(
        int status_code, std::string reason, header_list header,
        std::string url
    );

    [[nodiscard]] int status_code() const noexcept { return code; }
    [[nodiscard]] const std::string& reason() const noexcept { return phrase; }
    [[nodiscard]] const header_list& header() const noexcept { return fields; }
    [[nodiscard]] const std::string& url() const noexcept { return target; }

private:
    int code;
    std::string phrase;
    header_list fields;
    std::string target;
};
}
#endif // IRIS_ERRORS_HPP

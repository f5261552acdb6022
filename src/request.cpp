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

#include "request.hpp"
#include "transport.hpp"

namespace irisspace {
namespace {
    using curl_url_ptr = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

    std::string url_part(
        CURLU* const handle, const CURLUPart part, const unsigned flags,
        const std::string& url
    ) {
        char* value = nullptr;
        const CURLUcode rc = curl_url_get(handle, part, &value, flags);
        if (rc == CURLUE_NO_QUERY || rc == CURLUE_NO_PORT) {
            return {};
        }
        if (rc != CURLUE_OK) {
            throw corespace::invalid_url(url, curl_url_strerror(rc));
        }
        std::string result(value);
        curl_free(value);
        return result;
    }
}

request_body request_body::from_bytes(std::string data) {
    request_body body;
    body.type = kind::bytes;
    body.bytes = std::move(data);
    return body;
}

request_body request_body::from_stream(
    const std::uint64_t length, std::function<chunk_producer()> stream
) {
    request_body body;
    body.type = kind::stream;
    body.length = length;
    body.stream = std::move(stream);
    return body;
}

std::optional<std::uint64_t> request_body::content_length() const {
    switch (type) {
    case kind::none:
        return std::nullopt;
    case kind::bytes:
        return bytes.size();
    case kind::stream:
        return length;
    }
    return std::nullopt;
}

bool default_check_status(
    const int status_code, const corespace::header_list& /*header*/
) {
    return status_code >= 200 && status_code < 400;
}

bool browser_decompress(const std::string_view content_type) {
    return content_type != "application/x-tar";
}

bool always_decompress(std::string_view) { return true; }

bool never_decompress(std::string_view) { return false; }

std::string to_string(const connection_key& key) {
    std::string out = std::string(key.secure ? "https" : "http") + "://"
        + key.host + ":" + std::to_string(key.port);
    if (key.proxy) {
        out += " via " + key.proxy->host + ":"
            + std::to_string(key.proxy->port);
    }
    return out;
}

connection_key request::key() const {
    return connection_key { .host = host,
                            .port = port,
                            .secure = secure,
                            .proxy = proxy };
}

std::string request::url() const {
    std::string out = std::string(secure ? "https" : "http") + "://" + host
        + ":" + std::to_string(port) + (path.empty() ? "/" : path);
    if (!query.empty()) {
        out += "?" + query;
    }
    return out;
}

request parse_url(const std::string_view url) { return parse_url(url, {}); }

request parse_url(const std::string_view url, const request& base) {
    curl_url_ptr handle(curl_url(), &curl_url_cleanup);
    if (!handle) {
        throw std::runtime_error("curl_url failed");
    }

    const std::string url_copy(url);
    if (const CURLUcode rc
        = curl_url_set(handle.get(), CURLUPART_URL, url_copy.c_str(), 0);
        rc != CURLUE_OK) {
        throw corespace::invalid_url(url_copy, curl_url_strerror(rc));
    }

    const std::string scheme = corespace::to_lower(
        url_part(handle.get(), CURLUPART_SCHEME, 0, url_copy)
    );
    if (scheme != "http" && scheme != "https") {
        throw corespace::invalid_url(
            url_copy, "unsupported scheme '" + scheme + "'"
        );
    }

    request req = base;
    req.secure = scheme == "https";
    req.host = url_part(handle.get(), CURLUPART_HOST, 0, url_copy);
    const std::string port
        = url_part(handle.get(), CURLUPART_PORT, CURLU_DEFAULT_PORT, url_copy);
    req.port = port.empty() ? (req.secure ? 443 : 80) : std::stoi(port);
    req.path = url_part(handle.get(), CURLUPART_PATH, 0, url_copy);
    if (req.path.empty()) {
        req.path = "/";
    }
    req.query = url_part(handle.get(), CURLUPART_QUERY, 0, url_copy);
    return req;
}

request apply_basic_auth(
    const std::string_view user, const std::string_view password, request req
) {
    std::string credentials(user);
    credentials.push_back(':');
    credentials.append(password);
    req.headers.emplace_back(
        "Authorization", "Basic " + corespace::base64_encode(credentials)
    );
    return req;
}

request add_proxy(std::string host, const int port, request req) {
    req.proxy = proxy_address { .host = std::move(host), .port = port };
    return req;
}

request
url_encoded_body(const corespace::parameter_list& form, request req) {
    corespace::global_init();
    const std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(
        curl_easy_init(), &curl_easy_cleanup
    );
    if (!curl) {
        throw std::runtime_error("curl_easy_init failed");
    }

    std::string body;
    bool first = true;
    for (const auto& [key, value] : form) {
        char* ekey = curl_easy_escape(
            curl.get(), key.c_str(), static_cast<int>(key.size())
        );
        char* evalue = curl_easy_escape(
            curl.get(), value.data(), static_cast<int>(value.size())
        );
        if (!first) {
            body.push_back('&');
        }
        body.append(ekey ? ekey : "");
        body.push_back('=');
        body.append(evalue ? evalue : "");
        if (ekey) {
            curl_free(ekey);
        }
        if (evalue) {
            curl_free(evalue);
        }
        first = false;
    }

    req.method = "POST";
    req.body = request_body::from_bytes(std::move(body));
    req.headers.emplace_back(
        "Content-Type", "application/x-www-form-urlencoded"
    );
    return req;
}
}

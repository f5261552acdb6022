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

#include "utils.hpp"

#include <algorithm>

namespace corespace {

namespace {
    char lower(const char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }
}

bool iequals(const std::string_view lhs, const std::string_view rhs) {
    return std::ranges::equal(lhs, rhs, [](const char a, const char b) {
        return lower(a) == lower(b);
    });
}

std::optional<std::string>
find_header(const header_list& headers, const std::string_view name) {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::vector<std::string>
find_headers(const header_list& headers, const std::string_view name) {
    std::vector<std::string> values;
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            values.push_back(value);
        }
    }
    return values;
}

bool has_header(const header_list& headers, const std::string_view name) {
    return std::ranges::any_of(headers, [&](const auto& h) {
        return iequals(h.first, name);
    });
}

bool header_has_token(
    const header_list& headers, const std::string_view name,
    const std::string_view token
) {
    for (const auto& value : find_headers(headers, name)) {
        std::string_view rest { value };
        while (!rest.empty()) {
            const auto comma = rest.find(',');
            const auto item = trim(rest.substr(0, comma));
            if (iequals(item, token)) {
                return true;
            }
            if (comma == std::string_view::npos) {
                break;
            }
            rest.remove_prefix(comma + 1);
        }
    }
    return false;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

std::string to_lower(const std::string_view text) {
    std::string out(text);
    std::ranges::transform(out, out.begin(), lower);
    return out;
}

std::string base64_encode(const std::string_view data) {
    static constexpr char alphabet[]
        = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        const auto n = (static_cast<unsigned char>(data[i]) << 16)
            | (static_cast<unsigned char>(data[i + 1]) << 8)
            | static_cast<unsigned char>(data[i + 2]);
        out.push_back(alphabet[(n >> 18) & 0x3f]);
        out.push_back(alphabet[(n >> 12) & 0x3f]);
        out.push_back(alphabet[(n >> 6) & 0x3f]);
        out.push_back(alphabet[n & 0x3f]);
    }
    if (const size_t rest = data.size() - i; rest > 0) {
        unsigned n = static_cast<unsigned char>(data[i]) << 16;
        if (rest == 2) {
            n |= static_cast<unsigned char>(data[i + 1]) << 8;
        }
        out.push_back(alphabet[(n >> 18) & 0x3f]);
        out.push_back(alphabet[(n >> 12) & 0x3f]);
        out.push_back(rest == 2 ? alphabet[(n >> 6) & 0x3f] : '=');
        out.push_back('=');
    }
    return out;
}

network_metrics::network_metrics() {
    for (auto& status : statuses) {
        status.store(0, std::memory_order_relaxed);
    }
}
}

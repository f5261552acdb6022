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

#include "manager.hpp"

#include <spdlog/spdlog.h>

namespace irisspace {
lease::lease(
    std::weak_ptr<pool_state> pool, connection_key bucket,
    std::unique_ptr<corespace::connection> conn, const provenance tag
)
    : pool(std::move(pool))
    , bucket(std::move(bucket))
    , conn(std::move(conn))
    , tag(tag) { }

lease::~lease() {
    if (conn) {
        spdlog::debug(
            "lease for {} dropped without a disposition, discarding",
            to_string(bucket)
        );
        dispose(disposition::discard);
    }
}

lease::lease(lease&& other) noexcept
    : pool(std::move(other.pool))
    , bucket(std::move(other.bucket))
    , conn(std::move(other.conn))
    , tag(other.tag) { }

lease& lease::operator=(lease&& other) noexcept {
    if (this != &other) {
        if (conn) {
            dispose(disposition::discard);
        }
        pool = std::move(other.pool);
        bucket = std::move(other.bucket);
        conn = std::move(other.conn);
        tag = other.tag;
    }
    return *this;
}

void lease::release(const disposition how) {
    if (!conn) {
        throw std::logic_error("lease has already been released");
    }
    dispose(how);
}

corespace::connection& lease::get() const { return *conn; }

void lease::dispose(const disposition how) noexcept {
    auto held = std::move(conn);
    if (const auto state = pool.lock()) {
        state->put(bucket, std::move(held), how);
    } else {
        held->close();
    }
}

pool_state::pool_state(corespace::manager_settings settings)
    : settings(settings) { }

void pool_state::put(
    const connection_key& key, std::unique_ptr<corespace::connection> conn,
    const disposition how
) noexcept {
    if (how == disposition::reuse) {
        std::unique_lock lk(mu);
        if (!shut_down) {
            auto& bucket = idle[key];
            if (bucket.size() < settings.connection_count) {
                bucket.push_back(std::move(conn));
                const auto parked = bucket.size();
                lk.unlock();
                spdlog::debug(
                    "returned connection to pool for {} (idle: {})",
                    to_string(key), parked
                );
                return;
            }
        }
        lk.unlock();
        spdlog::debug("pool for {} is full, closing connection", to_string(key));
    }
    conn->close();
}

manager::manager(corespace::manager_settings settings)
    : manager(
          settings,
          std::make_shared<corespace::curl_dialer>(
              settings.connect_timeout_ms, settings.io_timeout_ms
          )
      ) { }

manager::manager(
    corespace::manager_settings settings,
    std::shared_ptr<corespace::dialer> transport
)
    : state(std::make_shared<pool_state>(settings))
    , transport(std::move(transport)) { }

manager::~manager() { shutdown(); }

lease manager::acquire(const connection_key& key, const bool allow_reuse) {
    {
        std::unique_lock lk(state->mu);
        if (state->shut_down) {
            throw std::logic_error("connection manager is shut down");
        }
        if (allow_reuse) {
            if (const auto it = state->idle.find(key);
                it != state->idle.end() && !it->second.empty()) {
                auto conn = std::move(it->second.back());
                it->second.pop_back();
                if (it->second.empty()) {
                    state->idle.erase(it);
                }
                lk.unlock();
                spdlog::debug("reusing pooled connection for {}", to_string(key));
                return lease(state, key, std::move(conn), provenance::reused);
            }
        }
    }

    const auto& host = key.proxy ? key.proxy->host : key.host;
    const int port = key.proxy ? key.proxy->port : key.port;
    spdlog::debug("dialing new connection for {}", to_string(key));
    auto conn
        = transport->dial(host, port, key.secure, state->settings.check_certs);
    return lease(state, key, std::move(conn), provenance::fresh);
}

void manager::release(lease&& held, const disposition how) {
    lease owned = std::move(held);
    owned.release(how);
}

void manager::shutdown() noexcept {
    decltype(state->idle) closing;
    {
        std::lock_guard lk(state->mu);
        state->shut_down = true;
        closing.swap(state->idle);
    }
    size_t closed = 0;
    for (auto& [key, bucket] : closing) {
        for (auto& conn : bucket) {
            conn->close();
            ++closed;
        }
    }
    if (closed > 0) {
        spdlog::debug("manager shut down, closed {} idle connections", closed);
    }
}

size_t manager::idle_count() const {
    std::lock_guard lk(state->mu);
    size_t total = 0;
    for (const auto& [key, bucket] : state->idle) {
        total += bucket.size();
    }
    return total;
}

size_t manager::idle_count(const connection_key& key) const {
    std::lock_guard lk(state->mu);
    const auto it = state->idle.find(key);
    return it == state->idle.end() ? 0 : it->second.size();
}

const corespace::manager_settings& manager::settings() const {
    return state->settings;
}
}

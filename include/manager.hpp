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

#ifndef IRIS_MANAGER_HPP
#define IRIS_MANAGER_HPP
#include "request.hpp"
#include "transport.hpp"

#include <map>
#include <mutex>

namespace irisspace {
/// @brief How a lease was obtained.
enum class provenance {
    fresh, ///< Dialed for this attempt.
    reused ///< Taken from the idle set after an earlier exchange.
};

/// @brief What happens to a connection when its lease is given back.
enum class disposition {
    reuse, ///< Return to the idle set of its key.
    discard ///< Close permanently.
};

struct pool_state;

/**
 * @class lease
 * @brief Exclusive, move-only handle to one established connection.
 *
 * Exactly one disposition is applied to every connection: either through
 * `release()` (directly or via `manager::release`) or, when the holder
 * drops the lease without deciding, as `discard` from the destructor.
 *
 * The lease refers to its pool weakly; if the manager is gone by the time
 * the lease is released, the connection is simply closed.
 */
class lease final {
public:
    lease() = default;
    ~lease();

    lease(lease&& other) noexcept;
    lease& operator=(lease&& other) noexcept;
    lease(const lease&) = delete;
    lease& operator=(const lease&) = delete;

    /**
     * @brief Hand the connection back with disposition @p how.
     * @throws std::logic_error if the lease holds no connection.
     */
    void release(disposition how);

    /// The leased connection. Must not be called on an empty lease.
    [[nodiscard]] corespace::connection& get() const;
    [[nodiscard]] provenance origin() const noexcept { return tag; }
    [[nodiscard]] const connection_key& key() const noexcept { return bucket; }
    explicit operator bool() const noexcept { return static_cast<bool>(conn); }

private:
    friend class manager;

    lease(
        std::weak_ptr<pool_state> pool, connection_key bucket,
        std::unique_ptr<corespace::connection> conn, provenance tag
    );

    void dispose(disposition how) noexcept;

    std::weak_ptr<pool_state> pool;
    connection_key bucket;
    std::unique_ptr<corespace::connection> conn;
    provenance tag = provenance::fresh;
};

/**
 * @class manager
 * @brief Keyed pool of idle connections shared by concurrent requests.
 *
 * Responsibilities:
 *  - Hand out a lease per attempt: an idle connection for the key when one
 *    exists (`provenance::reused`), otherwise a newly dialed one
 *    (`provenance::fresh`).
 *  - Take connections back and either park them (bounded by
 *    `manager_settings::connection_count` per key) or close them.
 *
 * Thread-safety:
 *  - `acquire`, `release` and `shutdown` are safe to call concurrently. The
 *    internal mutex is held only while the idle set is mutated; dialing and
 *    closing happen outside of it.
 */
class manager final {
public:
    /// Manager dialing through libcurl with @p settings.
    explicit manager(corespace::manager_settings settings = {});
    /// Manager dialing through a caller-provided transport.
    manager(
        corespace::manager_settings settings,
        std::shared_ptr<corespace::dialer> transport
    );
    /// Performs `shutdown()`.
    ~manager();

    manager(const manager&) = delete;
    manager& operator=(const manager&) = delete;

    /**
     * @brief Obtain a connection for @p key.
     *
     * @param key         Pool bucket.
     * @param allow_reuse When false, always dial a new connection.
     * @return A lease tagged with its provenance.
     * @throws corespace::transport_error if dialing fails.
     * @throws std::logic_error after `shutdown()`.
     */
    lease acquire(const connection_key& key, bool allow_reuse = true);

    /**
     * @brief Give a lease back with disposition @p how.
     * @throws std::logic_error if @p held was already released.
     */
    void release(lease&& held, disposition how);

    /// Close every idle connection. Leases still out close on release.
    void shutdown() noexcept;

    [[nodiscard]] size_t idle_count() const;
    [[nodiscard]] size_t idle_count(const connection_key& key) const;
    [[nodiscard]] const corespace::manager_settings& settings() const;

private:
    std::shared_ptr<pool_state> state;
    std::shared_ptr<corespace::dialer> transport;
};

/**
 * @struct pool_state
 * @brief Idle set shared between a manager and its outstanding leases.
 */
struct pool_state {
    explicit pool_state(corespace::manager_settings settings);

    /// Park or close @p conn according to @p how.
    void put(
        const connection_key& key, std::unique_ptr<corespace::connection> conn,
        disposition how
    ) noexcept;

    const corespace::manager_settings settings;
    mutable std::mutex mu;
    std::map<connection_key, std::vector<std::unique_ptr<corespace::connection>>>
        idle;
    bool shut_down = false;
};
}
#endif // IRIS_MANAGER_HPP

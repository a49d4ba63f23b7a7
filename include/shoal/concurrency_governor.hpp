#ifndef SHOAL_CONCURRENCY_GOVERNOR_HEADER
#define SHOAL_CONCURRENCY_GOVERNOR_HEADER

#include "settings.hpp"
#include "types.hpp"
#include "time.hpp"

#include <system_error>
#include <functional>
#include <cstdint>
#include <memory>
#include <deque>
#include <mutex>
#include <map>

#include <asio/io_context.hpp>

namespace shoal {

struct governor_stats
{
    int64_t num_acquires = 0;
    int64_t num_releases = 0;
    int64_t num_timeouts = 0;
    int num_in_use = 0;
    int num_waiting = 0;
    // The highest number of tickets ever held at once in total, and by any single
    // source.
    int peak_in_use = 0;
    int peak_in_use_per_source = 0;
};

namespace detail { struct governor_state; }

/**
 * The permission to run a single fetch from a source. It must be held for the entire
 * duration of the fetch, and it is released exactly once: either explicitly with
 * release(), or when the ticket is destroyed. Tickets are move-only.
 */
class admission_ticket
{
    friend struct detail::governor_state;

    std::shared_ptr<detail::governor_state> state_;
    source_id source_;

    admission_ticket(std::shared_ptr<detail::governor_state> state, source_id source)
        : state_(std::move(state))
        , source_(std::move(source))
    {}

public:

    // default constructed tickets are invalid
    admission_ticket() = default;
    admission_ticket(const admission_ticket&) = delete;
    admission_ticket& operator=(const admission_ticket&) = delete;
    admission_ticket(admission_ticket&& other) noexcept;
    admission_ticket& operator=(admission_ticket&& other) noexcept;
    ~admission_ticket();

    /** Gives back the capacity. Calling it more than once, or on an invalid ticket, is a no-op. */
    void release();

    bool is_valid() const noexcept { return state_ != nullptr; }
    explicit operator bool() const noexcept { return is_valid(); }

    const source_id& source() const noexcept { return source_; }
};

/**
 * Bounds the number of fetches in flight, globally and per source, across all
 * transfers. Every fetch acquires a ticket before contacting a peer.
 *
 * Requests that can't be granted immediately wait in a FIFO queue. When capacity is
 * released, the queue is traversed in order and every waiter whose source is not
 * saturated is granted, as long as there is global capacity. A waiter that isn't
 * granted within the admission timeout is failed with transfer_errc::capacity_timeout.
 *
 * All functions are thread-safe. Handlers are invoked without holding the governor's
 * mutex, either via the io_context (for immediate grants) or on the thread that
 * released the capacity or on which the timeout fired.
 */
class concurrency_governor
{
public:

    using acquire_handler = std::function<void(const std::error_code&, admission_ticket)>;

private:

    asio::io_context& ios_;
    // Tickets hold onto this, so it may outlive the governor.
    std::shared_ptr<detail::governor_state> state_;
    const duration admission_timeout_;

public:

    concurrency_governor(asio::io_context& ios, const governor_settings& settings);
    ~concurrency_governor();

    concurrency_governor(const concurrency_governor&) = delete;
    concurrency_governor& operator=(const concurrency_governor&) = delete;

    /**
     * Requests a ticket for a fetch from source. The handler is always invoked
     * asynchronously, with a valid ticket, or with capacity_timeout or
     * operation_aborted and an invalid ticket.
     */
    void async_acquire(const source_id& source, acquire_handler handler);

    /** Returns a valid ticket if there is capacity right now, or an invalid one. */
    admission_ticket try_acquire(const source_id& source);

    /**
     * Whether a request for source would be admitted without waiting, counting queued
     * requests as if they were granted. This does not reserve anything.
     */
    bool can_admit(const source_id& source) const;

    /** Fails all queued requests with transfer_errc::operation_aborted. */
    void cancel_waiters();

    /**
     * Cancels all waiters and stops granting queued requests. Tickets may still be
     * released afterwards. Used when shutting down the engine.
     */
    void shutdown();

    int num_in_use() const;
    int num_in_use(const source_id& source) const;
    int num_waiting() const;
    governor_stats stats() const;

    int max_active_fetches() const noexcept;
    int max_fetches_per_source() const noexcept;
};

} // namespace shoal

#endif // SHOAL_CONCURRENCY_GOVERNOR_HEADER

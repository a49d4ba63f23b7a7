#ifndef SHOAL_BACKFILL_SWEEPER_HEADER
#define SHOAL_BACKFILL_SWEEPER_HEADER

#include "time.hpp"

#include <atomic>
#include <memory>
#include <vector>
#include <mutex>

#include <asio/io_context.hpp>

namespace shoal {

class source_discovery;
class transfer;

/**
 * Periodically re-queries discovery for every tracked transfer that is still missing
 * sources for some of its segments (or has stalled for lack of them), and hands the
 * results to the transfer's backfill. Transfers are tracked weakly, so ones that are
 * destroyed are dropped on the next sweep.
 */
class backfill_sweeper
{
    asio::io_context& ios_;
    source_discovery& discovery_;
    const duration interval_;

    deadline_timer timer_;

    std::vector<std::weak_ptr<transfer>> transfers_;
    mutable std::mutex transfers_mutex_;

    std::atomic<bool> is_running_{false};

public:

    backfill_sweeper(asio::io_context& ios, source_discovery& discovery,
        const duration interval);

    void start();
    void stop();

    void add(std::weak_ptr<transfer> t);

    /**
     * Runs a sweep right away. Returns the number of transfers for which discovery was
     * queried.
     */
    int sweep();

    int num_tracked() const;

private:

    void schedule_sweep();
};

} // namespace shoal

#endif // SHOAL_BACKFILL_SWEEPER_HEADER

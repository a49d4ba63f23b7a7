#ifndef SHOAL_TRANSFER_HEADER
#define SHOAL_TRANSFER_HEADER

#include "concurrency_governor.hpp"
#include "segment_scheduler.hpp"
#include "source_registry.hpp"
#include "transfer_status.hpp"
#include "segment_storage.hpp"
#include "segment_buffer.hpp"
#include "thread_pool.hpp"
#include "settings.hpp"
#include "file_id.hpp"
#include "source.hpp"
#include "types.hpp"
#include "time.hpp"
#include "log.hpp"

#include <system_error>
#include <memory>
#include <utility>
#include <vector>
#include <mutex>
#include <map>

#include <asio/io_context.hpp>
#include <asio/strand.hpp>

namespace shoal {

class source_discovery;
class peer_connection;
class alert_queue;
class peer_client;
class hash_store;

/** The user supplied parameters of a transfer. */
struct transfer_args
{
    file_id file;

    // If the caller knows the digests of the file's segments (e.g. from a previous
    // download of the same file), they are used instead of the hash store. Must be
    // either empty or have exactly one digest per segment.
    std::vector<sha256_hash> segment_digests;

    // The file in which this transfer's resume data is kept.
    path resume_data_path;
};

/**
 * Downloads a single file from any number of sources, one segment per fetch. It owns
 * the transfer's source registry, segment scheduler and storage, and it's the only
 * entity that dispatches fetches through the peer client, each of which is admitted by
 * the concurrency governor.
 *
 * All of its logic is executed on a strand, so the transfer itself is single-threaded,
 * but many transfers may run concurrently on the network threads. Segments are hashed
 * and written on the thread pool, and the results are posted back to the strand.
 *
 * The public functions, except for the accessors to the registry and the scheduler,
 * are thread-safe.
 */
class transfer : public std::enable_shared_from_this<transfer>
{
    struct segment_fetch;

    using strand_type = asio::strand<asio::io_context::executor_type>;

    asio::io_context& ios_;
    strand_type strand_;

    concurrency_governor& governor_;
    hash_store& hash_store_;
    thread_pool& cpu_pool_;
    peer_client& peer_client_;
    source_discovery& discovery_;
    alert_queue& alert_queue_;

    const transfer_id_t id_;
    const file_id file_;
    const transfer_settings settings_;

    // Empty if the caller doesn't know the segments' digests.
    const std::vector<sha256_hash> expected_digests_;

    source_registry sources_;
    segment_scheduler scheduler_;
    segment_storage storage_;
    std::shared_ptr<segment_buffer_pool> buffer_pool_;

    // Every segment whose ticket has been granted and that is either being fetched or
    // verified. An entry is removed once its ticket is released.
    std::map<segment_index_t, std::shared_ptr<segment_fetch>> fetches_;

    // The number of claims for which we're waiting on the governor.
    int num_pending_acquires_ = 0;

    // Runs the scheduling pass at fixed intervals while the transfer isn't terminal.
    deadline_timer update_timer_;

    transfer_state state_ = transfer_state::pending;
    std::error_code error_;

    time_point start_time_;
    time_point completion_time_;
    // The last time a segment was verified, or the transfer was (re)started.
    time_point last_progress_time_;

    bool is_started_ = false;
    // Set while the partial file left by a previous run is being checked against known
    // digests, during which no segment is scheduled.
    bool is_checking_part_file_ = false;
    bool is_cancelling_ = false;
    bool is_finalizing_ = false;
    // Set when a segment is verified, reset once the resume data is saved.
    bool has_state_changed_ = false;

    // A snapshot of the above, produced on the strand and copied out under a mutex.
    transfer_status ts_status_;
    mutable std::mutex ts_status_mutex_;

public:

    /**
     * Throws std::invalid_argument if args.segment_digests doesn't have one digest per
     * segment.
     */
    transfer(transfer_id_t id,
        asio::io_context& ios,
        concurrency_governor& governor,
        hash_store& hash_store,
        thread_pool& cpu_pool,
        peer_client& peer_client,
        source_discovery& discovery,
        alert_queue& alert_queue,
        const transfer_settings& settings,
        transfer_args args);

    transfer(const transfer&) = delete;
    transfer& operator=(const transfer&) = delete;

    /**
     * Allocates storage, restores resume data, queries discovery and starts the
     * scheduling cycle.
     */
    void start();

    /**
     * Stops dispatching new fetches, waits for the in-flight ones to release their
     * tickets, saves the verified segments and becomes cancelled.
     */
    void cancel();

    /**
     * Registers the sources and triggers a scheduling pass. Segments that failed with
     * every source so far are reopened if one of the new sources hasn't tried them,
     * and a stalled transfer is revived.
     */
    void backfill(std::vector<discovered_source> sources);

    transfer_status status() const;

    transfer_id_t id() const noexcept { return id_; }
    const file_id& file() const noexcept { return file_; }

    /**
     * These must only be used on the transfer's strand or when the io_context is not
     * running.
     */
    const source_registry& sources() const noexcept { return sources_; }
    const segment_scheduler& segments() const noexcept { return scheduler_; }

private:

    void do_start();
    void begin_fetching();
    void do_cancel();

    /**
     * Hashes the segments of an existing partial file whose digest is known (from the
     * caller or the hash store) but which weren't restored from resume data, so that
     * their bytes need not be fetched again. Returns false if there is nothing to check.
     */
    bool recheck_part_file();
    void on_part_file_checked(
        const std::vector<std::pair<segment_index_t, sha256_hash>>& matches);
    void add_sources(std::vector<discovered_source> sources, const bool is_backfill);

    /**
     * The scheduling pass: refreshes source states, ranks the sources, claims segments
     * and dispatches a fetch for each claim. Also detects stalls.
     */
    void update();
    void schedule_update();

    void dispatch(const segment_assignment& assignment);
    void on_admitted(const segment_assignment& assignment, const std::error_code& error,
        admission_ticket ticket);
    void on_connected(std::shared_ptr<segment_fetch> fetch, const std::error_code& error,
        std::shared_ptr<peer_connection> connection);
    void on_range_received(std::shared_ptr<segment_fetch> fetch,
        const std::error_code& error);
    void on_fetch_timeout(std::shared_ptr<segment_fetch> fetch);
    void on_fetch_failed(std::shared_ptr<segment_fetch> fetch,
        const std::error_code& error);

    /** Hashes the segment on the thread pool and writes it to disk if it's valid. */
    void verify_and_write(std::shared_ptr<segment_fetch> fetch);
    void on_segment_processed(std::shared_ptr<segment_fetch> fetch,
        const std::error_code& error, const sha256_hash& digest);

    /** Drops a fetch without counting it as a failure. Used when cancelling. */
    void abort_fetch(std::shared_ptr<segment_fetch> fetch);

    /** Releases fetch's ticket and forgets about it. */
    void finish_fetch(segment_fetch& fetch);
    void after_fetch_finished();

    void finalize();
    void on_finalized(const std::error_code& error);

    void fail(const std::error_code& error);
    void try_finish_cancel();

    void save_resume_data();
    void restore_resume_data();

    void update_status();

    enum class log_event
    {
        update,
        source,
        fetch,
        verify,
        disk,
        state
    };

    template<typename... Args>
    void log(const log_event event, const char* format, Args&&... args) const;
    template<typename... Args>
    void log(const log_event event, const log::priority priority,
        const char* format, Args&&... args) const;
};

} // namespace shoal

#endif // SHOAL_TRANSFER_HEADER

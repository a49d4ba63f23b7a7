#ifndef SHOAL_ENGINE_HEADER
#define SHOAL_ENGINE_HEADER

#include "concurrency_governor.hpp"
#include "backfill_sweeper.hpp"
#include "transfer_status.hpp"
#include "alert_queue.hpp"
#include "thread_pool.hpp"
#include "hash_store.hpp"
#include "settings.hpp"
#include "file_id.hpp"
#include "types.hpp"
#include "time.hpp"

#include <memory>
#include <thread>
#include <vector>
#include <deque>
#include <mutex>
#include <map>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

namespace shoal {

class source_discovery;
class peer_client;
class transfer;

/**
 * The entry point: the engine runs every transfer on its network threads, and owns the
 * resources the transfers share: the concurrency governor, the hash store, the thread
 * pool on which segments are hashed and written, the alert queue and the backfill
 * sweeper.
 *
 * The peer client and discovery are provided by the user (they wrap the actual Soulseek
 * client) and must outlive the engine.
 *
 * All public functions are thread-safe.
 */
class engine
{
    // This contains all the user configurable options, a const reference to which is
    // passed down to most components of the engine.
    const settings settings_;

    peer_client& peer_client_;
    source_discovery& discovery_;

    // All transfers' strands and timers run on this io_context, which is run by
    // settings_.engine.network_threads threads.
    asio::io_context ios_;

    // We want to keep ios_ running indefinitely until shutdown, so keep it busy with
    // this work guard.
    asio::executor_work_guard<asio::io_context::executor_type> work_;

    concurrency_governor governor_;
    hash_store hash_store_;
    thread_pool cpu_pool_;

    // Internal entities communicate with user asynchronously via an alert channel. This
    // is done by accumulating alerts in this queue until user manually extracts them.
    // It's thread-safe.
    alert_queue alert_queue_;

    backfill_sweeper backfill_;

    // Transfers are kept here until they become terminal, after which the engine
    // update archives their final status and drops them.
    std::map<transfer_id_t, std::shared_ptr<transfer>> transfers_;
    std::map<transfer_id_t, transfer_status> archived_statuses_;
    transfer_id_t next_transfer_id_ = 0;
    mutable std::mutex transfers_mutex_;

    // Archives finished transfers and saves the hash store.
    deadline_timer update_timer_;
    time_point last_hash_store_save_time_;

    std::vector<std::thread> network_threads_;

public:

    /**
     * Settings set to values::none are replaced by their defaults. Throws
     * std::invalid_argument if a setting is invalid.
     */
    engine(peer_client& peer_client, source_discovery& discovery, settings s);
    ~engine();

    engine(const engine&) = delete;
    engine& operator=(const engine&) = delete;

    /**
     * Starts downloading file and returns the transfer's id. If segment_digests is not
     * empty, it must contain the digest of every segment (as partitioned by
     * transfer_settings::segment_size), and segments are verified against them instead
     * of the hash store. If file has a digest, the assembled file is verified against it.
     *
     * If resume data is found for the same file, the already verified segments are not
     * downloaded again.
     *
     * Throws std::invalid_argument if file has no name or its size is not positive, or
     * if segment_digests has the wrong number of digests.
     */
    transfer_id_t start_transfer(file_id file,
        std::vector<sha256_hash> segment_digests = {});

    /** Unknown or already finished transfers are ignored. */
    void cancel_transfer(const transfer_id_t id);

    /** Throws std::invalid_argument if no transfer with id was ever started. */
    transfer_status get_status(const transfer_id_t id) const;

    /** The statuses of all transfers, archived ones included, in order of id. */
    std::vector<transfer_status> statuses() const;

    /** Runs a backfill sweep right away instead of waiting for the next interval. */
    void sweep_backfill();

    /** Returns the alerts accumulated since the last call. */
    std::deque<std::unique_ptr<alert>> alerts();

    governor_stats get_governor_stats() const;
    int num_known_digests() const;
    const settings& get_settings() const noexcept { return settings_; }

    /** Settings set to values::none are replaced with their defaults. */
    static void fill_in_defaults(settings& s);

    /** Throws std::invalid_argument on the first invalid setting. */
    static void verify(const settings& s);

private:

    static settings prepare_settings(settings s);

    path resume_data_path(const file_id& file) const;

    void update();
    void archive_finished_transfers();
    void save_hash_store();
};

} // namespace shoal

#endif // SHOAL_ENGINE_HEADER

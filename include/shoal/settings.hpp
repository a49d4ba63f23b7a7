#ifndef SHOAL_SETTINGS_HEADER
#define SHOAL_SETTINGS_HEADER

#include "path.hpp"
#include "time.hpp"

namespace shoal {
namespace values {

constexpr int unlimited = -1;
constexpr int none = -2;

} // values

/**
 * The relative weights of the components of a source's score. They need not add up to
 * 1, but the ranking is easiest to reason about if they do.
 */
struct ranking_weights
{
    // Recent throughput, normalized by the best candidate's.
    double throughput = 0.4;
    // successes / (successes + failures), with a 0.5 prior for untried sources.
    double success_ratio = 0.3;
    // 1 / (1 + rtt / reference_rtt).
    double latency = 0.15;
    // How recently we've last heard from the source, decaying exponentially.
    double recency = 0.15;

    // The round trip time at which the latency score is 0.5.
    milliseconds reference_rtt{200};

    // The time after which the recency score of a source halves.
    seconds recency_half_life{minutes{5}};
};

/**
 * The concurrency governor is shared by all transfers, so these are global limits on
 * the number of simultaneous fetches.
 */
struct governor_settings
{
    // The maximum number of fetches in flight across all transfers and sources.
    int max_active_fetches = 32;

    // The maximum number of fetches in flight from a single source, across all
    // transfers. Soulseek peers commonly serve a handful of uploads at once and queue
    // the rest, so this should be kept low.
    int max_fetches_per_source = 4;

    // The amount of time a fetch waits for an admission ticket before giving up. The
    // segment is then released and retried in a later scheduling pass.
    seconds admission_timeout{30};
};

/** Settings pertaining to a single transfer. */
struct transfer_settings
{
    // The size of a segment, the unit of fetching and verification. The last segment
    // of a file may be shorter.
    int segment_size = 1024 * 1024;

    // Once this many distinct sources have failed a segment it is permanently failed
    // until backfill finds a source that hasn't tried it yet. Repeated failures by the
    // same source don't count toward it.
    int max_segment_retries = 3;

    // If a source's number of consecutive failures goes above this value, it is
    // marked suspect and is not picked until suspect_cooldown elapses.
    int suspect_failure_limit = 5;
    seconds suspect_cooldown{60};

    // A digest mismatch is worse than a network error, so it counts as this many
    // further consecutive failures.
    int mismatch_penalty = 2;

    // A source with at least this many failures and no success within the eviction
    // window is evicted from the transfer for good.
    int eviction_failure_threshold = 20;
    seconds eviction_window{minutes{5}};

    // If no segment is verified for this long and there is nothing in flight nor any
    // source to which a segment could be assigned, the transfer fails as stalled.
    seconds stall_timeout{60};

    // A single segment fetch (connect, request, stream) must finish within this time.
    seconds segment_timeout{60};

    // The interval of the transfer's scheduling pass. A pass is also run after every
    // fetch completion.
    milliseconds update_interval{250};

    ranking_weights ranking;

    // The directory in which downloaded files are saved. Must be specified.
    path save_path;
};

struct engine_settings
{
    // The number of threads running the network event loop on which all transfers are
    // executed.
    int network_threads = values::none;

    // The number of threads that hash and write segments. The default is the number
    // of cores.
    int hashing_threads = values::none;

    // The interval at which backfill re-queries discovery for transfers that lack
    // sources for some of their segments.
    seconds backfill_interval{30};

    // Transfer resume data (verified segments and their digests) is saved here. Must
    // be specified.
    path resume_data_path;

    // If set, the hash store is loaded from this file on startup and saved to it
    // periodically and on shutdown.
    path hash_store_path;

    // The maximum number of alerts kept until the user extracts them.
    int max_alerts = 1000;
};

struct settings
{
    engine_settings engine;
    governor_settings governor;
    transfer_settings transfer;
};

} // namespace shoal

#endif // SHOAL_SETTINGS_HEADER

#ifndef SHOAL_SOURCE_HEADER
#define SHOAL_SOURCE_HEADER

#include "sliding_average.hpp"
#include "byte_range.hpp"
#include "types.hpp"
#include "time.hpp"

#include <system_error>
#include <cstdint>
#include <vector>

namespace shoal {

/** What discovery tells us about a peer that shares the file we're after. */
struct discovered_source
{
    source_id id;
    // The byte ranges the peer advertises. Soulseek peers share whole files, so this is
    // usually empty, which means the entire file.
    std::vector<byte_range> ranges;
};

/**
 * A peer's standing within a single transfer. Sources are owned by the transfer's
 * source_registry and are only touched on the transfer's strand.
 */
struct source
{
    enum class state : uint8_t
    {
        // Eligible for scheduling.
        active,
        // Failed too many times in a row; not picked until the cooldown elapses, after
        // which it's active again, on probation.
        suspect,
        // Failed for good; never picked again by this transfer.
        evicted
    };

    source_id id;

    // If empty, the source has the entire file.
    std::vector<byte_range> ranges;

    enum state state = state::active;

    // Bytes per second of the fetches served by this source.
    sliding_average<20> throughput;

    // The round trip time (the time it took to establish the connection) of the
    // fetches served by this source, in milliseconds.
    sliding_average<20> rtt;

    int num_successes = 0;
    int num_failures = 0;
    int num_consecutive_failures = 0;

    // The number of fetches from this source currently in flight in this transfer.
    int num_in_flight = 0;

    time_point discovered_time;
    // The last time we heard from this source: discovery or a successful fetch.
    time_point last_seen_time;
    time_point last_success_time;
    time_point suspect_until;

    bool has_succeeded() const noexcept { return num_successes > 0; }
    bool is_tried() const noexcept { return num_successes + num_failures > 0; }

    /** successes / (successes + failures) or 0.5 for untried sources. */
    double success_ratio() const noexcept
    {
        const int n = num_successes + num_failures;
        return n == 0 ? 0.5 : double(num_successes) / n;
    }

    /** Whether the source advertises all bytes in [offset, offset + length). */
    bool covers(const int64_t offset, const int64_t length) const noexcept
    {
        if(ranges.empty()) {
            return true;
        }
        const byte_range wanted(offset, offset + length);
        for(const auto& r : ranges) {
            if(r.contains(wanted)) {
                return true;
            }
        }
        return false;
    }
};

/** The result of a single fetch attempt, reported to the source registry. */
struct fetch_outcome
{
    // If set, the fetch failed for this reason.
    std::error_code error;
    int64_t num_bytes = 0;
    // From dispatch to verification.
    duration elapsed{0};
    // The time it took to connect to the source.
    duration latency{0};

    static fetch_outcome success(
        const int64_t num_bytes, const duration elapsed, const duration latency)
    {
        fetch_outcome o;
        o.num_bytes = num_bytes;
        o.elapsed = elapsed;
        o.latency = latency;
        return o;
    }

    static fetch_outcome failure(std::error_code error)
    {
        fetch_outcome o;
        o.error = error;
        return o;
    }

    bool is_success() const noexcept { return !error; }
};

} // namespace shoal

#endif // SHOAL_SOURCE_HEADER

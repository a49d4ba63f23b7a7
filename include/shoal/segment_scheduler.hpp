#ifndef SHOAL_SEGMENT_SCHEDULER_HEADER
#define SHOAL_SEGMENT_SCHEDULER_HEADER

#include "source_ranker.hpp"
#include "source.hpp"
#include "types.hpp"

#include <functional>
#include <cstdint>
#include <vector>

namespace shoal {

/** A segment claimed for a source in a scheduling pass. */
struct segment_assignment
{
    segment_index_t segment;
    source_id source;
    int64_t offset;
    int length;
};

/**
 * Splits a file into fixed size segments and decides which source should fetch which
 * segment. Each segment goes through the following states:
 *
 * unclaimed -> claimed(source) -> verifying -> verified
 *
 * A claimed or verifying segment that fails goes back to unclaimed, unless max_retries
 * distinct sources have failed it, in which case it stays failed until it's reopened by
 * backfill for a source that hasn't yet tried it.
 *
 * It's owned by a single transfer and only used on its strand.
 */
class segment_scheduler
{
public:

    enum class segment_state : uint8_t
    {
        unclaimed,
        claimed,
        verifying,
        verified,
        // Permanently failed after exhausting its retries.
        failed
    };

    struct segment
    {
        segment_index_t index;
        int64_t offset;
        int length;
        segment_state state = segment_state::unclaimed;

        // The source that claimed the segment, valid in the claimed and verifying
        // states, and the source whose bytes were verified in the verified state.
        source_id source;

        // The number of failed attempts, by any source, since the segment was last
        // (re)opened.
        int num_failures = 0;

        // Every source that failed to deliver this segment. Retries prefer sources not
        // in this list.
        std::vector<source_id> failed_sources;

        // Valid once the segment is verified.
        sha256_hash digest{};

        bool has_failed_with(const source_id& id) const;
    };

private:

    std::vector<segment> segments_;

    const int64_t file_size_;
    const int segment_size_;
    const int max_retries_;

    int64_t num_bytes_verified_ = 0;
    int num_verified_ = 0;

public:

    segment_scheduler(const int64_t file_size, const int segment_size,
        const int max_retries);

    /**
     * Claims unclaimed segments, lowest offset first, for the highest ranked source
     * that covers the segment, has spare capacity and hasn't been assigned a segment in
     * this pass yet. Sources that already failed the segment are only used if no other
     * source qualifies. Segments for which no source qualifies stay unclaimed.
     *
     * has_capacity is asked once per source per pass.
     */
    std::vector<segment_assignment> schedule(const std::vector<ranked_source>& ranking,
        const std::function<bool(const source&)>& has_capacity);

    /**
     * Whether some unclaimed segment is covered by a source in ranking, regardless of
     * the sources' capacity. If not, no scheduling pass can make progress until new
     * sources turn up.
     */
    bool has_candidate(const std::vector<ranked_source>& ranking) const;

    /** The segment's bytes have been received and are being hashed. */
    void mark_verifying(const segment_index_t index);

    void mark_verified(const segment_index_t index, const sha256_hash& digest);

    /**
     * The attempt by the segment's current source failed. The segment goes back to
     * unclaimed or, if max_retries distinct sources have now failed it, becomes
     * permanently failed, in which case true is returned.
     *
     * If blame_source is false (e.g. the bytes couldn't be written to disk), the
     * source is not recorded as having failed the segment, and the segment is always
     * retried.
     */
    bool mark_failed(const segment_index_t index, const bool blame_source = true);

    /**
     * Returns a claimed segment to unclaimed without counting a failure, e.g. when the
     * admission ticket could not be acquired in time, or the transfer is cancelled.
     */
    void release_claim(const segment_index_t index);

    /**
     * Reopens permanently failed segments for which there is a source among eligible
     * that covers it and hasn't failed it yet. Returns the number of reopened segments.
     */
    int reopen_failed(const std::vector<const source*>& eligible);

    /** Marks a segment verified in a previous run as verified without fetching it. */
    void restore_verified(const segment_index_t index, const sha256_hash& digest);

    const segment& operator[](const segment_index_t index) const
    {
        return segments_[index];
    }

    const std::vector<segment>& segments() const noexcept { return segments_; }

    int num_segments() const noexcept { return segments_.size(); }
    int segment_size() const noexcept { return segment_size_; }
    int64_t file_size() const noexcept { return file_size_; }
    int64_t num_bytes_verified() const noexcept { return num_bytes_verified_; }
    int num_verified() const noexcept { return num_verified_; }
    int num_unclaimed() const noexcept;
    int num_failed() const noexcept;
    int num_in_flight() const noexcept;
    bool is_complete() const noexcept { return num_verified_ == num_segments(); }

private:

    int count(const segment_state state) const noexcept;
};

} // namespace shoal

#endif // SHOAL_SEGMENT_SCHEDULER_HEADER

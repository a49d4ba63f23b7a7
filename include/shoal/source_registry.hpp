#ifndef SHOAL_SOURCE_REGISTRY_HEADER
#define SHOAL_SOURCE_REGISTRY_HEADER

#include "settings.hpp"
#include "source.hpp"
#include "time.hpp"

#include <vector>
#include <map>

namespace shoal {

/**
 * Keeps track of the peers that can serve a transfer's file and of how well they've
 * been doing. It is owned by a single transfer and only used on its strand, so it is
 * not thread-safe.
 *
 * Functions that depend on time take the current time as an argument so that the state
 * transitions can be driven deterministically.
 */
class source_registry
{
    // Ordered by peer id so that listing is deterministic.
    std::map<source_id, source> sources_;

    const int suspect_failure_limit_;
    const duration suspect_cooldown_;
    const int mismatch_penalty_;
    const int eviction_failure_threshold_;
    const duration eviction_window_;

public:

    explicit source_registry(const transfer_settings& settings);

    /**
     * Adds the source if it's not yet known, or merges it into the existing entry: the
     * advertised ranges are unioned and the metrics are kept. An evicted source stays
     * evicted.
     *
     * Returns true if the source was not known before.
     */
    bool register_source(const discovered_source& s, const time_point now = clock::now());

    /**
     * Records the outcome of a fetch from source and updates its metrics and state. A
     * verification mismatch counts as mismatch_penalty further consecutive failures.
     * Outcomes of unknown sources are ignored.
     */
    void update(const source_id& id, const fetch_outcome& outcome,
        const time_point now = clock::now());

    /**
     * Returns suspect sources whose cooldown has elapsed to active (on probation) and
     * evicts sources that qualify for eviction.
     */
    void refresh(const time_point now = clock::now());

    /** Returns the sources that may be scheduled, i.e. that are neither suspect nor evicted. */
    std::vector<const source*> list() const;

    /** Returns all sources regardless of their state. */
    std::vector<const source*> all() const;

    /** Returns nullptr if id is not known. */
    const source* find(const source_id& id) const;

    /** Called when the transfer completes. Sources are kept but are no longer eligible. */
    void evict_all();

    void on_fetch_started(const source_id& id);
    void on_fetch_finished(const source_id& id);

    int size() const noexcept { return sources_.size(); }
    bool empty() const noexcept { return sources_.empty(); }

    /** The number of sources from which we're currently fetching. */
    int num_active_sources() const noexcept;

    /** The number of sources that are neither suspect nor evicted. */
    int num_eligible_sources() const noexcept;

private:

    source* find_mutable(const source_id& id);
    bool should_evict(const source& s, const time_point now) const noexcept;
    static std::vector<byte_range> coalesce(std::vector<byte_range> ranges);
};

} // namespace shoal

#endif // SHOAL_SOURCE_REGISTRY_HEADER

#ifndef SHOAL_SOURCE_RANKER_HEADER
#define SHOAL_SOURCE_RANKER_HEADER

#include "settings.hpp"
#include "source.hpp"
#include "time.hpp"

#include <vector>

namespace shoal {

struct ranked_source
{
    const source* src;
    double score;
};

/**
 * Orders sources from best to worst. The score of a source is the weighted sum of its
 * throughput (relative to the best candidate's), its success ratio, its latency and how
 * recently we've heard from it, each mapped to [0, 1]. Sources with no measurements get
 * a neutral 0.5 for that component so that new sources get a chance.
 *
 * Suspect and evicted sources are dropped. Ties are broken by ascending peer id, so the
 * result is a total order. It is a pure function of its inputs, and it is recomputed on
 * every scheduling pass.
 */
std::vector<ranked_source> rank_sources(const std::vector<const source*>& sources,
    const ranking_weights& weights, const time_point now = clock::now());

/** Computes the score of a single source. max_throughput is that of the best candidate. */
double score_source(const source& s, const ranking_weights& weights,
    const int64_t max_throughput, const time_point now);

} // namespace shoal

#endif // SHOAL_SOURCE_RANKER_HEADER

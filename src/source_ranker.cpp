#include "source_ranker.hpp"

#include <algorithm>
#include <cmath>

namespace shoal {

double score_source(const source& s, const ranking_weights& weights,
    const int64_t max_throughput, const time_point now)
{
    double throughput = 0.5;
    if(!s.throughput.empty() && (max_throughput > 0)) {
        throughput = double(s.throughput.mean()) / max_throughput;
    }

    double latency = 0.5;
    if(!s.rtt.empty()) {
        const double reference = std::max<int64_t>(1, weights.reference_rtt.count());
        latency = 1.0 / (1.0 + s.rtt.mean() / reference);
    }

    const double age = std::max<double>(0, to_int<milliseconds>(now - s.last_seen_time));
    const double half_life = std::max<int64_t>(1,
        to_int<milliseconds>(weights.recency_half_life));
    const double recency = std::exp2(-age / half_life);

    return weights.throughput * throughput
        + weights.success_ratio * s.success_ratio()
        + weights.latency * latency
        + weights.recency * recency;
}

std::vector<ranked_source> rank_sources(const std::vector<const source*>& sources,
    const ranking_weights& weights, const time_point now)
{
    int64_t max_throughput = 0;
    for(const source* s : sources) {
        if(s->state == source::state::active) {
            max_throughput = std::max(max_throughput, s->throughput.mean());
        }
    }

    std::vector<ranked_source> ranking;
    ranking.reserve(sources.size());
    for(const source* s : sources) {
        if(s->state != source::state::active) {
            continue;
        }
        ranking.push_back({s, score_source(*s, weights, max_throughput, now)});
    }

    std::sort(ranking.begin(), ranking.end(),
        [](const ranked_source& a, const ranked_source& b) {
            if(a.score != b.score) { return a.score > b.score; }
            return a.src->id < b.src->id;
        });
    return ranking;
}

} // namespace shoal

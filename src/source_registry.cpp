#include "source_registry.hpp"
#include "transfer_error.hpp"

#include <algorithm>

namespace shoal {

source_registry::source_registry(const transfer_settings& settings)
    : suspect_failure_limit_(settings.suspect_failure_limit)
    , suspect_cooldown_(settings.suspect_cooldown)
    , mismatch_penalty_(settings.mismatch_penalty)
    , eviction_failure_threshold_(settings.eviction_failure_threshold)
    , eviction_window_(settings.eviction_window)
{}

bool source_registry::register_source(const discovered_source& s, const time_point now)
{
    auto it = sources_.find(s.id);
    if(it != sources_.end()) {
        auto& existing = it->second;
        // an empty range list means the whole file, which absorbs anything else
        if(s.ranges.empty()) {
            existing.ranges.clear();
        } else if(!existing.ranges.empty()) {
            existing.ranges.insert(existing.ranges.end(), s.ranges.begin(), s.ranges.end());
            existing.ranges = coalesce(std::move(existing.ranges));
        }
        existing.last_seen_time = now;
        return false;
    }

    source new_source;
    new_source.id = s.id;
    new_source.ranges = coalesce(s.ranges);
    new_source.discovered_time = now;
    new_source.last_seen_time = now;
    sources_.emplace(s.id, std::move(new_source));
    return true;
}

std::vector<byte_range> source_registry::coalesce(std::vector<byte_range> ranges)
{
    std::sort(ranges.begin(), ranges.end());
    std::vector<byte_range> merged;
    for(const auto& r : ranges) {
        if(r.empty()) { continue; }
        if(!merged.empty() && merged.back().touches(r)) {
            merged.back().end = std::max(merged.back().end, r.end);
        } else {
            merged.push_back(r);
        }
    }
    return merged;
}

void source_registry::update(
    const source_id& id, const fetch_outcome& outcome, const time_point now)
{
    source* s = find_mutable(id);
    if(s == nullptr) {
        return;
    }

    if(outcome.is_success()) {
        ++s->num_successes;
        s->num_consecutive_failures = 0;
        const auto elapsed_ms = std::max<int64_t>(1, to_int<milliseconds>(outcome.elapsed));
        s->throughput.update(outcome.num_bytes * 1000 / elapsed_ms);
        s->rtt.update(to_int<milliseconds>(outcome.latency));
        s->last_seen_time = now;
        s->last_success_time = now;
        if(s->state == source::state::suspect) {
            s->state = source::state::active;
        }
        return;
    }

    ++s->num_failures;
    ++s->num_consecutive_failures;
    if(outcome.error == transfer_errc::verification_mismatch) {
        s->num_consecutive_failures += mismatch_penalty_;
    }

    if(s->state == source::state::evicted) {
        return;
    }
    if(should_evict(*s, now)) {
        s->state = source::state::evicted;
    } else if(s->num_consecutive_failures > suspect_failure_limit_) {
        s->state = source::state::suspect;
        s->suspect_until = now + suspect_cooldown_;
    }
}

void source_registry::refresh(const time_point now)
{
    for(auto& e : sources_) {
        auto& s = e.second;
        if(s.state == source::state::evicted) {
            continue;
        }
        if(should_evict(s, now)) {
            s.state = source::state::evicted;
        } else if((s.state == source::state::suspect) && (now >= s.suspect_until)) {
            s.state = source::state::active;
        }
    }
}

bool source_registry::should_evict(const source& s, const time_point now) const noexcept
{
    if(s.num_failures < eviction_failure_threshold_) {
        return false;
    }
    return !s.has_succeeded() || (now - s.last_success_time >= eviction_window_);
}

std::vector<const source*> source_registry::list() const
{
    std::vector<const source*> result;
    result.reserve(sources_.size());
    for(const auto& e : sources_) {
        if(e.second.state == source::state::active) {
            result.push_back(&e.second);
        }
    }
    return result;
}

std::vector<const source*> source_registry::all() const
{
    std::vector<const source*> result;
    result.reserve(sources_.size());
    for(const auto& e : sources_) {
        result.push_back(&e.second);
    }
    return result;
}

const source* source_registry::find(const source_id& id) const
{
    auto it = sources_.find(id);
    return it != sources_.end() ? &it->second : nullptr;
}

source* source_registry::find_mutable(const source_id& id)
{
    auto it = sources_.find(id);
    return it != sources_.end() ? &it->second : nullptr;
}

void source_registry::evict_all()
{
    for(auto& e : sources_) {
        e.second.state = source::state::evicted;
    }
}

void source_registry::on_fetch_started(const source_id& id)
{
    if(source* s = find_mutable(id)) {
        ++s->num_in_flight;
    }
}

void source_registry::on_fetch_finished(const source_id& id)
{
    source* s = find_mutable(id);
    if(s && (s->num_in_flight > 0)) {
        --s->num_in_flight;
    }
}

int source_registry::num_active_sources() const noexcept
{
    return std::count_if(sources_.begin(), sources_.end(),
        [](const auto& e) { return e.second.num_in_flight > 0; });
}

int source_registry::num_eligible_sources() const noexcept
{
    return std::count_if(sources_.begin(), sources_.end(),
        [](const auto& e) { return e.second.state == source::state::active; });
}

} // namespace shoal

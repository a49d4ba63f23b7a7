#include "segment_scheduler.hpp"

#include <algorithm>
#include <cassert>

namespace shoal {

bool segment_scheduler::segment::has_failed_with(const source_id& id) const
{
    return std::find(failed_sources.begin(), failed_sources.end(), id)
        != failed_sources.end();
}

segment_scheduler::segment_scheduler(const int64_t file_size, const int segment_size,
    const int max_retries)
    : file_size_(file_size)
    , segment_size_(segment_size)
    , max_retries_(max_retries)
{
    assert(file_size >= 0);
    assert(segment_size > 0);
    const int64_t num_segments = (file_size + segment_size - 1) / segment_size;
    segments_.reserve(num_segments);
    for(int64_t i = 0; i < num_segments; ++i) {
        segment s;
        s.index = i;
        s.offset = i * segment_size;
        s.length = std::min<int64_t>(segment_size, file_size - s.offset);
        segments_.push_back(std::move(s));
    }
}

std::vector<segment_assignment> segment_scheduler::schedule(
    const std::vector<ranked_source>& ranking,
    const std::function<bool(const source&)>& has_capacity)
{
    // candidates in rank order; a source is removed once it's assigned a segment
    std::vector<const source*> candidates;
    candidates.reserve(ranking.size());
    for(const auto& r : ranking) {
        if(has_capacity(*r.src)) {
            candidates.push_back(r.src);
        }
    }

    std::vector<segment_assignment> assignments;
    for(auto& segment : segments_) {
        if(candidates.empty()) {
            break;
        }
        if(segment.state != segment_state::unclaimed) {
            continue;
        }

        auto pick = candidates.end();
        auto fallback = candidates.end();
        for(auto it = candidates.begin(); it != candidates.end(); ++it) {
            const source& src = **it;
            if(!src.covers(segment.offset, segment.length)) {
                continue;
            }
            if(segment.has_failed_with(src.id)) {
                if(fallback == candidates.end()) {
                    fallback = it;
                }
                continue;
            }
            pick = it;
            break;
        }
        if(pick == candidates.end()) {
            pick = fallback;
        }
        if(pick == candidates.end()) {
            continue;
        }

        segment.state = segment_state::claimed;
        segment.source = (*pick)->id;
        assignments.push_back({segment.index, segment.source, segment.offset,
            segment.length});
        candidates.erase(pick);
    }
    return assignments;
}

bool segment_scheduler::has_candidate(const std::vector<ranked_source>& ranking) const
{
    for(const auto& segment : segments_) {
        if(segment.state != segment_state::unclaimed) {
            continue;
        }
        for(const auto& r : ranking) {
            if(r.src->covers(segment.offset, segment.length)) {
                return true;
            }
        }
    }
    return false;
}

void segment_scheduler::mark_verifying(const segment_index_t index)
{
    auto& segment = segments_[index];
    assert(segment.state == segment_state::claimed);
    segment.state = segment_state::verifying;
}

void segment_scheduler::mark_verified(const segment_index_t index,
    const sha256_hash& digest)
{
    auto& segment = segments_[index];
    assert(segment.state == segment_state::claimed
        || segment.state == segment_state::verifying);
    segment.state = segment_state::verified;
    segment.digest = digest;
    num_bytes_verified_ += segment.length;
    ++num_verified_;
}

bool segment_scheduler::mark_failed(const segment_index_t index, const bool blame_source)
{
    auto& segment = segments_[index];
    assert(segment.state == segment_state::claimed
        || segment.state == segment_state::verifying);
    if(blame_source && !segment.has_failed_with(segment.source)) {
        segment.failed_sources.push_back(segment.source);
    }
    segment.source.clear();
    ++segment.num_failures;
    // a single flaky source may retry the segment any number of times, it's only given
    // up on once enough distinct sources have failed it
    if(blame_source && (int(segment.failed_sources.size()) >= max_retries_)) {
        segment.state = segment_state::failed;
        return true;
    }
    segment.state = segment_state::unclaimed;
    return false;
}

void segment_scheduler::release_claim(const segment_index_t index)
{
    auto& segment = segments_[index];
    if(segment.state == segment_state::claimed
            || segment.state == segment_state::verifying) {
        segment.state = segment_state::unclaimed;
        segment.source.clear();
    }
}

int segment_scheduler::reopen_failed(const std::vector<const source*>& eligible)
{
    int num_reopened = 0;
    for(auto& segment : segments_) {
        if(segment.state != segment_state::failed) {
            continue;
        }
        const bool has_untried_source = std::any_of(eligible.begin(), eligible.end(),
            [&segment](const source* s) {
                return s->covers(segment.offset, segment.length)
                    && !segment.has_failed_with(s->id);
            });
        if(has_untried_source) {
            segment.state = segment_state::unclaimed;
            segment.num_failures = 0;
            ++num_reopened;
        }
    }
    return num_reopened;
}

void segment_scheduler::restore_verified(const segment_index_t index,
    const sha256_hash& digest)
{
    auto& segment = segments_[index];
    if(segment.state == segment_state::verified) {
        return;
    }
    segment.state = segment_state::verified;
    segment.digest = digest;
    num_bytes_verified_ += segment.length;
    ++num_verified_;
}

int segment_scheduler::count(const segment_state state) const noexcept
{
    return std::count_if(segments_.begin(), segments_.end(),
        [state](const segment& s) { return s.state == state; });
}

int segment_scheduler::num_unclaimed() const noexcept
{
    return count(segment_state::unclaimed);
}

int segment_scheduler::num_failed() const noexcept
{
    return count(segment_state::failed);
}

int segment_scheduler::num_in_flight() const noexcept
{
    return count(segment_state::claimed) + count(segment_state::verifying);
}

} // namespace shoal

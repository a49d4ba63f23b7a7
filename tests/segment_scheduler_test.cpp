#include <shoal/segment_scheduler.hpp>
#include <shoal/source_ranker.hpp>
#include <shoal/source.hpp>
#include <gtest/gtest.h>

#include <vector>

using namespace shoal;

namespace {

source make_source(const source_id& id, std::vector<byte_range> ranges = {})
{
    source s;
    s.id = id;
    s.ranges = std::move(ranges);
    return s;
}

std::vector<ranked_source> rank(const std::vector<const source*>& sources)
{
    std::vector<ranked_source> ranking;
    double score = 1.0;
    for(const auto* s : sources) {
        ranking.push_back({s, score});
        score -= 0.1;
    }
    return ranking;
}

bool always(const source&) { return true; }

constexpr auto mib = 1024 * 1024;

} // namespace

TEST(SegmentSchedulerTest, SegmentsPartitionTheFile)
{
    for(const int64_t file_size : {int64_t(0), int64_t(1), int64_t(mib - 1), int64_t(mib),
            int64_t(10 * mib), int64_t(10 * mib + 17)}) {
        segment_scheduler scheduler(file_size, mib, 3);
        int64_t expected_offset = 0;
        for(const auto& s : scheduler.segments()) {
            EXPECT_EQ(s.offset, expected_offset);
            EXPECT_GT(s.length, 0);
            EXPECT_LE(s.length, mib);
            EXPECT_EQ(s.state, segment_scheduler::segment_state::unclaimed);
            expected_offset += s.length;
        }
        EXPECT_EQ(expected_offset, file_size);
    }

    segment_scheduler scheduler(10 * mib + 17, mib, 3);
    EXPECT_EQ(scheduler.num_segments(), 11);
    EXPECT_EQ(scheduler.segments().back().length, 17);
}

TEST(SegmentSchedulerTest, EachSourceGetsOneSegmentPerPassInRankOrder)
{
    segment_scheduler scheduler(5 * mib, mib, 3);
    const auto a = make_source("a");
    const auto b = make_source("b");

    const auto assignments = scheduler.schedule(rank({&a, &b}), always);
    ASSERT_EQ(assignments.size(), 2);
    EXPECT_EQ(assignments[0].segment, 0);
    EXPECT_EQ(assignments[0].source, "a");
    EXPECT_EQ(assignments[1].segment, 1);
    EXPECT_EQ(assignments[1].source, "b");
    EXPECT_EQ(assignments[1].offset, mib);
    EXPECT_EQ(assignments[1].length, mib);
    EXPECT_EQ(scheduler.num_in_flight(), 2);
    EXPECT_EQ(scheduler.num_unclaimed(), 3);

    // claimed segments are not handed out twice
    const auto next = scheduler.schedule(rank({&a, &b}), always);
    ASSERT_EQ(next.size(), 2);
    EXPECT_EQ(next[0].segment, 2);
    EXPECT_EQ(next[1].segment, 3);
}

TEST(SegmentSchedulerTest, SourcesWithoutCapacityAreSkipped)
{
    segment_scheduler scheduler(3 * mib, mib, 3);
    const auto a = make_source("a");
    const auto b = make_source("b");

    const auto assignments = scheduler.schedule(rank({&a, &b}),
        [](const source& s) { return s.id != "a"; });
    ASSERT_EQ(assignments.size(), 1);
    EXPECT_EQ(assignments[0].source, "b");
    EXPECT_EQ(assignments[0].segment, 0);

    EXPECT_TRUE(scheduler.schedule(rank({&a, &b}),
        [](const source&) { return false; }).empty());
}

TEST(SegmentSchedulerTest, OnlySourcesCoveringTheSegmentAreAssigned)
{
    segment_scheduler scheduler(4 * mib, mib, 3);
    // has the second half of the file only
    const auto partial = make_source("partial", {byte_range(2 * mib, 4 * mib)});

    const auto assignments = scheduler.schedule(rank({&partial}), always);
    ASSERT_EQ(assignments.size(), 1);
    EXPECT_EQ(assignments[0].segment, 2);
}

TEST(SegmentSchedulerTest, FailedSourceIsOnlyUsedAsFallback)
{
    segment_scheduler scheduler(2 * mib, mib, 3);
    const auto a = make_source("a");
    const auto b = make_source("b");

    auto assignments = scheduler.schedule(rank({&a}), always);
    ASSERT_EQ(assignments.size(), 1);
    EXPECT_FALSE(scheduler.mark_failed(0));
    EXPECT_TRUE(scheduler[0].has_failed_with("a"));
    EXPECT_EQ(scheduler[0].state, segment_scheduler::segment_state::unclaimed);

    // a is ranked higher, but b hasn't failed segment 0 yet
    assignments = scheduler.schedule(rank({&a, &b}), always);
    ASSERT_EQ(assignments.size(), 2);
    EXPECT_EQ(assignments[0].segment, 0);
    EXPECT_EQ(assignments[0].source, "b");
    EXPECT_EQ(assignments[1].segment, 1);
    EXPECT_EQ(assignments[1].source, "a");

    scheduler.release_claim(0);
    scheduler.release_claim(1);

    // with no one else, a gets to retry
    assignments = scheduler.schedule(rank({&a}), always);
    ASSERT_EQ(assignments.size(), 1);
    EXPECT_EQ(assignments[0].segment, 0);
    EXPECT_EQ(assignments[0].source, "a");
}

TEST(SegmentSchedulerTest, RetriesBySameSourceNeverExhaustSegment)
{
    segment_scheduler scheduler(mib, mib, 3);
    const auto a = make_source("a");
    for(auto i = 0; i < 10; ++i) {
        const auto assignments = scheduler.schedule(rank({&a}), always);
        ASSERT_EQ(assignments.size(), 1);
        EXPECT_EQ(assignments[0].source, "a");
        EXPECT_FALSE(scheduler.mark_failed(0));
    }
    EXPECT_EQ(scheduler[0].state, segment_scheduler::segment_state::unclaimed);
    EXPECT_EQ(scheduler[0].num_failures, 10);
    EXPECT_EQ(scheduler[0].failed_sources.size(), 1);
    EXPECT_EQ(scheduler.num_failed(), 0);
}

TEST(SegmentSchedulerTest, SegmentFailsPermanentlyAfterMaxDistinctSources)
{
    segment_scheduler scheduler(mib, mib, 2);
    const auto a = make_source("a");
    const auto b = make_source("b");
    const auto c = make_source("c");

    ASSERT_EQ(scheduler.schedule(rank({&a}), always).size(), 1);
    EXPECT_FALSE(scheduler.mark_failed(0));
    ASSERT_EQ(scheduler.schedule(rank({&a}), always).size(), 1);
    EXPECT_FALSE(scheduler.mark_failed(0));

    auto assignments = scheduler.schedule(rank({&a, &b}), always);
    ASSERT_EQ(assignments.size(), 1);
    EXPECT_EQ(assignments[0].source, "b");
    EXPECT_TRUE(scheduler.mark_failed(0));
    EXPECT_EQ(scheduler.num_failed(), 1);
    EXPECT_TRUE(scheduler.schedule(rank({&a, &b}), always).empty());

    // only reopened for a source that hasn't tried it
    EXPECT_EQ(scheduler.reopen_failed({&a}), 0);
    EXPECT_EQ(scheduler.reopen_failed({&a, &c}), 1);
    EXPECT_EQ(scheduler[0].num_failures, 0);
    assignments = scheduler.schedule(rank({&a, &c}), always);
    ASSERT_EQ(assignments.size(), 1);
    EXPECT_EQ(assignments[0].source, "c");
}

TEST(SegmentSchedulerTest, CandidatesIgnoreCapacity)
{
    segment_scheduler scheduler(2 * mib, mib, 3);
    const auto a = make_source("a", {{mib, 2 * mib}});
    const auto b = make_source("b", {{0, 10}});
    EXPECT_FALSE(scheduler.has_candidate({}));
    EXPECT_FALSE(scheduler.has_candidate(rank({&b})));
    EXPECT_TRUE(scheduler.has_candidate(rank({&a})));

    // a is saturated, yet it could still serve segment 1 later
    EXPECT_TRUE(scheduler.schedule(rank({&a}), [](const source&) { return false; }).empty());
    EXPECT_TRUE(scheduler.has_candidate(rank({&a})));

    ASSERT_EQ(scheduler.schedule(rank({&a}), always).size(), 1);
    EXPECT_FALSE(scheduler.has_candidate(rank({&a})));
}

TEST(SegmentSchedulerTest, StorageFailureDoesNotBlameSource)
{
    segment_scheduler scheduler(mib, mib, 3);
    const auto a = make_source("a");
    ASSERT_EQ(scheduler.schedule(rank({&a}), always).size(), 1);
    scheduler.mark_verifying(0);
    EXPECT_FALSE(scheduler.mark_failed(0, false));
    EXPECT_FALSE(scheduler[0].has_failed_with("a"));
    EXPECT_EQ(scheduler[0].num_failures, 1);
}

TEST(SegmentSchedulerTest, VerifiedBytesAreCounted)
{
    segment_scheduler scheduler(2 * mib + 100, mib, 3);
    const auto a = make_source("a");
    const auto b = make_source("b");
    const auto c = make_source("c");

    const auto assignments = scheduler.schedule(rank({&a, &b, &c}), always);
    ASSERT_EQ(assignments.size(), 3);
    for(const auto& assignment : assignments) {
        scheduler.mark_verifying(assignment.segment);
        scheduler.mark_verified(assignment.segment, sha256_hash{});
    }
    EXPECT_TRUE(scheduler.is_complete());
    EXPECT_EQ(scheduler.num_bytes_verified(), 2 * mib + 100);
    EXPECT_EQ(scheduler.num_verified(), 3);
    EXPECT_TRUE(scheduler.schedule(rank({&a}), always).empty());
}

TEST(SegmentSchedulerTest, RestoredSegmentsAreNotScheduled)
{
    segment_scheduler scheduler(3 * mib, mib, 3);
    scheduler.restore_verified(0, sha256_hash{});
    scheduler.restore_verified(0, sha256_hash{});
    EXPECT_EQ(scheduler.num_verified(), 1);
    EXPECT_EQ(scheduler.num_bytes_verified(), mib);

    const auto a = make_source("a");
    const auto assignments = scheduler.schedule(rank({&a}), always);
    ASSERT_EQ(assignments.size(), 1);
    EXPECT_EQ(assignments[0].segment, 1);
}

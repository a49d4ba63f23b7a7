#include <shoal/concurrency_governor.hpp>
#include <shoal/transfer_error.hpp>
#include <shoal/settings.hpp>
#include <gtest/gtest.h>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace shoal;

namespace {

governor_settings make_settings(const int max_active, const int max_per_source,
    const seconds timeout = seconds(30))
{
    governor_settings s;
    s.max_active_fetches = max_active;
    s.max_fetches_per_source = max_per_source;
    s.admission_timeout = timeout;
    return s;
}

/** Collects the results of async_acquire calls. */
struct acquire_results
{
    std::vector<admission_ticket> tickets;
    std::vector<std::error_code> errors;

    // Releasing a ticket may invoke another waiter's handler, which appends to
    // tickets, so it must not reallocate.
    acquire_results() { tickets.reserve(64); }

    /** Releases every held ticket. */
    void release_all()
    {
        auto held = std::move(tickets);
        tickets.clear();
        tickets.reserve(64);
        held.clear();
    }

    concurrency_governor::acquire_handler handler()
    {
        return [this](const std::error_code& error, admission_ticket ticket) {
            if(error) {
                errors.push_back(error);
            } else {
                tickets.push_back(std::move(ticket));
            }
        };
    }
};

} // namespace

class ConcurrencyGovernorTest : public ::testing::Test {
protected:
    asio::io_context ios;
};

TEST_F(ConcurrencyGovernorTest, GrantIsAsynchronous)
{
    concurrency_governor governor(ios, make_settings(4, 2));
    acquire_results results;
    governor.async_acquire("a", results.handler());
    EXPECT_TRUE(results.tickets.empty());
    EXPECT_EQ(governor.num_in_use(), 1);

    ios.poll();
    ASSERT_EQ(results.tickets.size(), 1);
    EXPECT_TRUE(results.tickets[0].is_valid());
    EXPECT_EQ(results.tickets[0].source(), "a");
}

TEST_F(ConcurrencyGovernorTest, PerSourceCapIsEnforced)
{
    concurrency_governor governor(ios, make_settings(10, 2));
    acquire_results results;
    for(auto i = 0; i < 3; ++i) {
        governor.async_acquire("a", results.handler());
    }
    governor.async_acquire("b", results.handler());
    ios.poll();

    EXPECT_EQ(results.tickets.size(), 3);
    EXPECT_EQ(governor.num_in_use("a"), 2);
    EXPECT_EQ(governor.num_in_use("b"), 1);
    EXPECT_EQ(governor.num_waiting(), 1);
    EXPECT_FALSE(governor.can_admit("a"));
    EXPECT_TRUE(governor.can_admit("b"));

    // releasing one of a's tickets admits the waiter right away
    results.tickets[0].release();
    EXPECT_EQ(results.tickets.size(), 4);
    EXPECT_EQ(governor.num_waiting(), 0);
    EXPECT_EQ(governor.num_in_use("a"), 2);
    EXPECT_EQ(governor.stats().peak_in_use_per_source, 2);
}

TEST_F(ConcurrencyGovernorTest, GlobalCapIsEnforcedAcrossSources)
{
    concurrency_governor governor(ios, make_settings(2, 2));
    acquire_results results;
    governor.async_acquire("a", results.handler());
    governor.async_acquire("b", results.handler());
    governor.async_acquire("c", results.handler());
    ios.poll();

    ASSERT_EQ(results.tickets.size(), 2);
    EXPECT_EQ(governor.num_in_use(), 2);
    EXPECT_FALSE(governor.can_admit("d"));
    EXPECT_FALSE(governor.try_acquire("d").is_valid());

    results.release_all();
    ASSERT_EQ(results.tickets.size(), 1);
    EXPECT_EQ(results.tickets[0].source(), "c");
    EXPECT_EQ(governor.stats().peak_in_use, 2);
}

TEST_F(ConcurrencyGovernorTest, WaitersAreServedInOrderSkippingSaturatedSources)
{
    concurrency_governor governor(ios, make_settings(2, 1));
    acquire_results results;
    governor.async_acquire("a", results.handler());
    governor.async_acquire("b", results.handler());
    ios.poll();
    ASSERT_EQ(results.tickets.size(), 2);

    // queued: a, c
    governor.async_acquire("a", results.handler());
    governor.async_acquire("c", results.handler());
    EXPECT_EQ(governor.num_waiting(), 2);

    // b's slot can't go to a, which is still saturated, so c gets it
    results.tickets[1].release();
    ASSERT_EQ(results.tickets.size(), 3);
    EXPECT_EQ(results.tickets[2].source(), "c");

    results.tickets[0].release();
    ASSERT_EQ(results.tickets.size(), 4);
    EXPECT_EQ(results.tickets[3].source(), "a");
    EXPECT_EQ(governor.num_waiting(), 0);
}

TEST_F(ConcurrencyGovernorTest, WaiterTimesOut)
{
    concurrency_governor governor(ios, make_settings(1, 1, seconds(1)));
    acquire_results results;
    governor.async_acquire("a", results.handler());
    governor.async_acquire("a", results.handler());
    ios.run_for(std::chrono::milliseconds(1500));

    ASSERT_EQ(results.tickets.size(), 1);
    ASSERT_EQ(results.errors.size(), 1);
    EXPECT_EQ(results.errors[0], transfer_errc::capacity_timeout);
    EXPECT_EQ(governor.num_waiting(), 0);
    EXPECT_EQ(governor.stats().num_timeouts, 1);
    EXPECT_TRUE(governor.can_admit("b") == false);
}

TEST_F(ConcurrencyGovernorTest, CancelledWaitersAreAborted)
{
    concurrency_governor governor(ios, make_settings(1, 1));
    acquire_results results;
    governor.async_acquire("a", results.handler());
    governor.async_acquire("b", results.handler());
    governor.async_acquire("c", results.handler());
    ios.poll();

    governor.cancel_waiters();
    ASSERT_EQ(results.errors.size(), 2);
    EXPECT_EQ(results.errors[0], transfer_errc::operation_aborted);
    EXPECT_EQ(results.errors[0], std::errc::operation_canceled);
    EXPECT_EQ(governor.num_waiting(), 0);

    // cancelled waiters are not granted later
    results.release_all();
    EXPECT_EQ(governor.num_in_use(), 0);
    ios.poll();
    EXPECT_TRUE(results.tickets.empty());
}

TEST_F(ConcurrencyGovernorTest, ShutdownAbortsNewRequests)
{
    concurrency_governor governor(ios, make_settings(4, 4));
    governor.shutdown();
    acquire_results results;
    governor.async_acquire("a", results.handler());
    ios.poll();
    ASSERT_EQ(results.errors.size(), 1);
    EXPECT_EQ(results.errors[0], transfer_errc::operation_aborted);
    EXPECT_FALSE(governor.can_admit("a"));
}

TEST_F(ConcurrencyGovernorTest, TicketIsReleasedExactlyOnce)
{
    concurrency_governor governor(ios, make_settings(4, 4));
    {
        auto ticket = governor.try_acquire("a");
        ASSERT_TRUE(ticket);
        admission_ticket moved(std::move(ticket));
        EXPECT_FALSE(ticket.is_valid());
        EXPECT_EQ(governor.num_in_use(), 1);

        moved.release();
        moved.release();
        EXPECT_EQ(governor.num_in_use(), 0);

        auto other = governor.try_acquire("b");
        EXPECT_EQ(governor.num_in_use(), 1);
        // assigning over a valid ticket releases it
        other = governor.try_acquire("c");
        EXPECT_EQ(governor.num_in_use(), 1);
        EXPECT_EQ(governor.num_in_use("b"), 0);
    }
    const auto stats = governor.stats();
    EXPECT_EQ(stats.num_acquires, 3);
    EXPECT_EQ(stats.num_releases, 3);
    EXPECT_EQ(stats.num_in_use, 0);
}

TEST_F(ConcurrencyGovernorTest, TicketMayOutliveGovernor)
{
    admission_ticket ticket;
    {
        concurrency_governor governor(ios, make_settings(1, 1));
        ticket = governor.try_acquire("a");
        ASSERT_TRUE(ticket);
    }
    ticket.release();
    EXPECT_FALSE(ticket.is_valid());
}

TEST_F(ConcurrencyGovernorTest, CapsHoldUnderConcurrentLoad)
{
    constexpr int max_active = 6;
    constexpr int max_per_source = 2;
    concurrency_governor governor(ios, make_settings(max_active, max_per_source));

    auto work = asio::make_work_guard(ios);
    std::vector<std::thread> threads;
    for(auto i = 0; i < 4; ++i) {
        threads.emplace_back([this] { ios.run(); });
    }

    std::atomic<int> num_done{0};
    std::atomic<int> num_in_use{0};
    std::atomic<int> peak_in_use{0};
    constexpr int num_requests = 400;
    const char* sources[] = {"a", "b", "c", "d", "e"};
    for(auto i = 0; i < num_requests; ++i) {
        governor.async_acquire(sources[i % 5],
            [&](const std::error_code& error, admission_ticket ticket) {
                if(!error) {
                    const int n = ++num_in_use;
                    int peak = peak_in_use;
                    while(n > peak && !peak_in_use.compare_exchange_weak(peak, n)) {}
                    std::this_thread::sleep_for(std::chrono::microseconds(200));
                    --num_in_use;
                    ticket.release();
                }
                ++num_done;
            });
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
    while(num_done < num_requests && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    work.reset();
    ios.stop();
    for(auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(num_done, num_requests);
    const auto stats = governor.stats();
    EXPECT_LE(stats.peak_in_use, max_active);
    EXPECT_LE(stats.peak_in_use_per_source, max_per_source);
    EXPECT_LE(peak_in_use, max_active);
    EXPECT_EQ(stats.num_acquires, num_requests);
    EXPECT_EQ(stats.num_releases, num_requests);
    EXPECT_EQ(stats.num_in_use, 0);
}

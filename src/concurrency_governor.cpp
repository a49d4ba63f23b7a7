#include "concurrency_governor.hpp"
#include "transfer_error.hpp"
#include "string_utils.hpp"
#include "log.hpp"

#include <algorithm>
#include <vector>

#include <asio/error.hpp>
#include <asio/post.hpp>

namespace shoal {
namespace detail {

struct governor_waiter
{
    source_id source;
    concurrency_governor::acquire_handler handler;
    deadline_timer timeout_timer;
    // Set under the state's mutex by whoever finishes the waiter (grant, timeout or
    // cancellation), which is also the only one to touch the timer afterwards.
    bool is_done = false;

    governor_waiter(asio::io_context& ios, source_id s,
        concurrency_governor::acquire_handler h)
        : source(std::move(s))
        , handler(std::move(h))
        , timeout_timer(ios)
    {}
};

struct governor_state : public std::enable_shared_from_this<governor_state>
{
    mutable std::mutex mutex;

    const int max_active_fetches;
    const int max_fetches_per_source;

    int num_in_use = 0;
    std::map<source_id, int> num_in_use_per_source;
    std::map<source_id, int> num_waiting_per_source;
    std::deque<std::shared_ptr<governor_waiter>> waiters;
    governor_stats stats;
    bool is_shut_down = false;

    governor_state(const int max_active, const int max_per_source)
        : max_active_fetches(max_active)
        , max_fetches_per_source(max_per_source)
    {}

    // Must be called with mutex held.
    bool has_capacity(const source_id& source) const
    {
        if(num_in_use >= max_active_fetches) {
            return false;
        }
        auto it = num_in_use_per_source.find(source);
        return it == num_in_use_per_source.end() || it->second < max_fetches_per_source;
    }

    // Must be called with mutex held.
    admission_ticket grant(const source_id& source)
    {
        ++num_in_use;
        const int n = ++num_in_use_per_source[source];
        ++stats.num_acquires;
        stats.peak_in_use = std::max(stats.peak_in_use, num_in_use);
        stats.peak_in_use_per_source = std::max(stats.peak_in_use_per_source, n);
        return admission_ticket(shared_from_this(), source);
    }

    // Must be called with mutex held.
    void remove_waiter(const std::shared_ptr<governor_waiter>& w)
    {
        auto it = std::find(waiters.begin(), waiters.end(), w);
        if(it != waiters.end()) {
            waiters.erase(it);
        }
        auto n = num_waiting_per_source.find(w->source);
        if(n != num_waiting_per_source.end() && --n->second == 0) {
            num_waiting_per_source.erase(n);
        }
    }

    void release(const source_id& source)
    {
        struct grant_t
        {
            std::shared_ptr<governor_waiter> waiter;
            admission_ticket ticket;
        };
        std::vector<grant_t> grants;

        std::unique_lock<std::mutex> l(mutex);
        --num_in_use;
        auto it = num_in_use_per_source.find(source);
        if(it != num_in_use_per_source.end() && --it->second == 0) {
            num_in_use_per_source.erase(it);
        }
        ++stats.num_releases;

        if(!is_shut_down) {
            // serve waiters in FIFO order, skipping those whose source is saturated
            for(auto w = waiters.begin(); w != waiters.end()
                    && num_in_use < max_active_fetches;) {
                auto waiter = *w;
                if(!has_capacity(waiter->source)) {
                    ++w;
                    continue;
                }
                waiter->is_done = true;
                auto ticket = grant(waiter->source);
                w = waiters.erase(w);
                auto n = num_waiting_per_source.find(waiter->source);
                if(n != num_waiting_per_source.end() && --n->second == 0) {
                    num_waiting_per_source.erase(n);
                }
                grants.push_back({std::move(waiter), std::move(ticket)});
            }
        }
        l.unlock();

        for(auto& g : grants) {
            g.waiter->timeout_timer.cancel();
            auto handler = std::move(g.waiter->handler);
            handler(std::error_code(), std::move(g.ticket));
        }
    }
};

} // namespace detail

// ----------------------
// -- admission_ticket --
// ----------------------

admission_ticket::admission_ticket(admission_ticket&& other) noexcept
    : state_(std::move(other.state_))
    , source_(std::move(other.source_))
{
    other.state_.reset();
}

admission_ticket& admission_ticket::operator=(admission_ticket&& other) noexcept
{
    if(this != &other) {
        release();
        state_ = std::move(other.state_);
        source_ = std::move(other.source_);
        other.state_.reset();
    }
    return *this;
}

admission_ticket::~admission_ticket()
{
    release();
}

void admission_ticket::release()
{
    if(state_) {
        auto state = std::move(state_);
        state_.reset();
        state->release(source_);
    }
}

// --------------------------
// -- concurrency_governor --
// --------------------------

concurrency_governor::concurrency_governor(
    asio::io_context& ios, const governor_settings& settings)
    : ios_(ios)
    , state_(std::make_shared<detail::governor_state>(
        settings.max_active_fetches, settings.max_fetches_per_source))
    , admission_timeout_(settings.admission_timeout)
{}

concurrency_governor::~concurrency_governor()
{
    shutdown();
}

void concurrency_governor::async_acquire(const source_id& source, acquire_handler handler)
{
    std::unique_lock<std::mutex> l(state_->mutex);
    if(state_->is_shut_down) {
        l.unlock();
        asio::post(ios_, [handler = std::move(handler)] {
            handler(transfer_errc::operation_aborted, admission_ticket());
        });
        return;
    }

    if(state_->has_capacity(source)) {
        auto ticket = state_->grant(source);
        l.unlock();
        asio::post(ios_, [handler = std::move(handler),
            ticket = std::move(ticket)]() mutable {
            handler(std::error_code(), std::move(ticket));
        });
        return;
    }

    auto waiter = std::make_shared<detail::governor_waiter>(
        ios_, source, std::move(handler));
    std::weak_ptr<detail::governor_state> weak_state = state_;
    waiter->timeout_timer.expires_after(admission_timeout_);
    const auto timeout_s = to_int<seconds>(admission_timeout_);
    waiter->timeout_timer.async_wait(
        [weak_state, waiter, timeout_s](const std::error_code& error) {
        if(error == asio::error::operation_aborted) {
            return;
        }
        auto state = weak_state.lock();
        if(!state) {
            return;
        }
        std::unique_lock<std::mutex> l(state->mutex);
        if(waiter->is_done) {
            return;
        }
        waiter->is_done = true;
        state->remove_waiter(waiter);
        ++state->stats.num_timeouts;
        l.unlock();

        log::log_governor("TIMEOUT", util::format("%s got no ticket in %llis",
            waiter->source.c_str(), static_cast<long long>(timeout_s)));
        auto handler = std::move(waiter->handler);
        handler(transfer_errc::capacity_timeout, admission_ticket());
    });
    state_->waiters.push_back(waiter);
    ++state_->num_waiting_per_source[source];
}

admission_ticket concurrency_governor::try_acquire(const source_id& source)
{
    std::lock_guard<std::mutex> l(state_->mutex);
    if(state_->is_shut_down || !state_->has_capacity(source)) {
        return {};
    }
    return state_->grant(source);
}

bool concurrency_governor::can_admit(const source_id& source) const
{
    std::lock_guard<std::mutex> l(state_->mutex);
    if(state_->is_shut_down) {
        return false;
    }
    const int num_waiting = state_->waiters.size();
    if(state_->num_in_use + num_waiting >= state_->max_active_fetches) {
        return false;
    }
    int n = 0;
    auto it = state_->num_in_use_per_source.find(source);
    if(it != state_->num_in_use_per_source.end()) {
        n += it->second;
    }
    it = state_->num_waiting_per_source.find(source);
    if(it != state_->num_waiting_per_source.end()) {
        n += it->second;
    }
    return n < state_->max_fetches_per_source;
}

void concurrency_governor::cancel_waiters()
{
    std::deque<std::shared_ptr<detail::governor_waiter>> waiters;
    {
        std::lock_guard<std::mutex> l(state_->mutex);
        waiters.swap(state_->waiters);
        state_->num_waiting_per_source.clear();
        for(auto& w : waiters) {
            w->is_done = true;
        }
    }
    if(!waiters.empty()) {
        log::log_governor("CANCEL", util::format("cancelling %i waiters",
            int(waiters.size())));
    }
    for(auto& w : waiters) {
        w->timeout_timer.cancel();
        auto handler = std::move(w->handler);
        handler(transfer_errc::operation_aborted, admission_ticket());
    }
}

void concurrency_governor::shutdown()
{
    {
        std::lock_guard<std::mutex> l(state_->mutex);
        state_->is_shut_down = true;
    }
    cancel_waiters();
}

int concurrency_governor::num_in_use() const
{
    std::lock_guard<std::mutex> l(state_->mutex);
    return state_->num_in_use;
}

int concurrency_governor::num_in_use(const source_id& source) const
{
    std::lock_guard<std::mutex> l(state_->mutex);
    auto it = state_->num_in_use_per_source.find(source);
    return it != state_->num_in_use_per_source.end() ? it->second : 0;
}

int concurrency_governor::num_waiting() const
{
    std::lock_guard<std::mutex> l(state_->mutex);
    return state_->waiters.size();
}

governor_stats concurrency_governor::stats() const
{
    std::lock_guard<std::mutex> l(state_->mutex);
    governor_stats s = state_->stats;
    s.num_in_use = state_->num_in_use;
    s.num_waiting = state_->waiters.size();
    return s;
}

int concurrency_governor::max_active_fetches() const noexcept
{
    return state_->max_active_fetches;
}

int concurrency_governor::max_fetches_per_source() const noexcept
{
    return state_->max_fetches_per_source;
}

} // namespace shoal

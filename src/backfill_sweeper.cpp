#include "backfill_sweeper.hpp"
#include "source_discovery.hpp"
#include "string_utils.hpp"
#include "transfer.hpp"
#include "log.hpp"

#include <algorithm>

#include <asio/error.hpp>

namespace shoal {

backfill_sweeper::backfill_sweeper(asio::io_context& ios, source_discovery& discovery,
    const duration interval)
    : ios_(ios)
    , discovery_(discovery)
    , interval_(interval)
    , timer_(ios)
{}

void backfill_sweeper::start()
{
    if(is_running_) {
        return;
    }
    is_running_ = true;
    schedule_sweep();
}

void backfill_sweeper::stop()
{
    is_running_ = false;
    timer_.cancel();
}

void backfill_sweeper::add(std::weak_ptr<transfer> t)
{
    std::lock_guard<std::mutex> l(transfers_mutex_);
    transfers_.emplace_back(std::move(t));
}

int backfill_sweeper::num_tracked() const
{
    std::lock_guard<std::mutex> l(transfers_mutex_);
    return transfers_.size();
}

int backfill_sweeper::sweep()
{
    std::vector<std::shared_ptr<transfer>> needy;
    {
        std::lock_guard<std::mutex> l(transfers_mutex_);
        transfers_.erase(std::remove_if(transfers_.begin(), transfers_.end(),
            [](const auto& t) { return t.expired(); }), transfers_.end());
        for(const auto& wt : transfers_) {
            auto t = wt.lock();
            if(t && t->status().needs_sources()) {
                needy.emplace_back(std::move(t));
            }
        }
    }

    for(auto& t : needy) {
        std::weak_ptr<transfer> wt = t;
        discovery_.async_discover(t->file(),
            [wt](std::vector<discovered_source> sources) {
                if(auto t = wt.lock()) {
                    t->backfill(std::move(sources));
                }
            });
    }
    if(!needy.empty()) {
        log::log_engine("BACKFILL", util::format("querying discovery for %i transfers",
            int(needy.size())));
    }
    return needy.size();
}

void backfill_sweeper::schedule_sweep()
{
    start_timer(timer_, interval_, [this](const std::error_code& error) {
        if((error == asio::error::operation_aborted) || !is_running_) {
            return;
        }
        sweep();
        schedule_sweep();
    });
}

} // namespace shoal

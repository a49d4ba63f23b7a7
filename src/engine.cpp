#include "source_discovery.hpp"
#include "sha256_hasher.hpp"
#include "string_utils.hpp"
#include "peer_client.hpp"
#include "transfer.hpp"
#include "engine.hpp"
#include "log.hpp"

#include <algorithm>
#include <stdexcept>

#include <asio/error.hpp>
#include <asio/post.hpp>

namespace shoal {

namespace {
// The hash store is saved at most this often while the engine is running.
constexpr auto hash_store_save_interval = seconds(30);
constexpr auto engine_update_interval = seconds(1);
} // namespace

engine::engine(peer_client& peer_client, source_discovery& discovery, settings s)
    : settings_(prepare_settings(std::move(s)))
    , peer_client_(peer_client)
    , discovery_(discovery)
    , work_(asio::make_work_guard(ios_))
    , governor_(ios_, settings_.governor)
    , cpu_pool_(settings_.engine.hashing_threads)
    , alert_queue_(settings_.engine.max_alerts)
    , backfill_(ios_, discovery_, settings_.engine.backfill_interval)
    , update_timer_(ios_)
    , last_hash_store_save_time_(clock::now())
{
    if(!settings_.engine.hash_store_path.empty()) {
        std::error_code error;
        hash_store_.load(settings_.engine.hash_store_path, error);
        if(error) {
            log::log_engine("HASH STORE", util::format("couldn't load %s: %s",
                settings_.engine.hash_store_path.c_str(), error.message().c_str()),
                log::priority::high);
        }
    }

    asio::post(ios_, [this] {
        backfill_.start();
        update();
    });
    for(auto i = 0; i < settings_.engine.network_threads; ++i) {
        network_threads_.emplace_back([this] { ios_.run(); });
    }
    log::log_engine("ENGINE", util::format("started with %i network and %i hashing"
        " threads", settings_.engine.network_threads, settings_.engine.hashing_threads));
}

engine::~engine()
{
    // Waiters are failed first so that no fetch is admitted while shutting down.
    // Verified segments are persisted as they are verified, so cancelling the
    // transfers is only a courtesy to those that can finish before the threads stop.
    governor_.shutdown();
    {
        std::lock_guard<std::mutex> l(transfers_mutex_);
        for(auto& entry : transfers_) {
            entry.second->cancel();
        }
    }
    work_.reset();
    ios_.stop();
    for(auto& t : network_threads_) {
        if(t.joinable()) {
            t.join();
        }
    }
    backfill_.stop();
    update_timer_.cancel();
    cpu_pool_.join();
    save_hash_store();
    log::log_engine("ENGINE", "stopped");
    log::flush();
}

settings engine::prepare_settings(settings s)
{
    fill_in_defaults(s);
    verify(s);
    return s;
}

template<typename T, typename String>
void throw_if_below(const T& v, const T& min, const String& msg)
{
    if((v != values::none) && (v < min)) throw std::invalid_argument(msg);
}

template<typename String>
void throw_if_not_positive(const duration& d, const String& msg)
{
    if(d <= duration::zero()) throw std::invalid_argument(msg);
}

void engine::verify(const settings& s)
{
    throw_if_below(s.engine.network_threads, 1,
        "engine_settings::network_threads must be none or above 0");
    throw_if_below(s.engine.hashing_threads, 1,
        "engine_settings::hashing_threads must be none or above 0");
    throw_if_below(s.engine.max_alerts, 1,
        "engine_settings::max_alerts must be above 0");
    throw_if_not_positive(s.engine.backfill_interval,
        "engine_settings::backfill_interval must be positive");
    if(s.engine.resume_data_path.empty()) throw std::invalid_argument(
        "engine_settings::resume_data_path must not be empty");

    throw_if_below(s.governor.max_active_fetches, 1,
        "governor_settings::max_active_fetches must be above 0");
    throw_if_below(s.governor.max_fetches_per_source, 1,
        "governor_settings::max_fetches_per_source must be above 0");
    throw_if_not_positive(s.governor.admission_timeout,
        "governor_settings::admission_timeout must be positive");

    const auto& t = s.transfer;
    throw_if_below(t.segment_size, 1, "transfer_settings::segment_size must be above 0");
    throw_if_below(t.max_segment_retries, 1,
        "transfer_settings::max_segment_retries must be above 0");
    throw_if_below(t.suspect_failure_limit, 0,
        "transfer_settings::suspect_failure_limit must be 0 or more");
    throw_if_below(t.mismatch_penalty, 0,
        "transfer_settings::mismatch_penalty must be 0 or more");
    throw_if_below(t.eviction_failure_threshold, 1,
        "transfer_settings::eviction_failure_threshold must be above 0");
    throw_if_not_positive(t.stall_timeout,
        "transfer_settings::stall_timeout must be positive");
    throw_if_not_positive(t.segment_timeout,
        "transfer_settings::segment_timeout must be positive");
    throw_if_not_positive(t.update_interval,
        "transfer_settings::update_interval must be positive");
    if(t.save_path.empty()) throw std::invalid_argument(
        "transfer_settings::save_path must not be empty");

    const auto& w = t.ranking;
    if((w.throughput < 0) || (w.success_ratio < 0) || (w.latency < 0) || (w.recency < 0)
            || (w.throughput + w.success_ratio + w.latency + w.recency <= 0)) {
        throw std::invalid_argument("ranking_weights must be non-negative and not all 0");
    }
    throw_if_not_positive(w.reference_rtt, "ranking_weights::reference_rtt must be positive");
    throw_if_not_positive(w.recency_half_life,
        "ranking_weights::recency_half_life must be positive");
}

void engine::fill_in_defaults(settings& s)
{
    using values::none;

    auto set_if_none = [](auto& setting, auto val) { if(setting == none) setting = val; };

    const int num_cores = std::max(1u, std::thread::hardware_concurrency());
    set_if_none(s.engine.network_threads, 1);
    set_if_none(s.engine.hashing_threads, num_cores);
    set_if_none(s.engine.max_alerts, 1000);

    set_if_none(s.governor.max_active_fetches, 32);
    set_if_none(s.governor.max_fetches_per_source, 4);

    set_if_none(s.transfer.segment_size, 1024 * 1024);
    set_if_none(s.transfer.max_segment_retries, 3);
    set_if_none(s.transfer.suspect_failure_limit, 5);
    set_if_none(s.transfer.mismatch_penalty, 2);
    set_if_none(s.transfer.eviction_failure_threshold, 20);
}

transfer_id_t engine::start_transfer(file_id file,
    std::vector<sha256_hash> segment_digests)
{
    if(file.name.empty()) {
        throw std::invalid_argument("file_id::name must not be empty");
    }
    if(file.size <= 0) {
        throw std::invalid_argument("file_id::size must be positive");
    }

    transfer_args args;
    args.resume_data_path = resume_data_path(file);
    args.file = std::move(file);
    args.segment_digests = std::move(segment_digests);

    std::lock_guard<std::mutex> l(transfers_mutex_);
    const auto id = next_transfer_id_;
    // Throws if the digests don't match the segment layout, in which case the id is
    // not consumed.
    auto t = std::make_shared<transfer>(id, ios_, governor_, hash_store_, cpu_pool_,
        peer_client_, discovery_, alert_queue_, settings_.transfer, std::move(args));
    ++next_transfer_id_;
    transfers_.emplace(id, t);
    backfill_.add(t);
    t->start();
    log::log_engine("ENGINE", util::format("started transfer %i for %s (%lli bytes)",
        id, t->file().name.c_str(), static_cast<long long>(t->file().size)));
    return id;
}

void engine::cancel_transfer(const transfer_id_t id)
{
    std::lock_guard<std::mutex> l(transfers_mutex_);
    auto it = transfers_.find(id);
    if(it != transfers_.end()) {
        it->second->cancel();
    }
}

transfer_status engine::get_status(const transfer_id_t id) const
{
    std::lock_guard<std::mutex> l(transfers_mutex_);
    auto it = transfers_.find(id);
    if(it != transfers_.end()) {
        return it->second->status();
    }
    auto archived = archived_statuses_.find(id);
    if(archived != archived_statuses_.end()) {
        return archived->second;
    }
    throw std::invalid_argument("unknown transfer id");
}

std::vector<transfer_status> engine::statuses() const
{
    std::lock_guard<std::mutex> l(transfers_mutex_);
    std::vector<transfer_status> result;
    result.reserve(transfers_.size() + archived_statuses_.size());
    for(const auto& entry : archived_statuses_) {
        result.emplace_back(entry.second);
    }
    for(const auto& entry : transfers_) {
        result.emplace_back(entry.second->status());
    }
    std::sort(result.begin(), result.end(),
        [](const auto& a, const auto& b) { return a.id < b.id; });
    return result;
}

void engine::sweep_backfill()
{
    asio::post(ios_, [this] { backfill_.sweep(); });
}

std::deque<std::unique_ptr<alert>> engine::alerts()
{
    return alert_queue_.extract_alerts();
}

governor_stats engine::get_governor_stats() const
{
    return governor_.stats();
}

int engine::num_known_digests() const
{
    return hash_store_.size();
}

path engine::resume_data_path(const file_id& file) const
{
    // file names may contain anything, so the resume file is named after a digest of
    // the file's identity
    const auto key = file.key();
    const auto digest = create_sha256_digest(
        reinterpret_cast<const uint8_t*>(key.data()), key.length());
    return settings_.engine.resume_data_path / (util::to_hex(digest) + ".resume");
}

void engine::update()
{
    archive_finished_transfers();
    if(clock::now() - last_hash_store_save_time_ >= hash_store_save_interval) {
        save_hash_store();
    }
    start_timer(update_timer_, engine_update_interval, [this](const std::error_code& error) {
        if(error != asio::error::operation_aborted) {
            update();
        }
    });
}

void engine::archive_finished_transfers()
{
    std::lock_guard<std::mutex> l(transfers_mutex_);
    for(auto it = transfers_.begin(); it != transfers_.end();) {
        const auto status = it->second->status();
        // stalled transfers may still be revived by backfill
        if(status.is_terminal() && !status.is_stalled()) {
            log::log_engine("ENGINE", util::format("transfer %i %s", it->first,
                to_string(status.state)));
            archived_statuses_.emplace(it->first, status);
            it = transfers_.erase(it);
        } else {
            ++it;
        }
    }
}

void engine::save_hash_store()
{
    last_hash_store_save_time_ = clock::now();
    if(settings_.engine.hash_store_path.empty()) {
        return;
    }
    std::error_code error;
    hash_store_.save(settings_.engine.hash_store_path, error);
    if(error) {
        log::log_engine("HASH STORE", util::format("couldn't save %s: %s",
            settings_.engine.hash_store_path.c_str(), error.message().c_str()),
            log::priority::high);
    }
}

} // namespace shoal

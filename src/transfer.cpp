#include "transfer.hpp"
#include "source_discovery.hpp"
#include "transfer_error.hpp"
#include "sha256_hasher.hpp"
#include "source_ranker.hpp"
#include "string_utils.hpp"
#include "alert_queue.hpp"
#include "peer_client.hpp"
#include "thread_pool.hpp"
#include "hash_store.hpp"
#include "bencode.hpp"
#include "bdecode.hpp"

#include <algorithm>
#include <stdexcept>
#include <cstring>

#include <asio/bind_executor.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>

namespace shoal {

#define SHARED_THIS this, self(shared_from_this())

/** A single attempt at downloading a segment from a source. */
struct transfer::segment_fetch
{
    segment_assignment assignment;
    admission_ticket ticket;
    segment_buffer buffer;
    deadline_timer timeout_timer;
    std::shared_ptr<peer_connection> connection;

    time_point start_time;
    time_point connected_time;

    // These are written by the peer client's thread while the range is streamed, and
    // only read on the strand after the completion handler has been posted to it.
    int num_received = 0;
    bool has_overflowed = false;

    // Set on the strand once the fetch has completed, failed or timed out, after which
    // any further event for this fetch is ignored.
    bool is_done = false;

    segment_fetch(asio::io_context& ios, segment_assignment a, admission_ticket t)
        : assignment(std::move(a))
        , ticket(std::move(t))
        , timeout_timer(ios)
    {}

    void append(const uint8_t* data, const int length)
    {
        if(has_overflowed || (num_received + length > buffer.size())) {
            has_overflowed = true;
            return;
        }
        std::memcpy(buffer.data() + num_received, data, length);
        num_received += length;
    }
};

transfer::transfer(transfer_id_t id,
    asio::io_context& ios,
    concurrency_governor& governor,
    hash_store& hash_store,
    thread_pool& cpu_pool,
    peer_client& peer_client,
    source_discovery& discovery,
    alert_queue& alert_queue,
    const transfer_settings& settings,
    transfer_args args)
    : ios_(ios)
    , strand_(asio::make_strand(ios))
    , governor_(governor)
    , hash_store_(hash_store)
    , cpu_pool_(cpu_pool)
    , peer_client_(peer_client)
    , discovery_(discovery)
    , alert_queue_(alert_queue)
    , id_(id)
    , file_(args.file)
    , settings_(settings)
    , expected_digests_(std::move(args.segment_digests))
    , sources_(settings)
    , scheduler_(args.file.size, settings.segment_size, settings.max_segment_retries)
    , storage_(settings.save_path / util::remote_file_name(args.file.name),
        std::move(args.resume_data_path), args.file.size)
    , buffer_pool_(std::make_shared<segment_buffer_pool>(settings.segment_size))
    , update_timer_(ios)
{
    if(!expected_digests_.empty()
            && int(expected_digests_.size()) != scheduler_.num_segments()) {
        throw std::invalid_argument("transfer_args::segment_digests must have one"
            " digest per segment");
    }
    ts_status_.id = id_;
    ts_status_.file = file_;
    ts_status_.total_bytes = file_.size;
    ts_status_.num_segments = scheduler_.num_segments();
    ts_status_.num_unclaimed_segments = scheduler_.num_segments();
}

void transfer::start()
{
    asio::post(strand_, [SHARED_THIS] { do_start(); });
}

void transfer::cancel()
{
    asio::post(strand_, [SHARED_THIS] { do_cancel(); });
}

void transfer::backfill(std::vector<discovered_source> sources)
{
    asio::post(strand_, [this, self = shared_from_this(), s = std::move(sources)]() mutable {
        add_sources(std::move(s), true);
    });
}

transfer_status transfer::status() const
{
    std::lock_guard<std::mutex> l(ts_status_mutex_);
    return ts_status_;
}

void transfer::do_start()
{
    if(is_started_) {
        return;
    }
    is_started_ = true;
    start_time_ = last_progress_time_ = clock::now();
    log(log_event::state, "starting %s (%lli bytes, %i segments)", file_.name.c_str(),
        static_cast<long long>(file_.size), scheduler_.num_segments());

    // resume data is only valid if its partial file survived too
    const bool had_part_file = storage_.is_allocated();
    std::error_code error;
    storage_.allocate(error);
    if(error) {
        log(log_event::disk, log::priority::high, "couldn't allocate %s: %s",
            storage_.part_path().c_str(), error.message().c_str());
        fail(error);
        return;
    }
    if(had_part_file) {
        restore_resume_data();
        if(recheck_part_file()) {
            update_status();
            return;
        }
    }
    begin_fetching();
}

void transfer::begin_fetching()
{
    update_status();
    if(scheduler_.is_complete()) {
        finalize();
        return;
    }

    discovery_.async_discover(file_,
        [SHARED_THIS](std::vector<discovered_source> sources) {
            asio::post(strand_, [this, self, s = std::move(sources)]() mutable {
                add_sources(std::move(s), false);
            });
        });
    update();
}

bool transfer::recheck_part_file()
{
    struct candidate
    {
        segment_index_t index;
        int64_t offset;
        int length;
        sha256_hash digest;
    };

    std::vector<candidate> candidates;
    for(const auto& segment : scheduler_.segments()) {
        if(segment.state == segment_scheduler::segment_state::verified) {
            continue;
        }
        sha256_hash digest;
        if(!expected_digests_.empty()) {
            digest = expected_digests_[segment.index];
        } else if(!hash_store_.lookup(file_, segment.offset, segment.length, digest)) {
            continue;
        }
        candidates.push_back({segment.index, segment.offset, segment.length, digest});
    }
    if(candidates.empty()) {
        return false;
    }

    is_checking_part_file_ = true;
    log(log_event::disk, "checking %i segments of the partial file against known digests",
        int(candidates.size()));
    cpu_pool_.post([SHARED_THIS, candidates = std::move(candidates)] {
        std::vector<std::pair<segment_index_t, sha256_hash>> matches;
        std::vector<uint8_t> buffer;
        for(const auto& c : candidates) {
            buffer.resize(c.length);
            std::error_code error;
            storage_.read(c.offset, buffer.data(), c.length, error);
            if(error) {
                log(log_event::disk, log::priority::high,
                    "couldn't read segment %i of the partial file: %s", c.index,
                    error.message().c_str());
                break;
            }
            if(create_sha256_digest(buffer.data(), c.length) == c.digest) {
                matches.emplace_back(c.index, c.digest);
            }
        }
        asio::post(strand_, [this, self, matches = std::move(matches)] {
            on_part_file_checked(matches);
        });
    });
    return true;
}

void transfer::on_part_file_checked(
    const std::vector<std::pair<segment_index_t, sha256_hash>>& matches)
{
    is_checking_part_file_ = false;
    if(is_terminal(state_)) {
        return;
    }
    for(const auto& m : matches) {
        if(!expected_digests_.empty()
                && hash_store_.record(file_, scheduler_[m.first].offset,
                    scheduler_[m.first].length, m.second)) {
            log(log_event::disk, log::priority::high,
                "hash store disagrees with known digest of segment %i", m.first);
        }
        scheduler_.restore_verified(m.first, m.second);
    }
    if(!matches.empty()) {
        has_state_changed_ = true;
    }
    log(log_event::disk, "%i segments of the partial file are intact",
        int(matches.size()));
    begin_fetching();
}

void transfer::do_cancel()
{
    if(is_terminal(state_) || is_cancelling_) {
        return;
    }
    log(log_event::state, "cancelling with %i fetches in flight", int(fetches_.size()));
    is_cancelling_ = true;
    update_timer_.cancel();
    try_finish_cancel();
}

void transfer::add_sources(std::vector<discovered_source> sources, const bool is_backfill)
{
    const bool is_stalled = (state_ == transfer_state::failed)
        && (error_ == transfer_errc::transfer_stalled);
    if((is_terminal(state_) && !is_stalled) || is_cancelling_) {
        return;
    }

    const auto now = clock::now();
    int num_new = 0;
    for(const auto& s : sources) {
        if(sources_.register_source(s, now)) {
            ++num_new;
        }
    }
    const int num_reopened = is_backfill ? scheduler_.reopen_failed(sources_.list()) : 0;
    log(log_event::source, "%i sources found (%i new), %i failed segments reopened",
        int(sources.size()), num_new, num_reopened);

    if(is_stalled) {
        if((num_new == 0) && (num_reopened == 0)) {
            return;
        }
        state_ = fetches_.empty() && scheduler_.num_verified() == 0
            ? transfer_state::pending : transfer_state::active;
        error_.clear();
        last_progress_time_ = now;
        log(log_event::state, "revived stalled transfer with %i new sources", num_new);
        alert_queue_.emplace<transfer_resumed_alert>(id_, file_, num_new);
    }
    update_status();
    if(is_started_) {
        update();
    }
}

void transfer::update()
{
    if(is_terminal(state_) || is_finalizing_ || !is_started_ || is_checking_part_file_) {
        return;
    }
    if(is_cancelling_) {
        try_finish_cancel();
        return;
    }

    const auto now = clock::now();
    sources_.refresh(now);

    const auto ranking = rank_sources(sources_.list(), settings_.ranking, now);
    const auto assignments = scheduler_.schedule(ranking,
        [this](const source& s) { return governor_.can_admit(s.id); });
    for(const auto& a : assignments) {
        dispatch(a);
    }

    // Running out of capacity only defers segments, so the transfer stalls only if no
    // eligible source covers any of the open segments.
    if(assignments.empty() && fetches_.empty() && (num_pending_acquires_ == 0)
            && !scheduler_.has_candidate(ranking)
            && (now - last_progress_time_ >= settings_.stall_timeout)) {
        log(log_event::update, log::priority::high,
            "stalled: no segment verified in %llis, %i eligible sources",
            static_cast<long long>(to_int<seconds>(now - last_progress_time_)),
            sources_.num_eligible_sources());
        fail(transfer_errc::transfer_stalled);
        return;
    }

    if(has_state_changed_) {
        save_resume_data();
    }
    update_status();
    schedule_update();
}

void transfer::schedule_update()
{
    start_timer(update_timer_, settings_.update_interval, asio::bind_executor(strand_,
        [SHARED_THIS](const std::error_code& error) {
            if(error != asio::error::operation_aborted) {
                update();
            }
        }));
}

void transfer::dispatch(const segment_assignment& assignment)
{
    log(log_event::fetch, "claimed segment %i for %s", assignment.segment,
        assignment.source.c_str());
    ++num_pending_acquires_;
    governor_.async_acquire(assignment.source, [SHARED_THIS, assignment](
        const std::error_code& error, admission_ticket ticket) {
        asio::post(strand_, [this, self, assignment, error,
            ticket = std::move(ticket)]() mutable {
            on_admitted(assignment, error, std::move(ticket));
        });
    });
}

void transfer::on_admitted(const segment_assignment& assignment,
    const std::error_code& error, admission_ticket ticket)
{
    --num_pending_acquires_;
    if(error) {
        log(log_event::fetch, "no ticket for segment %i from %s: %s",
            assignment.segment, assignment.source.c_str(), error.message().c_str());
        scheduler_.release_claim(assignment.segment);
        if(is_cancelling_) {
            try_finish_cancel();
        } else if(is_terminal(state_)) {
            update_status();
        }
        return;
    }

    if(is_cancelling_ || is_terminal(state_)) {
        ticket.release();
        scheduler_.release_claim(assignment.segment);
        if(is_cancelling_) {
            try_finish_cancel();
        } else {
            update_status();
        }
        return;
    }

    auto fetch = std::make_shared<segment_fetch>(ios_, assignment, std::move(ticket));
    try {
        fetch->buffer = buffer_pool_->allocate(assignment.length);
    } catch(const std::bad_alloc&) {
        log(log_event::fetch, log::priority::high,
            "couldn't allocate buffer for segment %i", assignment.segment);
        fetch->ticket.release();
        scheduler_.release_claim(assignment.segment);
        return;
    }

    if(state_ == transfer_state::pending) {
        state_ = transfer_state::active;
        log(log_event::state, "active");
    }
    fetch->start_time = clock::now();
    fetches_.emplace(assignment.segment, fetch);
    sources_.on_fetch_started(assignment.source);

    start_timer(fetch->timeout_timer, settings_.segment_timeout,
        asio::bind_executor(strand_, [SHARED_THIS, fetch](const std::error_code& error) {
            if(error != asio::error::operation_aborted) {
                on_fetch_timeout(fetch);
            }
        }));

    peer_client_.async_connect(assignment.source, [SHARED_THIS, fetch](
        const std::error_code& error, std::shared_ptr<peer_connection> connection) {
        asio::post(strand_, [this, self, fetch, error,
            connection = std::move(connection)]() mutable {
            on_connected(fetch, error, std::move(connection));
        });
    });
    update_status();
}

void transfer::on_connected(std::shared_ptr<segment_fetch> fetch,
    const std::error_code& error, std::shared_ptr<peer_connection> connection)
{
    if(fetch->is_done) {
        return;
    }
    if(error) {
        on_fetch_failed(std::move(fetch), error);
        return;
    }
    if(is_cancelling_) {
        abort_fetch(std::move(fetch));
        return;
    }

    fetch->connected_time = clock::now();
    fetch->connection = connection;
    const auto& a = fetch->assignment;
    peer_client_.async_request_range(std::move(connection), file_, a.offset, a.length,
        [fetch](const uint8_t* data, int length) { fetch->append(data, length); },
        [SHARED_THIS, fetch](const std::error_code& error) {
            asio::post(strand_, [this, self, fetch, error] {
                on_range_received(fetch, error);
            });
        });
}

void transfer::on_range_received(std::shared_ptr<segment_fetch> fetch,
    const std::error_code& error)
{
    if(fetch->is_done) {
        return;
    }
    fetch->connection.reset();
    if(error) {
        on_fetch_failed(std::move(fetch), error);
        return;
    }
    if(fetch->has_overflowed || (fetch->num_received != fetch->assignment.length)) {
        log(log_event::fetch, "%s sent %i bytes of segment %i (%i expected)",
            fetch->assignment.source.c_str(), fetch->num_received,
            fetch->assignment.segment, fetch->assignment.length);
        on_fetch_failed(std::move(fetch), transfer_errc::segment_length_mismatch);
        return;
    }

    fetch->is_done = true;
    fetch->timeout_timer.cancel();
    if(is_cancelling_) {
        abort_fetch(std::move(fetch));
        return;
    }
    scheduler_.mark_verifying(fetch->assignment.segment);
    verify_and_write(std::move(fetch));
}

void transfer::on_fetch_timeout(std::shared_ptr<segment_fetch> fetch)
{
    if(fetch->is_done) {
        return;
    }
    log(log_event::fetch, "segment %i from %s timed out", fetch->assignment.segment,
        fetch->assignment.source.c_str());
    on_fetch_failed(std::move(fetch), transfer_errc::segment_timeout);
}

void transfer::on_fetch_failed(std::shared_ptr<segment_fetch> fetch,
    const std::error_code& error)
{
    fetch->is_done = true;
    fetch->timeout_timer.cancel();
    fetch->connection.reset();
    finish_fetch(*fetch);

    const auto& a = fetch->assignment;
    const bool is_permanent = scheduler_.mark_failed(a.segment);
    sources_.update(a.source, fetch_outcome::failure(error));
    log(log_event::fetch, "segment %i from %s failed: %s%s", a.segment,
        a.source.c_str(), error.message().c_str(),
        is_permanent ? " (no retries left)" : "");
    after_fetch_finished();
}

void transfer::verify_and_write(std::shared_ptr<segment_fetch> fetch)
{
    const auto segment = fetch->assignment.segment;
    const bool has_expected_digest = !expected_digests_.empty();
    const sha256_hash expected = has_expected_digest
        ? expected_digests_[segment] : sha256_hash();

    cpu_pool_.post([SHARED_THIS, fetch, has_expected_digest, expected] {
        const auto& a = fetch->assignment;
        const auto digest = create_sha256_digest(fetch->buffer.data(), fetch->buffer.size());

        std::error_code error;
        if(has_expected_digest) {
            if(digest != expected) {
                error = transfer_errc::verification_mismatch;
            } else if(hash_store_.record(file_, a.offset, a.length, digest)) {
                // the bytes match what the caller expects, so whatever the store had
                // recorded is what was wrong
                log(log_event::verify, log::priority::high,
                    "hash store disagrees with known digest of segment %i", a.segment);
            }
        } else {
            error = hash_store_.record(file_, a.offset, a.length, digest);
        }

        if(!error) {
            storage_.write(a.offset, fetch->buffer.data(), fetch->buffer.size(), error);
        }

        asio::post(strand_, [this, self, fetch, error, digest] {
            on_segment_processed(fetch, error, digest);
        });
    });
}

void transfer::on_segment_processed(std::shared_ptr<segment_fetch> fetch,
    const std::error_code& error, const sha256_hash& digest)
{
    finish_fetch(*fetch);
    const auto& a = fetch->assignment;
    const auto now = clock::now();

    if(!error) {
        scheduler_.mark_verified(a.segment, digest);
        sources_.update(a.source, fetch_outcome::success(a.length,
            now - fetch->start_time, fetch->connected_time - fetch->start_time), now);
        last_progress_time_ = now;
        has_state_changed_ = true;
        log(log_event::verify, "segment %i from %s verified (%i/%i)", a.segment,
            a.source.c_str(), scheduler_.num_verified(), scheduler_.num_segments());
    } else if(error == transfer_errc::storage_error) {
        log(log_event::disk, log::priority::high, "couldn't write segment %i",
            a.segment);
        scheduler_.mark_failed(a.segment, false);
    } else {
        log(log_event::verify, log::priority::high,
            "segment %i from %s failed verification: %s", a.segment,
            a.source.c_str(), error.message().c_str());
        if(error == transfer_errc::verification_mismatch) {
            alert_queue_.emplace<verification_mismatch_alert>(id_, file_, a.source,
                a.segment);
        }
        scheduler_.mark_failed(a.segment);
        sources_.update(a.source, fetch_outcome::failure(error), now);
    }
    after_fetch_finished();
}

void transfer::abort_fetch(std::shared_ptr<segment_fetch> fetch)
{
    fetch->is_done = true;
    fetch->timeout_timer.cancel();
    fetch->connection.reset();
    finish_fetch(*fetch);
    scheduler_.release_claim(fetch->assignment.segment);
    try_finish_cancel();
}

void transfer::finish_fetch(segment_fetch& fetch)
{
    fetch.ticket.release();
    fetches_.erase(fetch.assignment.segment);
    sources_.on_fetch_finished(fetch.assignment.source);
}

void transfer::after_fetch_finished()
{
    if(is_cancelling_) {
        try_finish_cancel();
    } else if(scheduler_.is_complete()) {
        finalize();
    } else {
        update();
    }
}

void transfer::finalize()
{
    if(is_finalizing_ || is_terminal(state_)) {
        return;
    }
    is_finalizing_ = true;
    update_timer_.cancel();
    log(log_event::disk, "all %i segments verified, finalizing",
        scheduler_.num_segments());

    cpu_pool_.post([SHARED_THIS, segments = scheduler_.segments()] {
        std::error_code error;
        storage_.finalize(segments, file_, error);
        asio::post(strand_, [this, self, error] { on_finalized(error); });
    });
}

void transfer::on_finalized(const std::error_code& error)
{
    is_finalizing_ = false;
    if(error) {
        log(log_event::disk, log::priority::high, "finalizing failed: %s",
            error.message().c_str());
        fail(error);
        return;
    }

    state_ = transfer_state::completed;
    completion_time_ = clock::now();
    sources_.evict_all();
    storage_.erase_resume_data();
    update_status();
    log(log_event::state, "completed in %llims, saved to %s",
        static_cast<long long>(to_int<milliseconds>(completion_time_ - start_time_)),
        storage_.save_path().c_str());
    alert_queue_.emplace<transfer_completed_alert>(id_, file_);

    // a cancellation that arrived during finalization is moot
    is_cancelling_ = false;
}

void transfer::fail(const std::error_code& error)
{
    state_ = transfer_state::failed;
    error_ = error;
    update_timer_.cancel();
    save_resume_data();
    update_status();
    log(log_event::state, log::priority::high, "failed: %s", error.message().c_str());
    alert_queue_.emplace<transfer_failed_alert>(id_, file_, error);
}

void transfer::try_finish_cancel()
{
    if(!is_cancelling_ || is_terminal(state_) || !fetches_.empty() || is_finalizing_) {
        return;
    }
    // Acquires still queued in the governor carry no ticket. Their claims are dropped
    // now, and should they be granted later, the ticket is released on the spot.
    for(const auto& segment : scheduler_.segments()) {
        if(segment.state == segment_scheduler::segment_state::claimed) {
            scheduler_.release_claim(segment.index);
        }
    }
    state_ = transfer_state::cancelled;
    is_cancelling_ = false;
    update_timer_.cancel();
    save_resume_data();
    update_status();
    log(log_event::state, "cancelled with %i/%i segments verified",
        scheduler_.num_verified(), scheduler_.num_segments());
    alert_queue_.emplace<transfer_cancelled_alert>(id_, file_);
}

void transfer::save_resume_data()
{
    bmap_encoder resume;
    resume["file"] = file_.name;
    resume["size"] = file_.size;
    resume["segment_size"] = settings_.segment_size;

    blist_encoder verified;
    blist_encoder digests;
    for(const auto& s : scheduler_.segments()) {
        if(s.state == segment_scheduler::segment_state::verified) {
            verified.push_back(s.index);
            digests.push_back(std::string_view(
                reinterpret_cast<const char*>(s.digest.data()), s.digest.size()));
        }
    }
    resume["verified_segments"] = verified;
    resume["segment_digests"] = digests;

    std::error_code error;
    storage_.write_resume_data(resume.encode(), error);
    if(error) {
        log(log_event::disk, log::priority::high, "couldn't save resume data: %s",
            error.message().c_str());
        return;
    }
    has_state_changed_ = false;
}

void transfer::restore_resume_data()
{
    std::error_code error;
    const auto encoded = storage_.read_resume_data(error);
    if(error) {
        log(log_event::disk, log::priority::high, "couldn't read resume data: %s",
            error.message().c_str());
        return;
    }
    if(encoded.empty()) {
        return;
    }

    const bmap resume = decode_bmap(encoded, error);
    if(error) {
        log(log_event::disk, log::priority::high, "corrupt resume data: %s",
            error.message().c_str());
        return;
    }

    std::string name;
    int64_t size;
    int64_t segment_size;
    blist verified;
    blist digests;
    if(!resume.try_find_string("file", name) || !resume.try_find_number("size", size)
            || !resume.try_find_number("segment_size", segment_size)
            || !resume.try_find_blist("verified_segments", verified)
            || !resume.try_find_blist("segment_digests", digests)
            || (name != file_.name) || (size != file_.size)
            || (segment_size != settings_.segment_size)) {
        error = transfer_errc::invalid_resume_data;
        log(log_event::disk, log::priority::high, "ignoring resume data: %s",
            error.message().c_str());
        return;
    }

    const auto indices = verified.all_numbers();
    const auto digest_strs = digests.all_strings();
    if(indices.size() != digest_strs.size()) {
        log(log_event::disk, log::priority::high,
            "ignoring resume data: %i segments but %i digests",
            int(indices.size()), int(digest_strs.size()));
        return;
    }

    int num_restored = 0;
    for(auto i = 0; i < int(indices.size()); ++i) {
        const auto index = indices[i];
        const auto& digest_str = digest_strs[i];
        if((index < 0) || (index >= scheduler_.num_segments())
                || (digest_str.length() != sha256_hash().size())) {
            continue;
        }
        sha256_hash digest;
        std::copy(digest_str.begin(), digest_str.end(), digest.begin());
        if(!expected_digests_.empty() && (expected_digests_[index] != digest)) {
            continue;
        }
        const auto& segment = scheduler_[index];
        if(hash_store_.record(file_, segment.offset, segment.length, digest)) {
            log(log_event::disk, log::priority::high,
                "resumed segment %i contradicts the hash store, refetching", int(index));
            continue;
        }
        scheduler_.restore_verified(index, digest);
        ++num_restored;
    }
    log(log_event::disk, "restored %i verified segments", num_restored);
}

void transfer::update_status()
{
    std::lock_guard<std::mutex> l(ts_status_mutex_);
    ts_status_.state = state_;
    ts_status_.error = error_;
    ts_status_.bytes_verified = scheduler_.num_bytes_verified();
    ts_status_.num_verified_segments = scheduler_.num_verified();
    ts_status_.num_unclaimed_segments = scheduler_.num_unclaimed();
    ts_status_.num_failed_segments = scheduler_.num_failed();
    ts_status_.num_in_flight_segments = scheduler_.num_in_flight();
    ts_status_.active_source_count = sources_.num_active_sources();
    ts_status_.num_sources = sources_.size();
    ts_status_.num_eligible_sources = sources_.num_eligible_sources();
    ts_status_.start_time = start_time_;
    ts_status_.completion_time = completion_time_;
}

template<typename... Args>
void transfer::log(const log_event event, const char* format, Args&&... args) const
{
    log(event, log::priority::normal, format, std::forward<Args>(args)...);
}

template<typename... Args>
void transfer::log(const log_event event, const log::priority priority,
    const char* format, Args&&... args) const
{
#ifdef SHOAL_ENABLE_LOGGING
    const auto header = [event]() -> std::string
    {
        switch(event)
        {
        case log_event::update: return "UPDATE";
        case log_event::source: return "SOURCE";
        case log_event::fetch: return "FETCH";
        case log_event::verify: return "VERIFY";
        case log_event::disk: return "DISK";
        case log_event::state: return "STATE";
        default: return "";
        }
    }();
    log::log_transfer(id_, std::move(header),
        util::format(format, std::forward<Args>(args)...), priority);
#endif // SHOAL_ENABLE_LOGGING
}

#undef SHARED_THIS

} // namespace shoal

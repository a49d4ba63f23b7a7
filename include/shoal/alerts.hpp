#ifndef SHOAL_ALERTS_HEADER
#define SHOAL_ALERTS_HEADER

#include "file_id.hpp"
#include "types.hpp"
#include "time.hpp"

#include <system_error>

namespace shoal {

/** This is the interface all alerts must implement. */
struct alert
{
    enum category
    {
        error = 1,
        warning = 2,
        transfer = 4,
        source = 8,
    };

    // The time this alert was posted.
    time_point time;

    alert() : time(clock::now()) {}
    alert(const alert&) = default;
    alert& operator=(const alert&) = default;
    alert(alert&&) = default;
    alert& operator=(alert&&) = default;
    virtual ~alert() {}

    virtual int category() const noexcept = 0;
};

// -- individual transfer related alerts --

/** Base class for all transfer related alerts. */
struct transfer_alert : public alert
{
    transfer_id_t id;
    file_id file;
    transfer_alert(transfer_id_t i, file_id f) : id(i), file(std::move(f)) {}
    int category() const noexcept override { return transfer; }
};

struct transfer_completed_alert final : public transfer_alert
{
    using transfer_alert::transfer_alert;
};

struct transfer_cancelled_alert final : public transfer_alert
{
    using transfer_alert::transfer_alert;
};

struct transfer_failed_alert final : public transfer_alert
{
    std::error_code error;
    transfer_failed_alert(transfer_id_t i, file_id f, std::error_code ec)
        : transfer_alert(i, std::move(f))
        , error(ec)
    {}
    int category() const noexcept override { return transfer | alert::error; }
};

/** A stalled transfer was revived because backfill found new sources. */
struct transfer_resumed_alert final : public transfer_alert
{
    int num_new_sources;
    transfer_resumed_alert(transfer_id_t i, file_id f, int n)
        : transfer_alert(i, std::move(f))
        , num_new_sources(n)
    {}
};

/**
 * A source served bytes whose digest differs from the expected or previously recorded
 * one. The bytes are dropped and the source is penalized.
 */
struct verification_mismatch_alert final : public transfer_alert
{
    source_id source;
    segment_index_t segment;
    verification_mismatch_alert(transfer_id_t i, file_id f, source_id s,
        segment_index_t seg)
        : transfer_alert(i, std::move(f))
        , source(std::move(s))
        , segment(seg)
    {}
    int category() const noexcept override { return transfer | alert::source | warning; }
};

} // namespace shoal

#endif // SHOAL_ALERTS_HEADER

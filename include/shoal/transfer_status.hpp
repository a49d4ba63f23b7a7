#ifndef SHOAL_TRANSFER_STATUS_HEADER
#define SHOAL_TRANSFER_STATUS_HEADER

#include "transfer_error.hpp"
#include "file_id.hpp"
#include "types.hpp"
#include "time.hpp"

#include <system_error>
#include <cstdint>

namespace shoal {

enum class transfer_state : uint8_t
{
    // No fetch has been dispatched yet (e.g. there are no sources).
    pending,
    active,
    // Terminal states.
    completed,
    failed,
    cancelled
};

inline bool is_terminal(const transfer_state s) noexcept
{
    return (s == transfer_state::completed) || (s == transfer_state::failed)
        || (s == transfer_state::cancelled);
}

inline const char* to_string(const transfer_state s) noexcept
{
    switch(s) {
    case transfer_state::pending: return "pending";
    case transfer_state::active: return "active";
    case transfer_state::completed: return "completed";
    case transfer_state::failed: return "failed";
    case transfer_state::cancelled: return "cancelled";
    default: return "unknown";
    }
}

/**
 * A consistent snapshot of a transfer's state. It is produced by the transfer on its
 * strand and copied out under a mutex, so fields never come from different moments.
 */
struct transfer_status
{
    transfer_id_t id = -1;
    file_id file;
    transfer_state state = transfer_state::pending;
    // Set if state is failed.
    std::error_code error;

    int64_t total_bytes = 0;
    int64_t bytes_verified = 0;

    int num_segments = 0;
    int num_verified_segments = 0;
    int num_unclaimed_segments = 0;
    int num_failed_segments = 0;
    int num_in_flight_segments = 0;

    // The number of sources from which we're currently fetching.
    int active_source_count = 0;
    int num_sources = 0;
    int num_eligible_sources = 0;

    time_point start_time;
    time_point completion_time;

    bool is_terminal() const noexcept { return shoal::is_terminal(state); }

    bool is_stalled() const noexcept
    {
        return (state == transfer_state::failed)
            && (error == transfer_errc::transfer_stalled);
    }

    /**
     * Whether the transfer could make use of new sources: it's still running or has
     * stalled, and has segments that no source is working on.
     */
    bool needs_sources() const noexcept
    {
        return (!is_terminal() || is_stalled())
            && ((num_unclaimed_segments > 0) || (num_failed_segments > 0));
    }
};

} // namespace shoal

#endif // SHOAL_TRANSFER_STATUS_HEADER

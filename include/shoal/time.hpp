#ifndef SHOAL_TIME_HEADER
#define SHOAL_TIME_HEADER

#include <chrono>
#include <cstdint>
#include <system_error>

#include <asio/basic_waitable_timer.hpp>

namespace shoal {

using clock = std::chrono::steady_clock;

using time_point = clock::time_point;
using duration = clock::duration;

using std::chrono::hours;
using std::chrono::microseconds;
using std::chrono::milliseconds;
using std::chrono::minutes;
using std::chrono::seconds;

using std::chrono::duration_cast;
using std::chrono::time_point_cast;

using deadline_timer = asio::basic_waitable_timer<clock>;

template <typename Unit>
int64_t to_int(const duration& d)
{
    return duration_cast<Unit>(d).count();
}

template <typename Unit>
int64_t to_int(const time_point& t)
{
    return duration_cast<Unit>(t.time_since_epoch()).count();
}

inline duration elapsed_since(const time_point& t)
{
    return clock::now() - t;
}

template <typename Duration, typename Handler>
void start_timer(deadline_timer& timer, const Duration& expires_in, Handler handler)
{
    // Setting this cancels pending async waits (which is what we want).
    timer.expires_after(expires_in);
    timer.async_wait(std::move(handler));
}

} // namespace shoal

#endif // SHOAL_TIME_HEADER

#ifndef SHOAL_PEER_ERROR_HEADER
#define SHOAL_PEER_ERROR_HEADER

#include <system_error>
#include <string>

namespace shoal {

/** Errors reported by a peer_client implementation. */
enum class peer_errc
{
    unknown = 1,
    // The peer could not be reached (offline, firewalled, no indirect connection).
    connect_failed,
    // The peer refused the transfer request (queued, file no longer shared, etc).
    request_failed,
    // The stream ended before all requested bytes were received.
    peer_disconnected
};

struct peer_error_category : public std::error_category
{
    const char* name() const noexcept override { return "peer"; }
    std::string message(int env) const override;
    std::error_condition default_error_condition(int ev) const noexcept override;
};

const peer_error_category& peer_category();
std::error_code make_error_code(peer_errc e);
std::error_condition make_error_condition(peer_errc e);

} // namespace shoal

namespace std
{
    template<> struct is_error_code_enum<shoal::peer_errc> : public true_type {};
}

#endif // SHOAL_PEER_ERROR_HEADER

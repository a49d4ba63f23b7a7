#include "peer_error.hpp"

namespace shoal {

std::string peer_error_category::message(int env) const
{
    switch(static_cast<peer_errc>(env))
    {
    case peer_errc::unknown: return "Unknown";
    case peer_errc::connect_failed: return "Could not connect to peer";
    case peer_errc::request_failed: return "Peer refused the transfer request";
    case peer_errc::peer_disconnected: return "Peer disconnected mid-transfer";
    default: return "Unknown";
    }
}

std::error_condition
peer_error_category::default_error_condition(int ev) const noexcept
{
    switch(static_cast<peer_errc>(ev))
    {
    case peer_errc::connect_failed:
        return std::errc::connection_refused;
    case peer_errc::peer_disconnected:
        return std::errc::connection_reset;
    default:
        return std::error_condition(ev, *this);
    }
}

const peer_error_category& peer_category()
{
    static peer_error_category instance;
    return instance;
}

std::error_code make_error_code(peer_errc e)
{
    return std::error_code(static_cast<int>(e), peer_category());
}

std::error_condition make_error_condition(peer_errc e)
{
    return std::error_condition(static_cast<int>(e), peer_category());
}

} // namespace shoal

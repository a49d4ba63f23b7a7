#include "transfer_error.hpp"

namespace shoal {

std::string transfer_error_category::message(int env) const
{
    switch(static_cast<transfer_errc>(env))
    {
    case transfer_errc::unknown: return "Unknown";
    case transfer_errc::source_unavailable: return "Source unavailable";
    case transfer_errc::verification_mismatch: return "Segment digest mismatch";
    case transfer_errc::capacity_timeout: return "Timed out waiting for fetch capacity";
    case transfer_errc::segment_timeout: return "Segment fetch timed out";
    case transfer_errc::segment_length_mismatch:
        return "Peer sent a different number of bytes than requested";
    case transfer_errc::transfer_stalled: return "Transfer stalled";
    case transfer_errc::corrupt_assembly:
        return "Verified segments do not exactly cover the file";
    case transfer_errc::file_digest_mismatch: return "File digest mismatch";
    case transfer_errc::storage_error: return "Storage error";
    case transfer_errc::invalid_resume_data: return "Invalid resume data";
    case transfer_errc::operation_aborted: return "Operation aborted";
    default: return "Unknown";
    }
}

std::error_condition
transfer_error_category::default_error_condition(int ev) const noexcept
{
    switch(static_cast<transfer_errc>(ev))
    {
    case transfer_errc::operation_aborted:
        return std::errc::operation_canceled;
    case transfer_errc::segment_timeout:
    case transfer_errc::capacity_timeout:
        return std::errc::timed_out;
    default:
        return std::error_condition(ev, *this);
    }
}

const transfer_error_category& transfer_category()
{
    static transfer_error_category instance;
    return instance;
}

std::error_code make_error_code(transfer_errc e)
{
    return std::error_code(static_cast<int>(e), transfer_category());
}

std::error_condition make_error_condition(transfer_errc e)
{
    return std::error_condition(static_cast<int>(e), transfer_category());
}

} // namespace shoal

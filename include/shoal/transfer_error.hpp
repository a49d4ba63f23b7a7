#ifndef SHOAL_TRANSFER_ERROR_HEADER
#define SHOAL_TRANSFER_ERROR_HEADER

#include <system_error>
#include <string>

namespace shoal {

enum class transfer_errc
{
    unknown = 1,
    // A source could not serve a segment (any peer error is reported as this to the
    // source registry if no more specific reason is known).
    source_unavailable,
    // A segment's digest differs from the one expected or previously recorded.
    verification_mismatch,
    // No admission ticket could be acquired within the bounded wait.
    capacity_timeout,
    // A fetch did not finish within the per-segment deadline.
    segment_timeout,
    // The peer sent more or fewer bytes than requested.
    segment_length_mismatch,
    // No segment was verified within the stall window and no progress is possible.
    transfer_stalled,
    // At finalization the verified segments don't exactly cover the file.
    corrupt_assembly,
    // The assembled file's digest differs from the expected full-file digest.
    file_digest_mismatch,
    // Reading or writing the partial file or resume data failed.
    storage_error,
    // Resume data is for another file or segmentation.
    invalid_resume_data,
    operation_aborted
};

struct transfer_error_category : public std::error_category
{
    const char* name() const noexcept override { return "transfer"; }
    std::string message(int env) const override;
    std::error_condition default_error_condition(int ev) const noexcept override;
};

const transfer_error_category& transfer_category();
std::error_code make_error_code(transfer_errc e);
std::error_condition make_error_condition(transfer_errc e);

} // namespace shoal

namespace std
{
    template<> struct is_error_code_enum<shoal::transfer_errc> : public true_type {};
}

#endif // SHOAL_TRANSFER_ERROR_HEADER

#ifndef SHOAL_SEGMENT_STORAGE_HEADER
#define SHOAL_SEGMENT_STORAGE_HEADER

#include "segment_scheduler.hpp"
#include "file_id.hpp"
#include "types.hpp"
#include "path.hpp"

#include <system_error>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>
#include <mutex>

namespace shoal {

/**
 * Checks that the verified segments exactly partition [0, file_size): no gaps, no
 * overlaps and no unverified segment. Returns transfer_errc::corrupt_assembly if not.
 */
std::error_code verify_assembly(
    const std::vector<segment_scheduler::segment>& segments, const int64_t file_size);

/**
 * Everything that's necessary to put a transfer's file on disk. Verified segments are
 * written, in any order, to a partial file next to the final destination, which is
 * renamed to its final name when all segments are in. The transfer's resume data is
 * kept in a separate file.
 *
 * All operations run synchronously, i.e. in the caller's thread, so they should be
 * executed on the thread pool. Writes to the partial file are serialized, so segments
 * may be written from several threads.
 *
 * Filesystem errors are reported as transfer_errc::storage_error.
 */
class segment_storage
{
    // The final destination of the file.
    path save_path_;
    // The file being assembled: save_path_ with a ".part" extension.
    path part_path_;
    path resume_data_path_;

    const int64_t size_;

    std::fstream file_;
    std::mutex file_mutex_;

public:

    segment_storage(path save_path, path resume_data_path, const int64_t size);

    segment_storage(const segment_storage&) = delete;
    segment_storage& operator=(const segment_storage&) = delete;

    const path& save_path() const noexcept { return save_path_; }
    const path& part_path() const noexcept { return part_path_; }
    const path& resume_data_path() const noexcept { return resume_data_path_; }
    int64_t size() const noexcept { return size_; }

    /**
     * Creates the partial file (and any missing directories) and resizes it to the
     * file's size. An existing partial file is kept, so that segments verified in a
     * previous run need not be fetched again.
     */
    void allocate(std::error_code& error);

    bool is_allocated() const;

    /** Writes length bytes at offset into the partial file. */
    void write(const int64_t offset, const uint8_t* data, const int length,
        std::error_code& error);

    /** Reads length bytes at offset from the partial file into data. */
    void read(const int64_t offset, uint8_t* data, const int length,
        std::error_code& error);

    /**
     * Verifies the assembly, and the digest of the whole file if it's known, then moves
     * the partial file to its final destination.
     */
    void finalize(const std::vector<segment_scheduler::segment>& segments,
        const file_id& file, std::error_code& error);

    /** Returns an empty string if there is no resume data. */
    std::string read_resume_data(std::error_code& error) const;
    void write_resume_data(const std::string& encoded, std::error_code& error);
    void erase_resume_data();

private:

    sha256_hash hash_part_file(std::error_code& error) const;
};

} // namespace shoal

#endif // SHOAL_SEGMENT_STORAGE_HEADER

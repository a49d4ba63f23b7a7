#ifndef SHOAL_HASH_STORE_HEADER
#define SHOAL_HASH_STORE_HEADER

#include "file_id.hpp"
#include "types.hpp"
#include "path.hpp"

#include <system_error>
#include <cstdint>
#include <string>
#include <mutex>
#include <map>

namespace shoal {

/**
 * Remembers the digest of every segment ever verified, keyed by the file and the byte
 * range. Since Soulseek has no content addressing, this is how a segment fetched from a
 * second source (or on a later run) is checked against what another source served.
 *
 * Mappings are first-write-wins: once a digest is recorded for a key it is never
 * replaced, and recording a different digest reports a mismatch.
 *
 * All functions are thread-safe, as the store is shared by all transfers and is
 * consulted from the hashing threads.
 */
class hash_store
{
    struct key
    {
        std::string file;
        int64_t offset;
        int64_t length;

        bool operator<(const key& other) const noexcept
        {
            if(file != other.file) { return file < other.file; }
            if(offset != other.offset) { return offset < other.offset; }
            return length < other.length;
        }
    };

    std::map<key, sha256_hash> digests_;
    mutable std::mutex digests_mutex_;

public:

    /**
     * If a digest has been recorded for the segment, it's copied into digest and true
     * is returned.
     */
    bool lookup(const file_id& file, const int64_t offset, const int64_t length,
        sha256_hash& digest) const;

    /**
     * Records digest for the segment if none is known. If the same digest is already
     * recorded, this is a no-op. If a different one is, the original is kept and
     * transfer_errc::verification_mismatch is returned.
     */
    std::error_code record(const file_id& file, const int64_t offset,
        const int64_t length, const sha256_hash& digest);

    int size() const;
    bool empty() const { return size() == 0; }
    void clear();

    /** Persists all mappings (bencoded) to the file at path, overwriting it. */
    void save(const path& path, std::error_code& error) const;

    /**
     * Loads the mappings in the file at path. Loaded entries don't overwrite ones
     * already in the store. A missing file is not an error.
     */
    void load(const path& path, std::error_code& error);
};

} // namespace shoal

#endif // SHOAL_HASH_STORE_HEADER

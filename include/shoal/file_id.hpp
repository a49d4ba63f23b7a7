#ifndef SHOAL_FILE_ID_HEADER
#define SHOAL_FILE_ID_HEADER

#include "types.hpp"

#include <cstdint>
#include <string>

namespace shoal {

/**
 * Identifies the logical file being downloaded. Soulseek has no content addressing, so
 * a file is the remote name combined with its expected size and, if the searcher
 * happens to know it, the SHA-256 digest of the whole file.
 */
struct file_id
{
    // The name as shared by peers, e.g. "@@music\Artist\Album\01 - Track.flac".
    std::string name;
    int64_t size = 0;
    bool has_digest = false;
    sha256_hash digest{};

    file_id() = default;
    file_id(std::string n, int64_t s) : name(std::move(n)), size(s) {}
    file_id(std::string n, int64_t s, const sha256_hash& d)
        : name(std::move(n))
        , size(s)
        , has_digest(true)
        , digest(d)
    {}

    /**
     * The string under which data about this file is keyed in the hash store and in
     * resume data. The full digest is not part of the key, as it's optional.
     */
    std::string key() const { return name + '#' + std::to_string(size); }
};

inline bool operator==(const file_id& a, const file_id& b) noexcept
{
    return (a.name == b.name) && (a.size == b.size);
}

inline bool operator!=(const file_id& a, const file_id& b) noexcept
{
    return !(a == b);
}

inline bool operator<(const file_id& a, const file_id& b) noexcept
{
    return (a.name < b.name) || ((a.name == b.name) && (a.size < b.size));
}

} // namespace shoal

#endif // SHOAL_FILE_ID_HEADER

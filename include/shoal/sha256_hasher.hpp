#ifndef SHOAL_SHA256_HASHER_HEADER
#define SHOAL_SHA256_HASHER_HEADER

#include "types.hpp"

#include <cstddef>
#include <memory>

#include <openssl/evp.h>

namespace shoal {

/**
 * This class is used to verify segments and complete files using SHA-256.
 *
 * The data need not be kept in memory at once, it can be hashed incrementally by
 * feeding the hasher with chunks using the update() method. When all chunks have been
 * hashed, use the finish() method to return the final digest.
 */
class sha256_hasher
{
    struct context_deleter
    {
        void operator()(EVP_MD_CTX* c) const noexcept { EVP_MD_CTX_free(c); }
    };

    std::unique_ptr<EVP_MD_CTX, context_deleter> context_;

public:

    /** Throws std::bad_alloc if the OpenSSL context could not be created. */
    sha256_hasher();

    void reset();

    sha256_hasher& update(const uint8_t* data, size_t length);

    template<typename Container>
    sha256_hasher& update(const Container& buffer)
    {
        return update(reinterpret_cast<const uint8_t*>(buffer.data()), buffer.size());
    }

    sha256_hash finish();
};

/**
 * This is a convenience method for when update would be called only once because all
 * the data is available.
 */
inline sha256_hash create_sha256_digest(const uint8_t* data, size_t length)
{
    sha256_hasher hasher;
    hasher.update(data, length);
    return hasher.finish();
}

template<typename Buffer>
sha256_hash create_sha256_digest(const Buffer& buffer)
{
    sha256_hasher hasher;
    hasher.update(buffer);
    return hasher.finish();
}

} // namespace shoal

#endif // SHOAL_SHA256_HASHER_HEADER

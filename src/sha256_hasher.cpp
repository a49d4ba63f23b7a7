#include "sha256_hasher.hpp"

#include <new>

namespace shoal {

sha256_hasher::sha256_hasher() : context_(EVP_MD_CTX_new())
{
    if(context_ == nullptr) {
        throw std::bad_alloc();
    }
    reset();
}

void sha256_hasher::reset()
{
    EVP_DigestInit_ex(context_.get(), EVP_sha256(), nullptr);
}

sha256_hasher& sha256_hasher::update(const uint8_t* data, size_t length)
{
    EVP_DigestUpdate(context_.get(), data, length);
    return *this;
}

sha256_hash sha256_hasher::finish()
{
    sha256_hash digest;
    unsigned int length = 0;
    EVP_DigestFinal_ex(context_.get(), digest.data(), &length);
    reset();
    return digest;
}

} // namespace shoal

#ifndef SHOAL_SEGMENT_BUFFER_HEADER
#define SHOAL_SEGMENT_BUFFER_HEADER

#include <cassert>
#include <cstdint>
#include <memory>
#include <mutex>
#include <new>

#include <boost/pool/pool.hpp>

namespace shoal {

class segment_buffer_pool;

/**
 * A pool allocated buffer that holds a segment's bytes while they are streamed in
 * from a peer, then hashed and written to disk.
 *
 * It has shared_ptr semantics in that only the destruction of the last copy will free
 * the underlying resource (that is, give back the memory to the allocating pool). Thus,
 * ensuring thread-safety (not writing to the same buffer simultaneously) is the
 * responsibility of the user.
 *
 * The memory allocated is always the pool's buffer size, but the last segment of a file
 * is usually shorter. Thus, size returns this desired size, not the allocation size.
 */
class segment_buffer
{
    std::shared_ptr<uint8_t> data_;
    // Reflects the desired size, not the amount of memory.
    int size_ = 0;

public:

    segment_buffer() = default; // default is invalid buffer
    segment_buffer(std::shared_ptr<uint8_t> data, int size)
        : data_(std::move(data))
        , size_(size)
    {}

    explicit operator bool() const noexcept { return data_ != nullptr; }

    int size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }

    uint8_t* data() noexcept { return data_.get(); }
    const uint8_t* data() const noexcept { return data_.get(); }

    uint8_t* begin() noexcept { return data(); }
    const uint8_t* begin() const noexcept { return data(); }

    uint8_t* end() noexcept { return data() + size(); }
    const uint8_t* end() const noexcept { return data() + size(); }
};

/**
 * Buffers are allocated on a transfer's strand but freed on whichever thread drops the
 * last reference (the peer client's or the hashing thread), so the underlying pool is
 * guarded by a mutex. Buffers keep the pool alive.
 */
class segment_buffer_pool : public std::enable_shared_from_this<segment_buffer_pool>
{
    boost::pool<> pool_;
    std::mutex pool_mutex_;
    const int buffer_size_;

public:

    explicit segment_buffer_pool(const int buffer_size)
        : pool_(buffer_size)
        , buffer_size_(buffer_size)
    {}

    int buffer_size() const noexcept { return buffer_size_; }

    /** Throws std::bad_alloc if memory could not be allocated. */
    segment_buffer allocate(const int size)
    {
        assert(size > 0);
        assert(size <= buffer_size_);
        void* p = nullptr;
        {
            std::lock_guard<std::mutex> l(pool_mutex_);
            p = pool_.malloc();
        }
        if(p == nullptr) {
            throw std::bad_alloc();
        }
        auto self = shared_from_this();
        return segment_buffer(std::shared_ptr<uint8_t>(static_cast<uint8_t*>(p),
            [self](uint8_t* p) { self->free(p); }), size);
    }

private:

    void free(uint8_t* p)
    {
        std::lock_guard<std::mutex> l(pool_mutex_);
        pool_.free(p);
    }
};

} // namespace shoal

#endif // SHOAL_SEGMENT_BUFFER_HEADER

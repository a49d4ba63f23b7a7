#ifndef SHOAL_BYTE_RANGE_HEADER
#define SHOAL_BYTE_RANGE_HEADER

#include <cstdint>

namespace shoal {

/** A half-open byte interval, i.e. the bytes in [begin, end). */
struct byte_range
{
    int64_t begin = 0;
    int64_t end = 0;

    byte_range() = default;
    byte_range(int64_t b, int64_t e) : begin(b), end(e) {}

    int64_t length() const noexcept { return end - begin; }
    bool empty() const noexcept { return begin >= end; }

    bool contains(const byte_range& other) const noexcept
    {
        return (begin <= other.begin) && (other.end <= end);
    }

    bool overlaps(const byte_range& other) const noexcept
    {
        return (begin < other.end) && (other.begin < end);
    }

    /** Whether the two ranges overlap or are directly adjacent. */
    bool touches(const byte_range& other) const noexcept
    {
        return (begin <= other.end) && (other.begin <= end);
    }
};

inline bool operator==(const byte_range& a, const byte_range& b) noexcept
{
    return (a.begin == b.begin) && (a.end == b.end);
}

inline bool operator!=(const byte_range& a, const byte_range& b) noexcept
{
    return !(a == b);
}

inline bool operator<(const byte_range& a, const byte_range& b) noexcept
{
    return (a.begin < b.begin) || ((a.begin == b.begin) && (a.end < b.end));
}

} // namespace shoal

#endif // SHOAL_BYTE_RANGE_HEADER

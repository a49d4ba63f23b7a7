#ifndef SHOAL_SLIDING_AVERAGE_HEADER
#define SHOAL_SLIDING_AVERAGE_HEADER

#include <cmath>
#include <cstdint>

namespace shoal {

/**
 * An exponential moving average that avoids the bias toward the first sample by
 * starting with a gain of 1 and lowering it with every sample until 1/InvertedGain is
 * reached. Thus early samples of a source's throughput or round trip time have a fair
 * impact on its rank, which matters as most sources serve only a handful of segments.
 *
 * Samples are kept as integers scaled by 64 to avoid truncation.
 */
template <int InvertedGain>
class sliding_average
{
    int64_t mean_ = 0;
    int64_t deviation_ = 0;
    int num_samples_ = 0;

public:
    void update(int64_t s) noexcept
    {
        s *= 64;
        int64_t deviation = 0;
        if(num_samples_ > 0) {
            deviation = std::abs(mean_ - s);
        }
        if(num_samples_ < InvertedGain) {
            ++num_samples_;
        }
        mean_ += (s - mean_) / num_samples_;
        if(num_samples_ > 1) {
            deviation_ += (deviation - deviation_) / (num_samples_ - 1);
        }
    }

    int64_t mean() const noexcept
    {
        return num_samples_ > 0 ? (mean_ + 32) / 64 : 0;
    }

    int64_t deviation() const noexcept
    {
        return num_samples_ > 1 ? (deviation_ + 32) / 64 : 0;
    }

    bool empty() const noexcept { return num_samples_ == 0; }
    int num_samples() const noexcept { return num_samples_; }

    void reset() noexcept
    {
        mean_ = deviation_ = 0;
        num_samples_ = 0;
    }
};

} // namespace shoal

#endif // SHOAL_SLIDING_AVERAGE_HEADER

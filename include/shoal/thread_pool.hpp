#ifndef SHOAL_THREAD_POOL_HEADER
#define SHOAL_THREAD_POOL_HEADER

#include <condition_variable>
#include <functional>
#include <thread>
#include <atomic>
#include <vector>
#include <deque>
#include <mutex>

namespace shoal {

/**
 * Segments are hashed and written to disk on this pool so that the network threads are
 * never blocked by CPU or disk bound work. Jobs may be posted from any thread.
 */
struct thread_pool
{
    using job_type = std::function<void()>;

private:

    // Threads are spun up lazily by post(), which may be called from several threads,
    // so this is guarded by job_queue_mutex_.
    std::vector<std::thread> threads_;

    // Threads are notified of new jobs via this condition variable while they are
    // holding onto job_queue_mutex_.
    std::condition_variable job_available_;

    // All jobs are first placed in this queue from which they are retrieved by threads.
    //
    // NOTE: must only be handled after acquiring job_queue_mutex_.
    std::deque<job_type> job_queue_;

    mutable std::mutex job_queue_mutex_;

    bool is_joining_ = false;

    std::atomic<int> num_idle_threads_{0};

    // This is the max number of threads that we may have running.
    const int concurrency_;

public:

    /**
     * If concurrency is not positive, it is calculated as a function of the number of
     * cores of the underlying hardware.
     */
    explicit thread_pool(int concurrency);
    ~thread_pool();

    thread_pool(const thread_pool&) = delete;
    thread_pool& operator=(const thread_pool&) = delete;

    int concurrency() const noexcept { return concurrency_; }

    /**
     * Post a callable job to thread pool for execution at an unspecified time. If there
     * is an idle thread, the job is executed immediately, if not, a new thread might be
     * spun up, if concurrency limit is not reached, otherwise it is queued up for later
     * execution.
     */
    void post(job_type job);

    /**
     * Stops all threads after they finish their current job. Pending jobs are not
     * executed. No jobs may be posted after this.
     */
    void join();

private:

    void run();
};

} // namespace shoal

#endif // SHOAL_THREAD_POOL_HEADER

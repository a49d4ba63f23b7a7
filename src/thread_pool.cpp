#include "thread_pool.hpp"
#include "log.hpp"

#include <exception>

namespace shoal {

/** Hashing is CPU bound, so by default there are as many threads as cores. */
inline int auto_concurrency()
{
    const int n = std::thread::hardware_concurrency();
    return n > 0 ? n : 2;
}

thread_pool::thread_pool(int concurrency)
    : concurrency_(concurrency <= 0 ? auto_concurrency() : concurrency)
{}

thread_pool::~thread_pool()
{
    join();
}

void thread_pool::post(job_type job)
{
    std::unique_lock<std::mutex> l(job_queue_mutex_);
    if(is_joining_) {
        return;
    }
    job_queue_.emplace_back(std::move(job));
    // if there is no one to pick up this job and we may, spin up a new thread
    if(num_idle_threads_.load(std::memory_order_acquire) == 0
            && int(threads_.size()) < concurrency_) {
        threads_.emplace_back([this] { run(); });
    }
    l.unlock();
    job_available_.notify_one();
}

void thread_pool::join()
{
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> l(job_queue_mutex_);
        is_joining_ = true;
        threads.swap(threads_);
    }
    job_available_.notify_all();
    for(auto& thread : threads) {
        if(thread.joinable()) {
            thread.join();
        }
    }
}

void thread_pool::run()
{
    std::unique_lock<std::mutex> job_queue_lock(job_queue_mutex_);
    while(!is_joining_) {
        if(job_queue_.empty()) {
            num_idle_threads_.fetch_add(1, std::memory_order_release);
            // wake up if thread pool is being joined or a new job is available
            job_available_.wait(job_queue_lock,
                [this] { return is_joining_ || !job_queue_.empty(); });
            num_idle_threads_.fetch_sub(1, std::memory_order_release);
            continue;
        }

        auto job = std::move(job_queue_.front());
        job_queue_.pop_front();
        job_queue_lock.unlock();

        try {
            job();
        } catch(const std::exception& e) {
            log::log_engine("THREAD_POOL", std::string("job threw: ") + e.what(),
                log::priority::high);
        }

        job_queue_lock.lock();
    }
}

} // namespace shoal

#pragma once

#include "../util/logger.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace chipper {

/**
 * WorkerPool - Fixed set of persistent worker threads
 *
 * parallel_for() splits a range into contiguous chunks, hands all but the
 * first to the workers, runs the first on the calling thread and blocks
 * until every chunk has finished. Calls made from one of the pool's own
 * workers run inline, so nested use never waits on itself.
 */
class WorkerPool {
public:
    // num_threads <= 0 selects the hardware concurrency
    explicit WorkerPool(int num_threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    int num_threads() const { return num_threads_; }

    // True when called from one of this pool's workers
    bool in_worker() const;

    /**
     * Run fn over [start, end) in parallel
     *
     * @param min_grain  Smallest chunk worth a thread hop. Ranges shorter
     *                   than two grains run inline.
     *
     * The first exception thrown by any chunk is rethrown after all chunks
     * have finished.
     */
    void parallel_for(int64_t start, int64_t end, const std::function<void(int64_t, int64_t)>& fn,
                      int64_t min_grain = 4);

    static int resolve_thread_count(int requested);

private:
    void post(std::function<void()> task);
    void worker_loop();

    int num_threads_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable condition_;
    bool stop_ = false;

    Logger logger_;
};

} // namespace chipper

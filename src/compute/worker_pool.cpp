#include "worker_pool.hpp"

#include <algorithm>
#include <exception>

namespace chipper {

namespace {

thread_local const WorkerPool* t_current_pool = nullptr;

} // namespace

int WorkerPool::resolve_thread_count(int requested) {
    if (requested > 0) return requested;
    int hw = static_cast<int>(std::thread::hardware_concurrency());
    return hw > 0 ? hw : 4;
}

WorkerPool::WorkerPool(int num_threads)
    : num_threads_(resolve_thread_count(num_threads)), logger_(create_logger("WorkerPool")) {
    // The calling thread takes one chunk, so one fewer worker is enough
    int spawn = num_threads_ - 1;
    workers_.reserve(static_cast<size_t>(std::max(spawn, 0)));
    for (int i = 0; i < spawn; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    logger_->debug("Started {} threads", num_threads_);
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
}

bool WorkerPool::in_worker() const {
    return t_current_pool == this;
}

void WorkerPool::worker_loop() {
    t_current_pool = this;
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

void WorkerPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
}

void WorkerPool::parallel_for(int64_t start, int64_t end, const std::function<void(int64_t, int64_t)>& fn,
                              int64_t min_grain) {
    int64_t total = end - start;
    if (total <= 0) return;

    min_grain = std::max<int64_t>(min_grain, 1);
    if (num_threads_ <= 1 || total < min_grain * 2 || in_worker()) {
        fn(start, end);
        return;
    }

    int64_t chunks = std::min<int64_t>(num_threads_, total / min_grain);
    int64_t chunk_size = (total + chunks - 1) / chunks;

    // Completion state lives on this frame; every posted chunk signals before we return
    std::mutex done_mutex;
    std::condition_variable done;
    int64_t pending = 0;
    std::exception_ptr first_error;

    auto run_chunk = [&](int64_t c_start, int64_t c_end) {
        std::exception_ptr error;
        try {
            fn(c_start, c_end);
        } catch (...) {
            error = std::current_exception();
        }
        std::lock_guard<std::mutex> lock(done_mutex);
        if (error && !first_error) {
            first_error = error;
        }
        --pending;
        if (pending == 0) {
            done.notify_all();
        }
    };

    std::vector<std::pair<int64_t, int64_t>> ranges;
    for (int64_t c_start = start; c_start < end; c_start += chunk_size) {
        ranges.emplace_back(c_start, std::min(c_start + chunk_size, end));
    }
    pending = static_cast<int64_t>(ranges.size());

    for (size_t i = 1; i < ranges.size(); ++i) {
        auto range = ranges[i];
        post([&run_chunk, range]() { run_chunk(range.first, range.second); });
    }
    run_chunk(ranges[0].first, ranges[0].second);

    std::unique_lock<std::mutex> lock(done_mutex);
    done.wait(lock, [&pending] { return pending == 0; });

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace chipper

#include "asyncfs/worker_pool.h"
#include "asyncfs/log.h"
#include <stdexcept>
#include <string>

namespace asyncfs {

WorkerPool::WorkerPool(unsigned num_threads) {
    if (num_threads == 0) throw std::invalid_argument("worker pool needs at least one thread");
    for (unsigned i = 0; i < num_threads; ++i) {
        threads_.emplace_back(&WorkerPool::worker_thread, this, i);
    }
    log_debug("pool", "started " + std::to_string(num_threads) + " workers");
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        t.join();
    }
}

void WorkerPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) throw std::logic_error("submit on a stopped worker pool");
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

void WorkerPool::worker_thread(unsigned thread_id) {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return shutdown_ || !jobs_.empty(); });
            if (jobs_.empty()) break; // shutdown with nothing left
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        job();
    }
    log_debug("pool", "worker " + std::to_string(thread_id) + " exiting");
}

} // namespace asyncfs

#ifndef ASYNCFS_WORKER_POOL_H
#define ASYNCFS_WORKER_POOL_H

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace asyncfs {

// Fixed set of threads running blocking jobs. Jobs already queued when the
// pool is destroyed still run before the threads are joined.
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(unsigned num_threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(Job job);
    unsigned size() const { return static_cast<unsigned>(threads_.size()); }

private:
    void worker_thread(unsigned thread_id);

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool shutdown_ = false;
    std::vector<std::thread> threads_;
};

} // namespace asyncfs

#endif

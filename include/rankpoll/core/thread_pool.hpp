/*
 * rankpoll - worker pool used for cross-chain message delivery
 */
#ifndef RANKPOLL_CORE_THREAD_POOL_HPP
#define RANKPOLL_CORE_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>

namespace rankpoll {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 2);
    ~ThreadPool();
    
    // Queue a task; returns false (task dropped) once the pool is stopped
    bool enqueue(std::function<void()> task);
    
    size_t size() const { return threads_.size(); }
    
    // Finish queued tasks, then join the workers
    void shutdown();

private:
    void worker();
    
    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    
    std::mutex mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
};

} // namespace rankpoll

#endif // RANKPOLL_CORE_THREAD_POOL_HPP

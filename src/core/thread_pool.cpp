#include <rankpoll/core/thread_pool.hpp>
#include <rankpoll/core/logger.hpp>
#include <exception>

namespace rankpoll {

ThreadPool::ThreadPool(size_t num_threads) : stop_(false) {
    if (num_threads == 0) num_threads = 1;
    for (size_t i = 0; i < num_threads; ++i) {
        threads_.emplace_back([this] { worker(); });
    }
    LOG_DEBUG("Thread pool started with %zu workers", num_threads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) {
            LOG_WARN("Cannot enqueue task - thread pool is stopped");
            return false;
        }
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
    return true;
}

void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) return;  // Already stopped
        stop_ = true;
    }
    
    condition_.notify_all();
    
    for (std::thread& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    
    LOG_DEBUG("Thread pool shutdown complete");
}

void ThreadPool::worker() {
    while (true) {
        std::function<void()> task;
        
        {
            std::unique_lock<std::mutex> lock(mutex_);
            
            condition_.wait(lock, [this] { 
                return stop_ || !tasks_.empty(); 
            });
            
            // Drain remaining work before exiting
            if (stop_ && tasks_.empty()) {
                return;
            }
            
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Thread pool task threw exception: %s", e.what());
        }
    }
}

} // namespace rankpoll

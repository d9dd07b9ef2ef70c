#pragma once

/**
 * ThreadPool.hpp
 * 
 * Fixed-size thread pool used to run range fetchers side by side.
 */

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <atomic>
#include <stdexcept>
#include <type_traits>

namespace fastget::core {

/**
 * ThreadPool - FIFO thread pool
 * 
 * Features:
 * - Configurable thread count
 * - Future-based results (exceptions travel through the future)
 * - Graceful shutdown: queued tasks still run before the workers exit
 */
class ThreadPool {
public:
    /**
     * Constructor
     * @param numThreads Number of worker threads (0 = hardware concurrency)
     */
    explicit ThreadPool(size_t numThreads = 0) 
        : m_stop(false) {
        
        if (numThreads == 0) {
            numThreads = std::thread::hardware_concurrency();
            if (numThreads == 0) numThreads = 4; // Fallback
        }
        
        m_workers.reserve(numThreads);

        try {
            for (size_t i = 0; i < numThreads; ++i) {
                m_workers.emplace_back([this] {
                    workerLoop();
                });
            }
        } catch (...) {
            // Join the threads already started before propagating
            shutdown();
            throw;
        }
    }
    
    /**
     * Destructor - waits for all tasks to complete
     */
    ~ThreadPool() {
        shutdown();
    }
    
    // Disable copy and move
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;
    
    /**
     * Submit a task for execution
     * @param f Function to execute
     * @param args Function arguments
     * @return Future for the result
     */
    template<class F, class... Args>
    auto submit(F&& f, Args&&... args) 
        -> std::future<std::invoke_result_t<F, Args...>> {
        
        using ReturnType = std::invoke_result_t<F, Args...>;
        
        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );
        
        std::future<ReturnType> result = task->get_future();
        
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            
            if (m_stop) {
                throw std::runtime_error("Cannot submit to stopped ThreadPool");
            }
            
            m_tasks.emplace([task]() { (*task)(); });
        }
        
        m_condition.notify_one();
        return result;
    }
    
    /**
     * Get number of worker threads
     * @return Thread count
     */
    size_t size() const {
        return m_workers.size();
    }
    
private:
    void shutdown() {
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_stop = true;
        }

        m_condition.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    /**
     * Worker thread loop
     */
    void workerLoop() {
        while (true) {
            std::function<void()> task;
            
            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                
                m_condition.wait(lock, [this] {
                    return m_stop || !m_tasks.empty();
                });
                
                if (m_stop && m_tasks.empty()) {
                    return;
                }
                
                task = std::move(m_tasks.front());
                m_tasks.pop();
            }
            
            // packaged_task stores any exception in its future
            task();
        }
    }

private:
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;
    
    std::mutex m_queueMutex;
    std::condition_variable m_condition;
    
    std::atomic<bool> m_stop;
};

} // namespace fastget::core

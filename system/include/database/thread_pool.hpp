// ============= include/database/thread_pool.hpp =============
/*
 * Thread Pool para el ingest batch
 *
 * CARACTERÍSTICAS:
 * - Cola FIFO única, N workers fijos
 * - submit() retorna std::future (las excepciones viajan en el future)
 * - wait_all() bloquea hasta cola vacía y sin tareas en curso
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace autoface {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))>;

    size_t pending_tasks() const;
    size_t active_threads() const { return workers.size(); }

    void wait_all();
    void stop();

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    mutable std::mutex queue_mutex;
    std::condition_variable condition;
    std::condition_variable idle;
    bool stop_flag = false;
    size_t active_count = 0;

    void worker_thread();
};

// ==================== IMPLEMENTATION ====================

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))> {
    using return_type = decltype(f(args...));

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_flag) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks.push([task]() { (*task)(); });
    }

    condition.notify_one();
    return result;
}

} // namespace autoface

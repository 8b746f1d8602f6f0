#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace sgate {

/**
 * @brief Worker pool that runs all tasks of one key on one worker, in order
 *
 * Tasks are routed by hash(key) % workers, so work for one source IP is
 * never processed concurrently while different IPs proceed in parallel.
 */
class StripedExecutor {
public:
    explicit StripedExecutor(size_t num_threads = std::thread::hardware_concurrency());
    ~StripedExecutor();

    // Non-copyable, non-movable
    StripedExecutor(const StripedExecutor&) = delete;
    StripedExecutor& operator=(const StripedExecutor&) = delete;

    /// Submit task for `key`, returns future with result
    template<class F, class... Args>
    auto submit(const std::string& key, F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    /// Drains queued tasks, then joins the workers
    void shutdown();

    size_t pending_tasks() const noexcept;
    size_t total_threads() const noexcept;
    bool is_running() const noexcept;

    /// Worker index a key is routed to.
    size_t worker_for(const std::string& key) const noexcept;

private:
    struct Worker {
        std::thread thread;
        std::queue<std::function<void()>> tasks;
        std::mutex mutex;
        std::condition_variable condition;
    };

    void run(Worker& w);
    void enqueue(const std::string& key, std::function<void()> task);

    std::vector<std::unique_ptr<Worker>> workers_;
    std::atomic<bool> stop_{false};
};

template<class F, class... Args>
auto StripedExecutor::submit(const std::string& key, F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
{
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    // Take the future before enqueueing; the worker may run the task immediately
    std::future<return_type> result = task->get_future();
    enqueue(key, [task]() { (*task)(); });
    return result;
}

} // namespace sgate

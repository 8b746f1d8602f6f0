#include "../include/sgate_thread_pool.hpp"

namespace sgate {

StripedExecutor::StripedExecutor(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.push_back(std::make_unique<Worker>());
    }
    for (auto& w : workers_) {
        Worker* raw = w.get();
        raw->thread = std::thread([this, raw] { run(*raw); });
    }
}

StripedExecutor::~StripedExecutor() {
    shutdown();
}

void StripedExecutor::run(Worker& w) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(w.mutex);
            w.condition.wait(lock, [this, &w] {
                return stop_ || !w.tasks.empty();
            });
            if (stop_ && w.tasks.empty()) {
                return;
            }
            task = std::move(w.tasks.front());
            w.tasks.pop();
        }
        task();
    }
}

size_t StripedExecutor::worker_for(const std::string& key) const noexcept {
    return std::hash<std::string>{}(key) % workers_.size();
}

void StripedExecutor::enqueue(const std::string& key, std::function<void()> task) {
    Worker& w = *workers_[worker_for(key)];
    {
        std::lock_guard<std::mutex> lock(w.mutex);
        if (stop_) {
            throw std::runtime_error("submit on stopped StripedExecutor");
        }
        w.tasks.push(std::move(task));
    }
    w.condition.notify_one();
}

void StripedExecutor::shutdown() {
    if (stop_.exchange(true)) return;
    for (auto& w : workers_) {
        // Lock so a worker between its predicate check and wait sees stop_
        { std::lock_guard<std::mutex> lock(w->mutex); }
        w->condition.notify_all();
    }
    for (auto& w : workers_) {
        if (w->thread.joinable()) {
            w->thread.join();
        }
    }
}

size_t StripedExecutor::pending_tasks() const noexcept {
    size_t n = 0;
    for (const auto& w : workers_) {
        std::lock_guard<std::mutex> lock(w->mutex);
        n += w->tasks.size();
    }
    return n;
}

size_t StripedExecutor::total_threads() const noexcept {
    return workers_.size();
}

bool StripedExecutor::is_running() const noexcept {
    return !stop_.load();
}

} // namespace sgate

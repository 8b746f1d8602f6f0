/**
 * @file scheduler.cpp
 * @brief Periodic job loop
 *
 * Threading model:
 *   - mu protects the job table and stats.
 *   - Jobs run with mu released, so stop() and add_job() never wait for
 *     a job; stop() only waits in join() for the in-flight one.
 */

#include "../include/sgate_scheduler.hpp"
#include "../include/sgate_logger.hpp"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>

namespace sgate {

struct Scheduler::Impl {
    struct Entry {
        std::string name;
        std::chrono::milliseconds interval;
        Job job;
        std::chrono::steady_clock::time_point next_run;
        SchedulerJobStats stats;
    };

    std::vector<std::shared_ptr<Entry>> jobs;
    uint64_t generation = 0;    // bumped by add_job()
    std::atomic<bool> running{false};
    std::thread scheduler_thread;
    mutable std::mutex mu;
    std::condition_variable cv;

    void run_entry(Entry& e) {
        std::string error;
        try {
            e.job();
        } catch (const std::exception& ex) {
            error = ex.what();
        }

        std::lock_guard<std::mutex> lock(mu);
        e.stats.runs++;
        if (!error.empty()) {
            e.stats.failures++;
            e.stats.last_error = error;
            SGATE_LOG_ERROR("scheduler", e.name + " failed: " + error);
        }
        e.next_run = std::chrono::steady_clock::now() + e.interval;
    }

    void scheduler_loop() {
        while (running.load()) {
            std::vector<std::shared_ptr<Entry>> due;
            {
                std::unique_lock<std::mutex> lock(mu);

                // Idle wake-up bound; add_job() notifies anyway
                auto earliest = std::chrono::steady_clock::now() + std::chrono::hours(1);
                for (const auto& e : jobs) {
                    if (e->next_run < earliest) earliest = e->next_run;
                }

                uint64_t seen = generation;
                cv.wait_until(lock, earliest, [this, seen]{
                    return !running.load() || generation != seen;
                });
                if (!running.load()) break;

                auto now = std::chrono::steady_clock::now();
                for (const auto& e : jobs) {
                    if (e->next_run <= now) due.push_back(e);
                }
            }

            for (const auto& e : due) {
                if (!running.load()) break;
                run_entry(*e);
            }
        }
    }
};

Scheduler::Scheduler() : impl_(std::make_unique<Impl>()) {}

Scheduler::~Scheduler() {
    if (impl_ && impl_->running.load()) stop();
}

void Scheduler::add_job(const std::string& name, std::chrono::milliseconds interval, Job job) {
    if (interval.count() <= 0) interval = std::chrono::milliseconds(1);
    auto e = std::make_shared<Impl::Entry>();
    e->name = name;
    e->interval = interval;
    e->job = std::move(job);
    e->next_run = std::chrono::steady_clock::now() + interval;
    e->stats.name = name;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        impl_->jobs.push_back(std::move(e));
        impl_->generation++;
    }
    impl_->cv.notify_all();
}

void Scheduler::start() {
    if (impl_->running.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        auto now = std::chrono::steady_clock::now();
        for (auto& e : impl_->jobs) e->next_run = now + e->interval;
    }
    impl_->scheduler_thread = std::thread(&Impl::scheduler_loop, impl_.get());
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        impl_->running = false;
    }
    impl_->cv.notify_all();
    if (impl_->scheduler_thread.joinable()) impl_->scheduler_thread.join();
}

bool Scheduler::is_running() const { return impl_->running.load(); }

std::vector<SchedulerJobStats> Scheduler::get_stats() const {
    std::lock_guard<std::mutex> lk(impl_->mu);
    std::vector<SchedulerJobStats> out;
    for (const auto& e : impl_->jobs) out.push_back(e->stats);
    return out;
}

} // namespace sgate

#pragma once

/**
 * @file sgate_scheduler.hpp
 * @brief Single background thread running periodic jobs
 *
 * Drives ban expiry (BanEngine::tick) and periodic rule consolidation.
 * Jobs run one at a time on the scheduler thread; a job that throws is
 * logged and rescheduled. stop() lets an in-flight job finish.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sgate {

struct SchedulerJobStats {
    std::string name;
    uint64_t runs = 0;
    uint64_t failures = 0;
    std::string last_error;
};

class Scheduler {
public:
    using Job = std::function<void()>;

    Scheduler();
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// First run is one `interval` after start() (or after now, if running).
    void add_job(const std::string& name, std::chrono::milliseconds interval, Job job);

    void start();
    void stop();
    bool is_running() const;

    std::vector<SchedulerJobStats> get_stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sgate

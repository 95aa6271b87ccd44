#pragma once

#include "leastpriv/types.hpp"
#include "leastpriv/work_queue.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace leastpriv {

// ============================================================================
// Bounded Collection Scheduler
// ============================================================================

struct SchedulerOptions {
    size_t workers = 10;
    std::chrono::milliseconds stall_timeout = std::chrono::minutes(5);
};

struct BatchResult {
    std::vector<ApplicationAnalysis> completed;   // completion order
    std::vector<Application> pending;             // submitted, not reported before a stall
    size_t submitted = 0;
    bool timed_out = false;
};

using ApplicationTask = std::function<ApplicationAnalysis(const Application&)>;

// Fans applications out over a fixed-width worker pool.
//
// Applications go onto a work queue; each worker pops one at a time, runs the
// task and pushes the result onto a results queue drained by run(). A task
// that throws produces a failure-annotated result for that application only.
// If no result arrives for stall_timeout, run() stops waiting, drops the
// queued work and returns what has completed. Workers still inside a task are
// detached and finish on their own, so the task must own (or share ownership
// of) everything it touches.
class CollectionScheduler {
public:
    explicit CollectionScheduler(SchedulerOptions options = {});
    ~CollectionScheduler();

    CollectionScheduler(const CollectionScheduler&) = delete;
    CollectionScheduler& operator=(const CollectionScheduler&) = delete;

    BatchResult run(const std::vector<Application>& applications, ApplicationTask task);

    const SchedulerOptions& options() const { return options_; }

private:
    struct Shared {
        WorkQueue<Application> work;
        WorkQueue<ApplicationAnalysis> results;
        ApplicationTask task;
    };

    static void worker_loop(std::shared_ptr<Shared> shared);

    void join_workers();

    SchedulerOptions options_;
    std::vector<std::thread> workers_;
};

// Failure-annotated analysis for an application whose task did not complete
ApplicationAnalysis failed_analysis(const Application& application, const std::string& error);

} // namespace leastpriv

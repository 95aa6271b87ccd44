#include "leastpriv/scheduler.hpp"

#include <algorithm>
#include <exception>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

namespace leastpriv {

ApplicationAnalysis failed_analysis(const Application& application, const std::string& error) {
    ApplicationAnalysis analysis;
    analysis.application = application;
    analysis.ok = false;
    analysis.error = error;
    return analysis;
}

CollectionScheduler::CollectionScheduler(SchedulerOptions options)
    : options_(options) {
    if (options_.workers == 0) options_.workers = 1;
}

CollectionScheduler::~CollectionScheduler() {
    join_workers();
}

void CollectionScheduler::join_workers() {
    for (auto& th : workers_) {
        if (th.joinable()) th.join();
    }
    workers_.clear();
}

void CollectionScheduler::worker_loop(std::shared_ptr<Shared> shared) {
    for (;;) {
        auto application = shared->work.wait_pop();
        if (!application) break;

        ApplicationAnalysis analysis;
        try {
            analysis = shared->task(*application);
        } catch (const std::exception& e) {
            analysis = failed_analysis(*application, e.what());
        } catch (...) {
            analysis = failed_analysis(*application, "unknown error");
        }

        if (!analysis.ok) {
            spdlog::warn("Analysis failed for {}: {}", application->id, analysis.error);
        }
        shared->results.push(std::move(analysis));
    }
}

BatchResult CollectionScheduler::run(const std::vector<Application>& applications,
                                     ApplicationTask task) {
    BatchResult batch;
    batch.submitted = applications.size();
    if (applications.empty()) {
        return batch;
    }

    auto shared = std::make_shared<Shared>();
    shared->task = std::move(task);
    for (const auto& app : applications) {
        shared->work.push(app);
    }
    shared->work.close();

    size_t width = std::min(options_.workers, applications.size());
    spdlog::debug("Starting {} collection workers for {} applications", width, applications.size());
    workers_.reserve(width);
    for (size_t i = 0; i < width; ++i) {
        workers_.emplace_back(worker_loop, shared);
    }

    while (batch.completed.size() < batch.submitted) {
        auto analysis = shared->results.wait_pop_for(options_.stall_timeout);
        if (!analysis) {
            batch.timed_out = true;
            break;
        }
        batch.completed.push_back(std::move(*analysis));
        spdlog::info("Completed {} ({}/{})", batch.completed.back().application.id,
                     batch.completed.size(), batch.submitted);
    }

    if (!batch.timed_out) {
        join_workers();
        return batch;
    }

    shared->work.close_and_clear();

    // Stragglers hold their own reference to the shared state
    for (auto& th : workers_) th.detach();
    workers_.clear();

    std::unordered_map<std::string, size_t> reported;
    for (const auto& a : batch.completed) {
        ++reported[a.application.id];
    }
    for (const auto& app : applications) {
        auto it = reported.find(app.id);
        if (it != reported.end() && it->second > 0) {
            --it->second;
            continue;
        }
        batch.pending.push_back(app);
    }

    spdlog::warn("No collection result for {} ms; returning {} of {} applications ({} outstanding)",
                 options_.stall_timeout.count(), batch.completed.size(), batch.submitted,
                 batch.pending.size());
    return batch;
}

} // namespace leastpriv

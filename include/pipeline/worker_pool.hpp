#pragma once

#include "pipeline/package_report.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace corpus {

/**
 * @brief Bounded pool of forked worker processes.
 *
 * Each job runs in its own child process; at most `workers` children are
 * alive at once. A child sends its PackageReport back over a pipe and
 * exits. Reports are handed to the callback in completion order, never
 * submission order.
 *
 * A job that throws yields a Failed report. A child that dies without
 * writing a report (crash, _exit, signal) also yields a Failed report built
 * from the job's name and rank. Neither affects any other job.
 */
class WorkerPool {
  public:
    struct Job {
        std::string name;
        int rank = 0;
        std::function<PackageReport()> task;
    };

    using ReportSink = std::function<void(const PackageReport&)>;

    explicit WorkerPool(std::size_t workers) : workers_(workers == 0 ? 1 : workers) {}

    // Returns the number of jobs that were never started because the batch
    // was cancelled.
    std::size_t Run(std::vector<Job> jobs, const ReportSink& on_report);

    std::size_t Workers() const { return workers_; }

  private:
    std::size_t workers_;
};

} // namespace corpus

#pragma once

#include "pipeline/package_report.hpp"
#include "pipeline/worker_pool.hpp"
#include "util/config.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace corpus {

class BatchSummary {
  public:
    void Add(const PackageReport& report);

    std::size_t Total() const { return total_; }
    std::size_t Count(PackageState state) const;
    std::size_t Count(SkipReason reason) const;
    std::size_t NotStarted() const { return not_started_; }
    void SetNotStarted(std::size_t n) { not_started_ = n; }

    // Directories the verifier rejected, kept on disk for follow-up.
    const std::vector<std::string>& RetainedCorpora() const { return retained_; }

    // True when any package ended Failed or Retained.
    bool NeedsAttention() const;

    void Log() const;

  private:
    std::size_t total_ = 0;
    std::size_t not_started_ = 0;
    std::map<PackageState, std::size_t> by_state_;
    std::map<SkipReason, std::size_t> by_reason_;
    std::vector<std::string> retained_;
};

// Creates the data directory and the shared extraction workspace.
Result PrepareWorkspace(const config::HarnessConfig& cfg);

// Source archives already in the workspace (*.tar.gz, *.tgz, *.zip), sorted.
std::vector<std::string> ListWorkspaceArchives(const std::string& workspace);

// Runs every job on the pool, logging each report as it arrives.
BatchSummary RunBatch(WorkerPool& pool, std::vector<WorkerPool::Job> jobs);

} // namespace corpus

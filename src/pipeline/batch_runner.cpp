#include "pipeline/batch_runner.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace corpus {

void BatchSummary::Add(const PackageReport& report) {
    total_++;
    by_state_[report.state]++;
    if (report.state == PackageState::Skipped) {
        by_reason_[report.skip_reason]++;
    }
    if ((report.state == PackageState::Retained || report.state == PackageState::Failed) &&
        !report.corpus_root.empty()) {
        retained_.push_back(report.corpus_root);
    }
}

std::size_t BatchSummary::Count(PackageState state) const {
    auto it = by_state_.find(state);
    return it == by_state_.end() ? 0 : it->second;
}

std::size_t BatchSummary::Count(SkipReason reason) const {
    auto it = by_reason_.find(reason);
    return it == by_reason_.end() ? 0 : it->second;
}

bool BatchSummary::NeedsAttention() const {
    return Count(PackageState::Failed) > 0 || Count(PackageState::Retained) > 0;
}

void BatchSummary::Log() const {
    LogInfo("Batch finished: %zu packages", total_);
    for (const auto& [state, n] : by_state_) {
        LogInfo("  %-16s %zu", ToString(state), n);
    }
    for (const auto& [reason, n] : by_reason_) {
        LogInfo("    skipped/%-20s %zu", ToString(reason), n);
    }
    if (not_started_ > 0) {
        LogWarn("  not started      %zu", not_started_);
    }
    for (const auto& dir : retained_) {
        LogWarn("Needs attention: %s", dir.c_str());
    }
}

Result PrepareWorkspace(const config::HarnessConfig& cfg) {
    std::error_code ec;
    fs::create_directories(cfg.WorkspaceDir(), ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot create " + cfg.WorkspaceDir() + ": " + ec.message());
    }
    return Result::Ok();
}

std::vector<std::string> ListWorkspaceArchives(const std::string& workspace) {
    std::vector<std::string> out;
    std::error_code ec;
    fs::directory_iterator it(workspace, ec);
    if (ec) {
        LogWarn("cannot list %s: %s", workspace.c_str(), ec.message().c_str());
        return out;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        const std::string name = it->path().filename().string();
        if (EndsWith(name, ".tar.gz") || EndsWith(name, ".tgz") || EndsWith(name, ".zip")) {
            out.push_back(it->path().string());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

BatchSummary RunBatch(WorkerPool& pool, std::vector<WorkerPool::Job> jobs) {
    BatchSummary summary;
    const std::size_t total = jobs.size();
    LogInfo("Processing %zu packages with %zu workers", total, pool.Workers());

    const std::size_t not_started = pool.Run(std::move(jobs), [&](const PackageReport& r) {
        summary.Add(r);
        if (r.state == PackageState::Skipped) {
            LogInfo("[%zu/%zu] %s: skipped (%s) %s",
                    summary.Total(), total, r.name.c_str(), ToString(r.skip_reason), r.detail.c_str());
        } else if (r.state == PackageState::Failed || r.state == PackageState::Retained) {
            LogWarn("[%zu/%zu] %s: %s %s %s",
                    summary.Total(), total, r.name.c_str(), ToString(r.state),
                    r.corpus_root.c_str(), r.detail.c_str());
        } else {
            LogInfo("[%zu/%zu] %s: %s", summary.Total(), total, r.name.c_str(), ToString(r.state));
        }
    });
    summary.SetNotStarted(not_started);
    return summary;
}

} // namespace corpus

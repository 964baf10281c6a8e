#include <gtest/gtest.h>

#include "pipeline/batch_runner.hpp"
#include "testing.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace corpus {

namespace {

PackageReport Report(const std::string& name, PackageState state, const std::string& root = "") {
    PackageReport r;
    r.name = name;
    r.state = state;
    r.corpus_root = root;
    return r;
}

} // namespace

TEST(BatchSummaryTest, CountsStatesAndSkipReasons) {
    BatchSummary summary;
    summary.Add(Report("a", PackageState::Cleaned));
    summary.Add(Report("b", PackageState::Cleaned));
    summary.Add(Report("c", PackageState::VerifiedAbsent));

    PackageReport skipped = Report("d", PackageState::Pending);
    skipped.Skip(SkipReason::NoSourceArtifact, "wheels only");
    summary.Add(skipped);

    EXPECT_EQ(summary.Total(), 4U);
    EXPECT_EQ(summary.Count(PackageState::Cleaned), 2U);
    EXPECT_EQ(summary.Count(PackageState::Skipped), 1U);
    EXPECT_EQ(summary.Count(SkipReason::NoSourceArtifact), 1U);
    EXPECT_EQ(summary.Count(SkipReason::DigestMismatch), 0U);
    EXPECT_FALSE(summary.NeedsAttention());
    EXPECT_TRUE(summary.RetainedCorpora().empty());
}

TEST(BatchSummaryTest, RetainedAndFailedNeedAttention) {
    BatchSummary summary;
    summary.Add(Report("delta", PackageState::Retained, "/ws/delta-2.0"));
    summary.Add(Report("eps", PackageState::Failed, "/ws/eps-1.0"));
    summary.Add(Report("crashed", PackageState::Failed));

    EXPECT_TRUE(summary.NeedsAttention());
    EXPECT_EQ(summary.RetainedCorpora(), (std::vector<std::string>{"/ws/delta-2.0", "/ws/eps-1.0"}));
}

TEST(WorkspaceTest, PrepareCreatesWorkspace) {
    testutil::TemporaryDirectory tmp;
    config::HarnessConfig cfg;
    cfg.data_dir = tmp.Path() + "/nested/data";

    auto r = PrepareWorkspace(cfg);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_TRUE(fs::is_directory(cfg.WorkspaceDir()));

    // Running it again is harmless.
    EXPECT_TRUE(PrepareWorkspace(cfg).is_ok());
}

TEST(WorkspaceTest, PrepareFailsWhenPathIsAFile) {
    testutil::TemporaryDirectory tmp;
    config::HarnessConfig cfg;
    cfg.data_dir = tmp.Path() + "/data";
    testutil::WriteFile(cfg.data_dir, "not a directory");

    EXPECT_FALSE(PrepareWorkspace(cfg).is_ok());
}

TEST(WorkspaceTest, ListsOnlySourceArchivesSorted) {
    testutil::TemporaryDirectory tmp;
    const std::string ws = tmp.Path();
    testutil::WriteFile(ws + "/zeta-1.0.zip", "z");
    testutil::WriteFile(ws + "/alpha-1.0.tar.gz", "a");
    testutil::WriteFile(ws + "/eta-1.0.tgz", "e");
    testutil::WriteFile(ws + "/alpha-1.0.tar.gz.part", "partial");
    testutil::WriteFile(ws + "/notes.txt", "n");
    fs::create_directories(ws + "/dir.zip");

    const auto archives = ListWorkspaceArchives(ws);
    const std::vector<std::string> expected = {
        ws + "/alpha-1.0.tar.gz",
        ws + "/eta-1.0.tgz",
        ws + "/zeta-1.0.zip",
    };
    EXPECT_EQ(archives, expected);
}

TEST(RunBatchTest, SummarisesReportsFromWorkers) {
    std::vector<WorkerPool::Job> jobs;
    jobs.push_back({"a", 1, [] { return Report("a", PackageState::Cleaned); }});
    jobs.push_back({"b", 2, [] { return Report("b", PackageState::Retained, "/ws/b-1.0"); }});
    jobs.push_back({"c", 3, [] { return Report("c", PackageState::Cleaned); }});

    WorkerPool pool(2);
    const BatchSummary summary = RunBatch(pool, std::move(jobs));

    EXPECT_EQ(summary.Total(), 3U);
    EXPECT_EQ(summary.Count(PackageState::Cleaned), 2U);
    EXPECT_EQ(summary.Count(PackageState::Retained), 1U);
    EXPECT_TRUE(summary.NeedsAttention());
}

} // namespace corpus

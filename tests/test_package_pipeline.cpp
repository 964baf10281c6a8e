#include <gtest/gtest.h>

#include "pipeline/batch_runner.hpp"
#include "pipeline/package_pipeline.hpp"
#include "pipeline/worker_pool.hpp"
#include "testing.hpp"
#include "verify/subprocess_verifier.hpp"

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace corpus {

namespace {

std::string MetadataUrl(const std::string& name) { return "https://registry.test/pypi/" + name + "/json"; }
std::string ArchiveUrl(const std::string& filename) { return "https://files.test/" + filename; }

class UnremovableFileSystemOps final : public RetentionPolicy::IFileSystemOps {
  public:
    Result RemoveTree(std::string_view dir) const override {
        return Result::Fail(EBUSY, "remove_all " + std::string(dir) + ": Device or resource busy");
    }
};

} // namespace

class PackagePipelineTest : public ::testing::Test {
  protected:
    void PublishRaw(const std::string& name, const std::string& filename, const std::string& body) {
        http.Serve(MetadataUrl(name),
                   testutil::MetadataJson(name, "1.0", {testutil::Sdist(filename, ArchiveUrl(filename))}));
        http.Serve(ArchiveUrl(filename), body);
    }

    void Publish(const std::string& name,
                 const std::string& filename,
                 const std::vector<testutil::ArchiveEntry>& entries,
                 testutil::FixtureFormat format = testutil::FixtureFormat::TarGz) {
        const std::string fixtures = temp_dir.Path() + "/fixtures";
        fs::create_directories(fixtures);
        testutil::WriteArchive(fixtures + "/" + filename, entries, format);
        PublishRaw(name, filename, testutil::ReadFile(fixtures + "/" + filename));
    }

    // A conventional sdist: everything under "<stem>/".
    void PublishPackage(const std::string& name,
                        const std::string& stem,
                        const std::string& filename,
                        testutil::FixtureFormat format = testutil::FixtureFormat::TarGz) {
        Publish(name, filename,
                {
                    {stem + "/", "", AE_IFDIR},
                    {stem + "/setup.py", "from setuptools import setup\nsetup()\n"},
                    {stem + "/" + name + "/__init__.py", "__version__ = '1.0'\n"},
                },
                format);
    }

    std::string WorkspacePath(const std::string& entry) const {
        return (fs::path(cfg.WorkspaceDir()) / entry).string();
    }

    testutil::TemporaryDirectory temp_dir;
    config::HarnessConfig cfg = testutil::MakeConfig(temp_dir.Path());
    testutil::FakeHttpClient http;
    testutil::FakeVerifier verifier;
    Acquirer acquirer{cfg, http};
    VerificationAdapter adapter{verifier, VerifierSpec{}};
    PackagePipeline pipeline{cfg, &acquirer, &adapter};
};

TEST_F(PackagePipelineTest, CleanPackageIsRemovedAfterVerification) {
    PublishPackage("alpha", "alpha-1.0", "alpha-1.0.tar.gz");

    const auto report = pipeline.Run({"alpha", 1});
    EXPECT_EQ(report.state, PackageState::Cleaned) << report.detail;
    ASSERT_TRUE(report.verify_status.has_value());
    EXPECT_EQ(*report.verify_status, 0);
    EXPECT_FALSE(report.cleanup_failed);
    EXPECT_EQ(fs::path(report.corpus_root).filename().string(), "alpha-1.0");

    ASSERT_EQ(verifier.calls.size(), 1U);
    EXPECT_EQ(verifier.calls[0].root, report.corpus_root);
    EXPECT_FALSE(fs::exists(WorkspacePath("alpha-1.0")));
    // The archive stays so a later run need not fetch it again.
    EXPECT_TRUE(fs::exists(WorkspacePath("alpha-1.0.tar.gz")));
}

TEST_F(PackagePipelineTest, WheelOnlyPackageIsSkippedBeforeDownload) {
    http.Serve(MetadataUrl("beta"),
               testutil::MetadataJson("beta", "3.0", {testutil::Wheel("beta-3.0-py3-none-any.whl", ArchiveUrl("b.whl"))}));

    const auto report = pipeline.Run({"beta", 2});
    EXPECT_EQ(report.state, PackageState::Skipped);
    EXPECT_EQ(report.skip_reason, SkipReason::NoSourceArtifact);
    EXPECT_EQ(http.requests.size(), 1U);
    EXPECT_TRUE(verifier.calls.empty());
}

TEST_F(PackagePipelineTest, SingleFilePackageIsVerifiedAbsent) {
    Publish("gamma", "gamma-0.1.tar.gz", {{"gamma.py", "print('hi')\n"}});

    const auto report = pipeline.Run({"gamma", 3});
    EXPECT_EQ(report.state, PackageState::VerifiedAbsent);
    EXPECT_FALSE(report.verify_status.has_value());
    EXPECT_TRUE(verifier.calls.empty());
    EXPECT_TRUE(fs::exists(WorkspacePath("gamma.py")));
}

TEST_F(PackagePipelineTest, RejectedCorpusIsRetained) {
    PublishPackage("delta", "delta-2.0", "delta-2.0.tar.gz");
    verifier.status_by_dir["delta-2.0"] = 1;

    const auto report = pipeline.Run({"delta", 4});
    EXPECT_EQ(report.state, PackageState::Retained);
    ASSERT_TRUE(report.verify_status.has_value());
    EXPECT_EQ(*report.verify_status, 1);
    EXPECT_TRUE(fs::is_regular_file(WorkspacePath("delta-2.0/setup.py")));
}

TEST_F(PackagePipelineTest, RerunReusesDownloadedArchive) {
    PublishPackage("alpha", "alpha-1.0", "alpha-1.0.tar.gz");

    EXPECT_EQ(pipeline.Run({"alpha", 1}).state, PackageState::Cleaned);
    EXPECT_EQ(pipeline.Run({"alpha", 1}).state, PackageState::Cleaned);

    EXPECT_EQ(http.Requests(ArchiveUrl("alpha-1.0.tar.gz")), 1);
    EXPECT_EQ(http.Requests(MetadataUrl("alpha")), 2);
    EXPECT_EQ(verifier.calls.size(), 2U);
}

TEST_F(PackagePipelineTest, HandlesEverySupportedArchiveKind) {
    PublishPackage("eta", "eta-1.0", "eta-1.0.tgz", testutil::FixtureFormat::TarGz);
    PublishPackage("theta", "theta-1.0", "theta-1.0.tar", testutil::FixtureFormat::Tar);
    PublishPackage("zeta", "zeta-1.0", "zeta-1.0.zip", testutil::FixtureFormat::Zip);

    EXPECT_EQ(pipeline.Run({"eta", 1}).state, PackageState::Cleaned);
    EXPECT_EQ(pipeline.Run({"theta", 2}).state, PackageState::Cleaned);
    EXPECT_EQ(pipeline.Run({"zeta", 3}).state, PackageState::Cleaned);
    EXPECT_EQ(verifier.calls.size(), 3U);
}

TEST_F(PackagePipelineTest, UnrecognizedArchiveIsSkipped) {
    PublishRaw("bogus", "bogus-1.0.zip", "this is a text file, not a zip\n");

    const auto report = pipeline.Run({"bogus", 5});
    EXPECT_EQ(report.state, PackageState::Skipped);
    EXPECT_EQ(report.skip_reason, SkipReason::UnrecognizedFormat);
    EXPECT_TRUE(verifier.calls.empty());
}

TEST_F(PackagePipelineTest, UnsafeArchiveIsSkipped) {
    Publish("evil", "evil-1.0.tar.gz", {{"evil-1.0/../../../outside.py", "import os\n"}});

    const auto report = pipeline.Run({"evil", 6});
    EXPECT_EQ(report.state, PackageState::Skipped);
    EXPECT_EQ(report.skip_reason, SkipReason::ExtractFailed);
    EXPECT_TRUE(verifier.calls.empty());
}

TEST_F(PackagePipelineTest, VerifierExceptionFailsOnlyThatPackage) {
    PublishPackage("eps", "eps-1.0", "eps-1.0.tar.gz");
    PublishPackage("alpha", "alpha-1.0", "alpha-1.0.tar.gz");
    verifier.throw_for = "eps-1.0";

    const auto failed = pipeline.Run({"eps", 1});
    EXPECT_EQ(failed.state, PackageState::Failed);
    EXPECT_NE(failed.detail.find("verifier crashed"), std::string::npos);
    EXPECT_TRUE(fs::exists(WorkspacePath("eps-1.0")));

    EXPECT_EQ(pipeline.Run({"alpha", 2}).state, PackageState::Cleaned);
}

TEST_F(PackagePipelineTest, VerifierThatCannotStartFailsPackage) {
    PublishPackage("alpha", "alpha-1.0", "alpha-1.0.tar.gz");
    VerifierSpec spec;
    spec.command = {"/nonexistent/verifier"};
    SubprocessVerifier unlaunchable(spec);
    VerificationAdapter unlaunchable_adapter(unlaunchable, spec);
    PackagePipeline misconfigured(cfg, &acquirer, &unlaunchable_adapter);

    const auto report = misconfigured.Run({"alpha", 1});
    EXPECT_EQ(report.state, PackageState::Failed);
    EXPECT_NE(report.detail.find("cannot execute /nonexistent/verifier"), std::string::npos);
    EXPECT_TRUE(fs::exists(WorkspacePath("alpha-1.0")));
}

TEST_F(PackagePipelineTest, CleanupFailureIsFlaggedNotFatal) {
    PublishPackage("alpha", "alpha-1.0", "alpha-1.0.tar.gz");
    PackagePipeline stuck(cfg, &acquirer, &adapter, RetentionPolicy(std::make_shared<UnremovableFileSystemOps>()));

    const auto report = stuck.Run({"alpha", 1});
    EXPECT_EQ(report.state, PackageState::Cleaned);
    EXPECT_TRUE(report.cleanup_failed);
    EXPECT_TRUE(fs::exists(WorkspacePath("alpha-1.0")));
}

TEST_F(PackagePipelineTest, FetchStopsAfterDownload) {
    PublishPackage("alpha", "alpha-1.0", "alpha-1.0.tar.gz");

    const auto report = pipeline.Fetch({"alpha", 1});
    EXPECT_EQ(report.state, PackageState::ArchiveFetched);
    EXPECT_TRUE(fs::exists(WorkspacePath("alpha-1.0.tar.gz")));
    EXPECT_FALSE(fs::exists(WorkspacePath("alpha-1.0")));
    EXPECT_TRUE(verifier.calls.empty());
}

TEST_F(PackagePipelineTest, VerifyArchiveUsesArchiveOnDisk) {
    testutil::WriteArchive(WorkspacePath("local-0.3.zip"),
                           {{"local-0.3/", "", AE_IFDIR}, {"local-0.3/mod.py", "x = 1\n"}},
                           testutil::FixtureFormat::Zip);
    PackagePipeline verify_only(cfg, nullptr, &adapter);

    const auto report = verify_only.VerifyArchive(WorkspacePath("local-0.3.zip"));
    EXPECT_EQ(report.name, "local-0.3.zip");
    EXPECT_EQ(report.state, PackageState::Cleaned);
    EXPECT_TRUE(http.requests.empty());
}

TEST_F(PackagePipelineTest, MissingStageIsALogicError) {
    PackagePipeline verify_only(cfg, nullptr, &adapter);
    EXPECT_THROW(verify_only.Run({"alpha", 1}), std::logic_error);
    EXPECT_THROW(verify_only.Fetch({"alpha", 1}), std::logic_error);

    PackagePipeline fetch_only(cfg, &acquirer, nullptr);
    EXPECT_THROW(fetch_only.Run({"alpha", 1}), std::logic_error);
    EXPECT_THROW(fetch_only.VerifyArchive(WorkspacePath("alpha-1.0.tar.gz")), std::logic_error);
}

TEST_F(PackagePipelineTest, MixedBatchRunsInWorkers) {
    PublishPackage("alpha", "alpha-1.0", "alpha-1.0.tar.gz");
    http.Serve(MetadataUrl("beta"),
               testutil::MetadataJson("beta", "3.0", {testutil::Wheel("beta-3.0-py3-none-any.whl", ArchiveUrl("b.whl"))}));
    Publish("gamma", "gamma-0.1.tar.gz", {{"gamma.py", "print('hi')\n"}});
    PublishPackage("delta", "delta-2.0", "delta-2.0.tar.gz");
    verifier.status_by_dir["delta-2.0"] = 1;

    std::vector<WorkerPool::Job> jobs;
    const std::vector<PackageRef> refs = {{"alpha", 1}, {"beta", 2}, {"gamma", 3}, {"delta", 4}};
    for (const auto& ref : refs) {
        jobs.push_back({ref.name, ref.rank, [this, ref] { return pipeline.Run(ref); }});
    }

    WorkerPool pool(2);
    const BatchSummary summary = RunBatch(pool, std::move(jobs));

    EXPECT_EQ(summary.Total(), 4U);
    EXPECT_EQ(summary.Count(PackageState::Cleaned), 1U);
    EXPECT_EQ(summary.Count(PackageState::Skipped), 1U);
    EXPECT_EQ(summary.Count(SkipReason::NoSourceArtifact), 1U);
    EXPECT_EQ(summary.Count(PackageState::VerifiedAbsent), 1U);
    EXPECT_EQ(summary.Count(PackageState::Retained), 1U);
    EXPECT_EQ(summary.NotStarted(), 0U);
    EXPECT_TRUE(summary.NeedsAttention());
    ASSERT_EQ(summary.RetainedCorpora().size(), 1U);
    EXPECT_EQ(fs::path(summary.RetainedCorpora()[0]).filename().string(), "delta-2.0");

    EXPECT_FALSE(fs::exists(WorkspacePath("alpha-1.0")));
    EXPECT_TRUE(fs::exists(WorkspacePath("delta-2.0")));
}

} // namespace corpus

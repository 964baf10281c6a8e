#include "pipeline/package_pipeline.hpp"

#include "util/logger.hpp"

#include <filesystem>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace corpus {

PackagePipeline::PackagePipeline(const config::HarnessConfig& cfg,
                                 Acquirer* acquirer,
                                 VerificationAdapter* verifier,
                                 RetentionPolicy retention)
    : cfg_(cfg), acquirer_(acquirer), verifier_(verifier), retention_(std::move(retention)) {}

PackageReport PackagePipeline::Fetch(const PackageRef& ref) {
    if (!acquirer_) throw std::logic_error("pipeline has no acquisition stage");

    PackageReport report;
    (void)acquirer_->Acquire(ref, report);
    return report;
}

PackageReport PackagePipeline::VerifyArchive(const std::string& archive_path) {
    PackageReport report;
    report.name = fs::path(archive_path).filename().string();
    report.state = PackageState::ArchiveFetched;
    return ExtractAndVerify(archive_path, std::move(report));
}

PackageReport PackagePipeline::Run(const PackageRef& ref) {
    if (!acquirer_) throw std::logic_error("pipeline has no acquisition stage");
    if (!verifier_) throw std::logic_error("pipeline has no verification stage");

    PackageReport report;
    auto archive = acquirer_->Acquire(ref, report);
    if (!archive) return report;
    return ExtractAndVerify(archive->path, std::move(report));
}

PackageReport PackagePipeline::ExtractAndVerify(const std::string& archive_path, PackageReport report) {
    if (!verifier_) throw std::logic_error("pipeline has no verification stage");

    report.archive_path = archive_path;
    const std::string workspace = cfg_.WorkspaceDir();
    const std::string filename = fs::path(archive_path).filename().string();

    LogInfo("Extracting files from %s", archive_path.c_str());
    auto extracted = extractor_.ExtractAll(archive_path, workspace);
    if (!extracted) {
        const auto& failure = extracted.error();
        report.Skip(failure.kind == ExtractError::UnrecognizedFormat ? SkipReason::UnrecognizedFormat
                                                                     : SkipReason::ExtractFailed,
                    failure.msg);
        LogWarn("%s", failure.msg.c_str());
        return report;
    }
    report.state = PackageState::Extracted;
    std::string top_level;
    for (const auto& name : extracted->top_level) {
        if (!top_level.empty()) top_level += ", ";
        top_level += name;
    }
    LogInfo("Extracted %llu entries (%s) from %s into: %s",
            (unsigned long long)extracted->entries, ToString(extracted->format), filename.c_str(),
            top_level.c_str());

    auto dir = VerificationAdapter::FindExtractedDir(workspace, filename);
    if (!dir) {
        report.state = PackageState::VerifiedAbsent;
        report.detail = "single-file package";
        LogInfo("Package %s is a single file package", archive_path.c_str());
        return report;
    }
    report.corpus_root = *dir;

    const ExtractedCorpus corpus{*dir, report.name};
    auto outcome = verifier_->Run(report.name, corpus.root);
    report.verify_status = outcome.result.status;
    report.detail = outcome.result.detail;
    report.state = PackageState::Verified;

    const RetentionDecision decision = retention_.Apply(corpus, outcome.result);
    if (outcome.threw) {
        report.state = PackageState::Failed;
        return report;
    }

    switch (decision) {
        case RetentionDecision::Retained:
            report.state = PackageState::Retained;
            break;
        case RetentionDecision::CleanupFailed:
            report.cleanup_failed = true;
            report.state = PackageState::Cleaned;
            break;
        case RetentionDecision::Cleaned:
            report.state = PackageState::Cleaned;
            break;
    }
    return report;
}

} // namespace corpus

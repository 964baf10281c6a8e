#pragma once

#include "archive/archive_extractor.hpp"
#include "pipeline/acquisition.hpp"
#include "pipeline/package_report.hpp"
#include "pipeline/retention.hpp"
#include "registry/corpus_list.hpp"
#include "util/config.hpp"
#include "verify/verification_adapter.hpp"

#include <string>

namespace corpus {

/**
 * @brief Drives one package through acquire, extract, verify and retain.
 *
 * Stages run strictly in order and nothing is retried; the first
 * recoverable error ends the package in Skipped. Only a verifier exception
 * ends it in Failed. The returned report always carries a terminal state.
 *
 * acquirer may be null for verify-only batches and verifier may be null
 * for fetch-only batches; calling a mode whose stage is missing throws
 * std::logic_error.
 */
class PackagePipeline {
  public:
    PackagePipeline(const config::HarnessConfig& cfg,
                    Acquirer* acquirer,
                    VerificationAdapter* verifier,
                    RetentionPolicy retention = RetentionPolicy());

    // Acquisition only: ends ArchiveFetched on success.
    PackageReport Fetch(const PackageRef& ref);

    // Extract, verify and retain an archive already on disk.
    PackageReport VerifyArchive(const std::string& archive_path);

    // All stages.
    PackageReport Run(const PackageRef& ref);

  private:
    PackageReport ExtractAndVerify(const std::string& archive_path, PackageReport report);

    const config::HarnessConfig& cfg_;
    Acquirer* acquirer_;
    VerificationAdapter* verifier_;
    RetentionPolicy retention_;
    ArchiveExtractor extractor_;
};

} // namespace corpus

#pragma once

#include <expected>
#include <optional>
#include <string>
#include <utility>

namespace corpus {

// Per-package progression. Retained, Cleaned, VerifiedAbsent, Skipped and
// Failed are terminal; the rest only appear while a package is in flight.
enum class PackageState {
    Pending,
    MetadataFetched,
    ArchiveFetched,
    Extracted,
    Verified,
    Retained,       // verifier rejected the corpus, tree kept for follow-up
    Cleaned,        // verifier accepted the corpus, tree removed
    VerifiedAbsent, // single-file package, nothing to verify
    Skipped,        // recoverable error, see SkipReason
    Failed,         // verifier raised, or the worker died without reporting
};

enum class SkipReason {
    None,
    InvalidName,
    NoMetadata,
    BadMetadata,
    NoSourceArtifact,
    DownloadInProgress,
    DownloadFailed,
    DigestMismatch,
    UnrecognizedFormat,
    ExtractFailed,
};

const char* ToString(PackageState state);
const char* ToString(SkipReason reason);
std::optional<PackageState> PackageStateFromString(const std::string& s);
std::optional<SkipReason> SkipReasonFromString(const std::string& s);

bool IsTerminal(PackageState state);

struct PackageReport {
    std::string name;
    int rank = 0;
    PackageState state = PackageState::Pending;
    SkipReason skip_reason = SkipReason::None;
    std::string detail;
    std::string archive_path;
    std::string corpus_root;
    std::optional<int> verify_status;
    bool cleanup_failed = false;

    void Skip(SkipReason reason, std::string why) {
        state = PackageState::Skipped;
        skip_reason = reason;
        detail = std::move(why);
    }
};

// Line-oriented JSON encoding used on the worker result channel.
std::string EncodeReport(const PackageReport& report);
std::expected<PackageReport, std::string> DecodeReport(const std::string& encoded);

} // namespace corpus

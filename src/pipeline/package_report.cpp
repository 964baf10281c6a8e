#include "pipeline/package_report.hpp"

#include <array>
#include <nlohmann/json.hpp>
#include <utility>

namespace corpus {

using json = nlohmann::json;

namespace {

constexpr std::array<std::pair<PackageState, const char*>, 10> kStateNames{{
    {PackageState::Pending, "pending"},
    {PackageState::MetadataFetched, "metadata_fetched"},
    {PackageState::ArchiveFetched, "archive_fetched"},
    {PackageState::Extracted, "extracted"},
    {PackageState::Verified, "verified"},
    {PackageState::Retained, "retained"},
    {PackageState::Cleaned, "cleaned"},
    {PackageState::VerifiedAbsent, "verified_absent"},
    {PackageState::Skipped, "skipped"},
    {PackageState::Failed, "failed"},
}};

constexpr std::array<std::pair<SkipReason, const char*>, 10> kReasonNames{{
    {SkipReason::None, "none"},
    {SkipReason::InvalidName, "invalid_name"},
    {SkipReason::NoMetadata, "no_metadata"},
    {SkipReason::BadMetadata, "bad_metadata"},
    {SkipReason::NoSourceArtifact, "no_source_artifact"},
    {SkipReason::DownloadInProgress, "download_in_progress"},
    {SkipReason::DownloadFailed, "download_failed"},
    {SkipReason::DigestMismatch, "digest_mismatch"},
    {SkipReason::UnrecognizedFormat, "unrecognized_format"},
    {SkipReason::ExtractFailed, "extract_failed"},
}};

} // namespace

const char* ToString(PackageState state) {
    for (const auto& [value, name] : kStateNames) {
        if (value == state) return name;
    }
    return "unknown";
}

const char* ToString(SkipReason reason) {
    for (const auto& [value, name] : kReasonNames) {
        if (value == reason) return name;
    }
    return "unknown";
}

std::optional<PackageState> PackageStateFromString(const std::string& s) {
    for (const auto& [value, name] : kStateNames) {
        if (s == name) return value;
    }
    return std::nullopt;
}

std::optional<SkipReason> SkipReasonFromString(const std::string& s) {
    for (const auto& [value, name] : kReasonNames) {
        if (s == name) return value;
    }
    return std::nullopt;
}

bool IsTerminal(PackageState state) {
    switch (state) {
        case PackageState::Retained:
        case PackageState::Cleaned:
        case PackageState::VerifiedAbsent:
        case PackageState::Skipped:
        case PackageState::Failed:
            return true;
        default:
            return false;
    }
}

std::string EncodeReport(const PackageReport& report) {
    json j = {
        {"name", report.name},
        {"rank", report.rank},
        {"state", ToString(report.state)},
        {"skip_reason", ToString(report.skip_reason)},
        {"detail", report.detail},
        {"archive_path", report.archive_path},
        {"corpus_root", report.corpus_root},
        {"cleanup_failed", report.cleanup_failed},
    };
    if (report.verify_status) {
        j["verify_status"] = *report.verify_status;
    }
    // Invalid UTF-8 in detail text (tool output) must not abort the worker.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::expected<PackageReport, std::string> DecodeReport(const std::string& encoded) {
    try {
        auto j = json::parse(encoded);
        if (!j.is_object()) {
            return std::unexpected("report must be a JSON object");
        }

        PackageReport r;
        r.name = j.value("name", "");
        r.rank = j.value("rank", 0);
        r.detail = j.value("detail", "");
        r.archive_path = j.value("archive_path", "");
        r.corpus_root = j.value("corpus_root", "");
        r.cleanup_failed = j.value("cleanup_failed", false);

        auto state = PackageStateFromString(j.value("state", ""));
        if (!state) {
            return std::unexpected("unknown package state in report");
        }
        r.state = *state;

        auto reason = SkipReasonFromString(j.value("skip_reason", "none"));
        if (!reason) {
            return std::unexpected("unknown skip reason in report");
        }
        r.skip_reason = *reason;

        if (j.contains("verify_status") && j["verify_status"].is_number_integer()) {
            r.verify_status = j["verify_status"].get<int>();
        }
        return r;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("bad report: ") + e.what());
    }
}

} // namespace corpus

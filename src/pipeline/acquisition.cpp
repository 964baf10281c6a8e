#include "pipeline/acquisition.hpp"

#include "crypto/sha256.hpp"
#include "io/fd.hpp"
#include "registry/metadata_parser.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace corpus {

namespace {

std::string ErrnoText(int err) { return std::string(std::strerror(err)); }

bool PathExists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

// Exclusive claim on "<dest>.part". The lock is advisory (flock) so it
// disappears with the process holding it; a stale .part from a killed run
// never blocks a later one.
class DownloadReservation {
  public:
    enum class Status { Acquired, Busy, AlreadyPresent, Error };

    explicit DownloadReservation(std::string dest) : dest_(std::move(dest)), part_(dest_ + ".part") {}

    DownloadReservation(const DownloadReservation&) = delete;
    DownloadReservation& operator=(const DownloadReservation&) = delete;

    ~DownloadReservation() {
        if (fd_.Valid() && !committed_) {
            ::unlink(part_.c_str());
        }
    }

    Status Acquire(std::string& err) {
        fd_ = Fd::Open(part_, O_RDWR | O_CREAT);
        if (!fd_.Valid()) {
            err = "cannot create " + part_ + ": " + ErrnoText(errno);
            return Status::Error;
        }
        if (::flock(fd_.Get(), LOCK_EX | LOCK_NB) != 0) {
            const int e = errno;
            fd_.Close();
            if (e == EWOULDBLOCK) return Status::Busy;
            err = "flock " + part_ + ": " + ErrnoText(e);
            return Status::Error;
        }
        // Another worker may have finished between the caller's check and
        // the lock.
        if (PathExists(dest_)) {
            return Status::AlreadyPresent;
        }
        if (::ftruncate(fd_.Get(), 0) != 0) {
            err = "truncate " + part_ + ": " + ErrnoText(errno);
            return Status::Error;
        }
        return Status::Acquired;
    }

    int Get() const { return fd_.Get(); }
    const std::string& PartPath() const { return part_; }

    Result Commit() {
        auto synced = fd_.Sync();
        if (!synced.is_ok()) {
            return Result::Fail(synced.err, synced.msg + " " + part_);
        }
        if (::rename(part_.c_str(), dest_.c_str()) != 0) {
            return Result::FromErrno("rename " + part_);
        }
        committed_ = true;
        return Result::Ok();
    }

  private:
    std::string dest_;
    std::string part_;
    Fd fd_;
    bool committed_ = false;
};

} // namespace

Result Acquirer::FetchToFile(const std::string& url, const std::string& path) {
    const std::string tmp = path + ".tmp." + std::to_string(::getpid());
    Fd fd = Fd::Open(tmp, O_WRONLY | O_CREAT | O_TRUNC);
    if (!fd.Valid()) {
        return Result::FromErrno("cannot create " + tmp);
    }

    auto res = http_.Get(url, fd.Get());
    fd.Close();
    if (!res.is_ok()) {
        ::unlink(tmp.c_str());
        return res;
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        const Result failed = Result::FromErrno("rename " + tmp);
        ::unlink(tmp.c_str());
        return failed;
    }
    return Result::Ok();
}

void Acquirer::RemoveMetadata(const std::string& path) const {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LogWarn("could not remove %s: %s", path.c_str(), ec.message().c_str());
    }
}

std::optional<DownloadedArchive> Acquirer::Acquire(const PackageRef& ref, PackageReport& report) {
    report.name = ref.name;
    report.rank = ref.rank;

    if (!IsSafePathComponent(ref.name)) {
        report.Skip(SkipReason::InvalidName, "package name is not a valid path component");
        LogWarn("%s: %s", ref.name.c_str(), report.detail.c_str());
        return std::nullopt;
    }

    const std::string metadata_path = cfg_.MetadataPath(ref.name);
    const std::string metadata_url = cfg_.registry_url + "/" + ref.name + "/json";

    LogInfo("Downloading JSON data for %s", ref.name.c_str());
    auto fetched = FetchToFile(metadata_url, metadata_path);
    if (!fetched.is_ok()) {
        report.Skip(SkipReason::NoMetadata, fetched.msg);
        LogWarn("Failed downloading package data for %s: %s", ref.name.c_str(), fetched.msg.c_str());
        return std::nullopt;
    }
    report.state = PackageState::MetadataFetched;

    std::optional<DownloadedArchive> archive;
    auto metadata = MetadataParser{}.ParseFile(metadata_path);
    if (!metadata) {
        report.Skip(SkipReason::BadMetadata, metadata.error());
        LogWarn("Could not parse package data for %s: %s", ref.name.c_str(), metadata.error().c_str());
    } else if (const DistributionFile* source = SelectSourceDistribution(*metadata); source == nullptr) {
        report.Skip(SkipReason::NoSourceArtifact, "no source distribution listed");
        LogInfo("Could not locate source for %s", ref.name.c_str());
    } else if (!IsSafePathComponent(source->filename)) {
        report.Skip(SkipReason::BadMetadata, "source filename is not a valid path component: " + source->filename);
        LogWarn("%s: %s", ref.name.c_str(), report.detail.c_str());
    } else {
        archive = FetchArchive(ref, *source, report);
    }

    if (opt_.remove_metadata) {
        RemoveMetadata(metadata_path);
    }
    return archive;
}

std::optional<DownloadedArchive> Acquirer::FetchArchive(const PackageRef& ref,
                                                        const DistributionFile& source,
                                                        PackageReport& report) {
    DownloadedArchive archive;
    archive.path = cfg_.ArchivePath(source.filename);
    archive.filename = source.filename;
    archive.package_name = ref.name;
    report.archive_path = archive.path;

    if (PathExists(archive.path)) {
        LogInfo("%s already downloaded", ref.name.c_str());
        report.state = PackageState::ArchiveFetched;
        return archive;
    }

    DownloadReservation reservation(archive.path);
    std::string err;
    switch (reservation.Acquire(err)) {
        case DownloadReservation::Status::Busy:
            report.Skip(SkipReason::DownloadInProgress, "another worker is downloading " + source.filename);
            LogInfo("%s: %s", ref.name.c_str(), report.detail.c_str());
            return std::nullopt;
        case DownloadReservation::Status::AlreadyPresent:
            LogInfo("%s already downloaded", ref.name.c_str());
            report.state = PackageState::ArchiveFetched;
            return archive;
        case DownloadReservation::Status::Error:
            report.Skip(SkipReason::DownloadFailed, err);
            LogWarn("%s: %s", ref.name.c_str(), err.c_str());
            return std::nullopt;
        case DownloadReservation::Status::Acquired:
            break;
    }

    LogInfo("Downloading package %s (%s, %s, %llu bytes)", ref.name.c_str(), source.filename.c_str(),
            source.packagetype.empty() ? "unknown type" : source.packagetype.c_str(),
            (unsigned long long)source.size);
    auto res = http_.Get(source.url, reservation.Get());
    if (!res.is_ok()) {
        report.Skip(SkipReason::DownloadFailed, res.msg);
        LogWarn("%s: %s", ref.name.c_str(), res.msg.c_str());
        return std::nullopt;
    }

    if (opt_.verify_digest && !source.sha256.empty()) {
        std::string actual;
        auto hr = Sha256HexFile(reservation.PartPath(), actual);
        if (!hr.is_ok()) {
            report.Skip(SkipReason::DownloadFailed, hr.msg);
            LogWarn("%s: %s", ref.name.c_str(), hr.msg.c_str());
            return std::nullopt;
        }
        if (!DigestEquals(actual, source.sha256)) {
            report.Skip(SkipReason::DigestMismatch,
                        "sha256 mismatch: expected=" + source.sha256 + " actual=" + actual);
            LogWarn("%s: %s", ref.name.c_str(), report.detail.c_str());
            return std::nullopt;
        }
    }

    auto commit = reservation.Commit();
    if (!commit.is_ok()) {
        report.Skip(SkipReason::DownloadFailed, commit.msg);
        LogWarn("%s: %s", ref.name.c_str(), commit.msg.c_str());
        return std::nullopt;
    }

    archive.fetched = true;
    report.state = PackageState::ArchiveFetched;
    LogInfo("Downloaded %s", archive.path.c_str());
    return archive;
}

} // namespace corpus

#include "archive/archive_extractor.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>

namespace corpus {

namespace fs = std::filesystem;

namespace {

constexpr size_t kReadBlockSize = 64 * 1024;

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

using ArchiveReader = std::unique_ptr<archive, ArchiveReadDeleter>;

std::string ArchiveErr(archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

// Only the tar and zip format readers are enabled; every compression
// filter is, so .tar.gz, .tgz, .tar.bz2 and .tar.xz all bid as tar.
ArchiveReader OpenForRead(const std::string& path, std::string& err) {
    ArchiveReader ar(archive_read_new());
    if (!ar) {
        err = "archive_read_new failed";
        return nullptr;
    }
    archive_read_support_filter_all(ar.get());
    archive_read_support_format_tar(ar.get());
    archive_read_support_format_gnutar(ar.get());
    archive_read_support_format_zip(ar.get());

    if (archive_read_open_filename(ar.get(), path.c_str(), kReadBlockSize) != ARCHIVE_OK) {
        err = ArchiveErr(ar.get());
        return nullptr;
    }
    return ar;
}

ArchiveFormat ClassifyFormatCode(int code) {
    switch (code & ARCHIVE_FORMAT_BASE_MASK) {
        case ARCHIVE_FORMAT_TAR: return ArchiveFormat::Tar;
        case ARCHIVE_FORMAT_ZIP: return ArchiveFormat::Zip;
        default: return ArchiveFormat::Unknown;
    }
}

// Resolves a raw entry name to a path relative to the extraction root.
// Names that would resolve outside the root are rejected as UnsafePath;
// "pkg/docs/../setup.py" is fine and becomes "pkg/setup.py".
std::expected<fs::path, ExtractFailure> ResolveUnderRoot(const char* raw, const char* what) {
    const std::string name = raw ? raw : "";
    auto unsafe = [&] {
        return std::unexpected(ExtractFailure{ExtractError::UnsafePath,
                                              std::string("Unsafe ") + what + " in archive: " + name});
    };
    if (name.find('\\') != std::string::npos) return unsafe();

    fs::path rel = fs::path(NormalizeArchivePath(name)).lexically_normal();
    if (!rel.empty() && *rel.begin() == "..") return unsafe();
    return rel;
}

bool IsRoot(const fs::path& rel) {
    return rel.empty() || rel == ".";
}

} // namespace

const char* ToString(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Tar: return "tar";
        case ArchiveFormat::Zip: return "zip";
        default: return "unknown";
    }
}

ArchiveFormat ArchiveExtractor::DetectFormat(const std::string& archive_path) {
    std::string err;
    ArchiveReader ar = OpenForRead(archive_path, err);
    if (!ar) {
        LogDebug("format probe could not open %s: %s", archive_path.c_str(), err.c_str());
        return ArchiveFormat::Unknown;
    }

    archive_entry* entry = nullptr;
    const int r = archive_read_next_header(ar.get(), &entry);
    if (r < ARCHIVE_WARN) {
        LogDebug("format probe rejected %s: %s", archive_path.c_str(), ArchiveErr(ar.get()).c_str());
        return ArchiveFormat::Unknown;
    }
    return ClassifyFormatCode(archive_format(ar.get()));
}

std::expected<ExtractSummary, ExtractFailure>
ArchiveExtractor::ExtractAll(const std::string& archive_path, const std::string& dest_dir) const {
    ExtractSummary summary;
    summary.format = DetectFormat(archive_path);
    if (summary.format == ArchiveFormat::Unknown) {
        return std::unexpected(ExtractFailure{
            ExtractError::UnrecognizedFormat,
            "Could not identify type of compressed file " + archive_path});
    }

    const fs::path base_dir(dest_dir);
    std::error_code ec;
    if (!fs::is_directory(base_dir, ec) || ec) {
        return std::unexpected(ExtractFailure{
            ExtractError::Io, "Destination is not a directory: " + dest_dir});
    }

    std::string err;
    ArchiveReader ar = OpenForRead(archive_path, err);
    if (!ar) {
        return std::unexpected(ExtractFailure{ExtractError::Io, "open " + archive_path + ": " + err});
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return std::unexpected(ExtractFailure{ExtractError::Io, "archive_write_disk_new failed"});

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    // Entry paths are rewritten to absolute paths under dest_dir, so
    // NOABSOLUTEPATHS would reject every valid target.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    auto io_fail = [](std::string msg) {
        return std::unexpected(ExtractFailure{ExtractError::Io, std::move(msg)});
    };

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) return io_fail("archive_read_next_header: " + ArchiveErr(ar.get()));

        auto rel = ResolveUnderRoot(archive_entry_pathname(entry), "path");
        if (!rel) return std::unexpected(rel.error());
        if (IsRoot(*rel)) {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const std::string target_path = (base_dir / *rel).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        if (const char* link = archive_entry_hardlink(entry); link && *link) {
            auto link_rel = ResolveUnderRoot(link, "hardlink target");
            if (!link_rel) return std::unexpected(link_rel.error());
            if (IsRoot(*link_rel)) {
                return std::unexpected(ExtractFailure{
                    ExtractError::UnsafePath, std::string("Hardlink to the extraction root in archive: ") + link});
            }
            const std::string hardlink_target = (base_dir / *link_rel).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("entry: %s", target_path.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh < ARCHIVE_WARN) return io_fail("archive_write_header: " + ArchiveErr(aw.get()));
        if (wh == ARCHIVE_WARN) {
            LogDebug("%s: %s", target_path.c_str(), ArchiveErr(aw.get()).c_str());
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr < ARCHIVE_WARN) return io_fail("archive_read_data_block: " + ArchiveErr(ar.get()));

            const la_ssize_t ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww < ARCHIVE_WARN) return io_fail("archive_write_data_block: " + ArchiveErr(aw.get()));

            summary.bytes += static_cast<std::uint64_t>(size);
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf < ARCHIVE_WARN) return io_fail("archive_write_finish_entry: " + ArchiveErr(aw.get()));

        summary.entries++;
        summary.top_level.insert(rel->begin()->string());
    }

    if (archive_write_close(aw.get()) < ARCHIVE_WARN) {
        return io_fail("archive_write_close: " + ArchiveErr(aw.get()));
    }

    return summary;
}

} // namespace corpus

#pragma once

#include <cstdint>
#include <expected>
#include <set>
#include <string>

namespace corpus {

enum class ArchiveFormat {
    Unknown,
    Tar, // plain or compressed (gzip, bzip2, xz, lzma, compress)
    Zip,
};

const char* ToString(ArchiveFormat format);

enum class ExtractError {
    UnrecognizedFormat,
    UnsafePath,
    Io,
};

struct ExtractFailure {
    ExtractError kind = ExtractError::Io;
    std::string msg;
};

struct ExtractSummary {
    ArchiveFormat format = ArchiveFormat::Unknown;
    std::uint64_t entries = 0;
    std::uint64_t bytes = 0;
    std::set<std::string> top_level; // first path component of every entry
};

class ArchiveExtractor {
  public:
    // Sniffs the file content; the extension is never consulted.
    static ArchiveFormat DetectFormat(const std::string& archive_path);

    /**
     * @brief Extracts every entry of a tar- or zip-family archive under dest_dir.
     *
     * Fails with ExtractError::UnrecognizedFormat when the content is neither,
     * and with ExtractError::UnsafePath when an entry name or hardlink target
     * resolves outside dest_dir.
     * A failure mid-stream leaves whatever was already written in place;
     * removing it is up to the caller.
     */
    std::expected<ExtractSummary, ExtractFailure> ExtractAll(const std::string& archive_path,
                                                             const std::string& dest_dir) const;
};

} // namespace corpus

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace corpus {

// Marks the source distribution among a release's files.
inline constexpr const char kSourcePythonVersion[] = "source";

struct DistributionFile {
    std::string filename;
    std::string url;
    std::string python_version;
    std::string packagetype; // "sdist", "bdist_wheel", ...
    std::string sha256;      // empty when the registry lists no digest
    std::uint64_t size = 0;
};

struct PackageMetadata {
    std::string name;
    std::string version;
    std::vector<DistributionFile> files;
};

// First file classified as a source distribution, or nullptr.
const DistributionFile* SelectSourceDistribution(const PackageMetadata& metadata);

} // namespace corpus

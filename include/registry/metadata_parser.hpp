#pragma once

#include "registry/package_metadata.hpp"

#include <expected>
#include <string>

namespace corpus {

class MetadataParser {
  public:
    std::expected<PackageMetadata, std::string> Parse(const std::string& json_input) const;
    std::expected<PackageMetadata, std::string> ParseFile(const std::string& path) const;
};

} // namespace corpus

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace corpus {

// Shell-style exclusion globs, matched against the whole path with
// fnmatch(3) and no flags, so "*" also crosses "/".
class SourceFileFilter {
  public:
    explicit SourceFileFilter(std::vector<std::string> excluded_globs)
        : globs_(std::move(excluded_globs)) {}

    bool Excluded(const std::string& path) const;

    struct Census {
        std::size_t candidates = 0;
        std::size_t excluded = 0;
    };

    // Counts files under root with the given extension, split by whether
    // an exclusion glob drops them.
    Census Scan(const std::string& root, const std::string& extension = ".py") const;

  private:
    std::vector<std::string> globs_;
};

} // namespace corpus

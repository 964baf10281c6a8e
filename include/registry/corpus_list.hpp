#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace corpus {

// Largest --number accepted without --all.
inline constexpr std::size_t kMaxPackageCount = 4000;

struct PackageRef {
    std::string name;
    int rank = 0; // 1-based position in the ranked list
};

class CorpusList {
  public:
    // Reads {"rows": [{"project": "..."}, ...]}. Rows without a project
    // name are dropped; ranks follow the input row positions.
    static std::expected<CorpusList, std::string> LoadFile(const std::string& path);
    static std::expected<CorpusList, std::string> Parse(const std::string& json_input);

    // Every package when all is set, otherwise the first `count`.
    // A count above kMaxPackageCount is rejected.
    std::expected<std::vector<PackageRef>, std::string> Select(bool all, std::size_t count) const;

    const std::vector<PackageRef>& Packages() const { return packages_; }

  private:
    std::vector<PackageRef> packages_;
};

} // namespace corpus

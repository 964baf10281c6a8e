#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace corpus::config {

// Upper bound accepted for any *TimeoutSec key (one week).
constexpr std::uint64_t kMaxTimeoutSec = 7ULL * 24 * 60 * 60;

// Globs handed to the verifier so known-bad fixtures are never parsed.
std::vector<std::string> DefaultExcludedGlobs();

struct HarnessConfig {
    std::string data_dir = "data";
    std::string registry_url = "https://pypi.org/pypi";
    std::string corpus_list = "top-pypi-packages-365-days";
    std::string grammar = "data/simpy.gram";

    std::vector<std::string> verifier_command = {"python3", "scripts/test_parse_directory.py"};
    std::vector<std::string> build_command;
    std::vector<std::string> excluded_globs = DefaultExcludedGlobs();

    std::uint64_t verify_timeout_sec = 0; // 0 => no bound
    std::uint64_t connect_timeout_sec = 15;
    std::uint64_t transfer_timeout_sec = 300;
    std::optional<LogLevel> log_level;

    // Overlays the keys present in a JSON config file onto the current
    // values. Keys that are absent keep their defaults.
    Result LoadFile(const std::string& path);

    std::string WorkspaceDir() const;
    std::string CorpusListPath() const;
    std::string MetadataPath(const std::string& package_name) const;
    std::string ArchivePath(const std::string& filename) const;
};

} // namespace corpus::config

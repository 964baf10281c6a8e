#include "util/config.hpp"

#include "util/config_json_utils.hpp"

#include <filesystem>

namespace corpus::config {

std::vector<std::string> DefaultExcludedGlobs() {
    return {
        "*/failset/*",
        "*/failset/**",
        "*/failset/**/*",
        "*/test2to3/*",
        "*/test2to3/**/*",
        "*/bad*",
        "*/lib2to3/tests/data/*",
    };
}

Result HarnessConfig::LoadFile(const std::string& path) {
    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(-1, "Config: " + err);
    }

    HarnessConfig updated = *this;
    if (!detail::FillConfigFromJson(json, updated, err)) {
        return Result::Fail(-1, "Config: " + err + " in " + path);
    }

    *this = std::move(updated);
    return Result::Ok();
}

std::string HarnessConfig::WorkspaceDir() const {
    return (std::filesystem::path(data_dir) / "pypi").string();
}

std::string HarnessConfig::CorpusListPath() const {
    return (std::filesystem::path(data_dir) / (corpus_list + ".json")).string();
}

std::string HarnessConfig::MetadataPath(const std::string& package_name) const {
    return (std::filesystem::path(data_dir) / (package_name + ".json")).string();
}

std::string HarnessConfig::ArchivePath(const std::string& filename) const {
    return (std::filesystem::path(WorkspaceDir()) / filename).string();
}

} // namespace corpus::config

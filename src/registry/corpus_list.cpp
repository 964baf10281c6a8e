#include "registry/corpus_list.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace corpus {

using json = nlohmann::json;

std::expected<CorpusList, std::string> CorpusList::LoadFile(const std::string& path) {
    std::ifstream is(path);
    if (!is.good()) {
        return std::unexpected("cannot open corpus list " + path);
    }
    std::ostringstream ss;
    ss << is.rdbuf();
    auto parsed = Parse(ss.str());
    if (!parsed)
        return std::unexpected(parsed.error() + " in " + path);
    return parsed;
}

std::expected<CorpusList, std::string> CorpusList::Parse(const std::string& json_input) {
    try {
        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }
        auto rows = j.find("rows");
        if (rows == j.end() || !rows->is_array()) {
            return std::unexpected("'rows' must be an array");
        }

        CorpusList list;
        list.packages_.reserve(rows->size());
        int rank = 0;
        for (const auto& row : *rows) {
            ++rank;
            if (!row.is_object())
                continue;
            auto project = row.find("project");
            if (project == row.end() || !project->is_string() || project->get<std::string>().empty()) {
                LogWarn("corpus list row %d has no project name", rank);
                continue;
            }
            list.packages_.push_back(PackageRef{project->get<std::string>(), rank});
        }
        return list;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

std::expected<std::vector<PackageRef>, std::string> CorpusList::Select(bool all, std::size_t count) const {
    if (all) {
        return packages_;
    }
    if (count > kMaxPackageCount) {
        return std::unexpected("package count must be between 0 and " + std::to_string(kMaxPackageCount));
    }
    const std::size_t n = std::min(count, packages_.size());
    return std::vector<PackageRef>(packages_.begin(), packages_.begin() + static_cast<std::ptrdiff_t>(n));
}

} // namespace corpus

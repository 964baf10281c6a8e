#include "registry/metadata_parser.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace corpus {

using json = nlohmann::json;

namespace {

std::string StringOrEmpty(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

std::expected<std::vector<DistributionFile>, std::string> ParseUrlsArray(const json& arr) {
    if (!arr.is_array()) {
        return std::unexpected("'urls' must be an array");
    }

    std::vector<DistributionFile> out;
    out.reserve(arr.size());

    for (const auto& item : arr) {
        if (!item.is_object()) {
            return std::unexpected("'urls' entries must be objects");
        }
        DistributionFile f;
        f.filename = StringOrEmpty(item, "filename");
        f.url = StringOrEmpty(item, "url");
        f.python_version = StringOrEmpty(item, "python_version");
        f.packagetype = StringOrEmpty(item, "packagetype");
        f.size = item.value("size", 0ULL);

        auto digests = item.find("digests");
        if (digests != item.end() && digests->is_object()) {
            f.sha256 = StringOrEmpty(*digests, "sha256");
        }
        out.push_back(std::move(f));
    }

    return out;
}

} // namespace

const DistributionFile* SelectSourceDistribution(const PackageMetadata& metadata) {
    for (const auto& f : metadata.files) {
        if (f.python_version == kSourcePythonVersion && !f.filename.empty() && !f.url.empty()) {
            return &f;
        }
    }
    return nullptr;
}

std::expected<PackageMetadata, std::string> MetadataParser::Parse(const std::string& json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        PackageMetadata m;
        auto info = j.find("info");
        if (info != j.end() && info->is_object()) {
            m.name = StringOrEmpty(*info, "name");
            m.version = StringOrEmpty(*info, "version");
        }

        // A release without files has no "urls" key at all on some mirrors.
        if (j.contains("urls")) {
            auto parsed = ParseUrlsArray(j["urls"]);
            if (!parsed)
                return std::unexpected(parsed.error());
            m.files = std::move(*parsed);
        }

        return m;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

std::expected<PackageMetadata, std::string> MetadataParser::ParseFile(const std::string& path) const {
    std::ifstream is(path);
    if (!is.good()) {
        return std::unexpected("cannot open " + path);
    }
    std::ostringstream ss;
    ss << is.rdbuf();
    return Parse(ss.str());
}

} // namespace corpus

#include "verify/verification_adapter.hpp"

#include "util/logger.hpp"
#include "verify/source_file_filter.hpp"

#include <exception>
#include <filesystem>

namespace fs = std::filesystem;

namespace corpus {

std::optional<std::string> VerificationAdapter::FindExtractedDir(const std::string& workspace,
                                                                 const std::string& archive_filename) {
    std::optional<std::string> best;
    std::size_t best_len = 0;

    std::error_code ec;
    fs::directory_iterator it(workspace, ec);
    if (ec) {
        LogWarn("cannot list %s: %s", workspace.c_str(), ec.message().c_str());
        return std::nullopt;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!it->is_directory(type_ec)) continue;

        const std::string name = it->path().filename().string();
        if (name.empty() || archive_filename.find(name) == std::string::npos) continue;
        if (name.size() > best_len) {
            best = it->path().string();
            best_len = name.size();
        }
    }
    return best;
}

VerificationAdapter::Outcome VerificationAdapter::Run(const std::string& package, const std::string& corpus_root) {
    const auto census = SourceFileFilter(spec_.excluded_globs).Scan(corpus_root);
    LogInfo("Trying to parse all python files in %s (%zu files, %zu excluded)",
            corpus_root.c_str(), census.candidates, census.excluded);

    Outcome out;
    try {
        out.result = verifier_.Verify(spec_.RequestFor(corpus_root));
    } catch (const std::exception& e) {
        LogError("Exception encountered in analyzing %s: %s", package.c_str(), e.what());
        out.result.status = 1;
        out.result.detail = e.what();
        out.threw = true;
    } catch (...) {
        LogError("Exception encountered in analyzing %s: non-standard exception", package.c_str());
        out.result.status = 1;
        out.result.detail = "non-standard exception";
        out.threw = true;
    }
    return out;
}

} // namespace corpus

#include "verify/source_file_filter.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <fnmatch.h>

namespace fs = std::filesystem;

namespace corpus {

bool SourceFileFilter::Excluded(const std::string& path) const {
    for (const auto& glob : globs_) {
        if (::fnmatch(glob.c_str(), path.c_str(), 0) == 0) return true;
    }
    return false;
}

SourceFileFilter::Census SourceFileFilter::Scan(const std::string& root, const std::string& extension) const {
    Census census;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LogWarn("cannot scan %s: %s", root.c_str(), ec.message().c_str());
        return census;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            LogWarn("scan of %s stopped: %s", root.c_str(), ec.message().c_str());
            break;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;

        const std::string path = it->path().string();
        if (!EndsWith(path, extension)) continue;

        if (Excluded(path)) {
            census.excluded++;
        } else {
            census.candidates++;
        }
    }
    return census;
}

} // namespace corpus

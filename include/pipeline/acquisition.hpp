#pragma once

#include "io/http_client.hpp"
#include "pipeline/package_report.hpp"
#include "registry/corpus_list.hpp"
#include "registry/package_metadata.hpp"
#include "util/config.hpp"

#include <optional>
#include <string>

namespace corpus {

struct DownloadedArchive {
    std::string path;
    std::string filename;
    std::string package_name;
    bool fetched = false; // false when an earlier run left it on disk
};

class Acquirer {
  public:
    struct Options {
        bool remove_metadata = false;
        bool verify_digest = true;
    };

    Acquirer(const config::HarnessConfig& cfg, IHttpClient& http)
        : Acquirer(cfg, http, Options{}) {}
    Acquirer(const config::HarnessConfig& cfg, IHttpClient& http, Options opt)
        : cfg_(cfg), http_(http), opt_(opt) {}

    /**
     * @brief Fetches the metadata document, then the source archive.
     *
     * Advances report through MetadataFetched and ArchiveFetched. Every
     * failure here is recoverable: the report ends Skipped with a reason and
     * std::nullopt is returned. An archive already on disk is not fetched
     * again.
     */
    std::optional<DownloadedArchive> Acquire(const PackageRef& ref, PackageReport& report);

  private:
    // Body of GET url is written to a temporary file and renamed onto path.
    Result FetchToFile(const std::string& url, const std::string& path);
    std::optional<DownloadedArchive> FetchArchive(const PackageRef& ref,
                                                  const DistributionFile& source,
                                                  PackageReport& report);
    void RemoveMetadata(const std::string& path) const;

    const config::HarnessConfig& cfg_;
    IHttpClient& http_;
    Options opt_{};
};

} // namespace corpus

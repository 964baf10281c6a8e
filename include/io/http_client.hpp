#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace corpus {

class IHttpClient {
  public:
    virtual ~IHttpClient() = default;

    // Streams the body of a GET into out_fd. A transport error or a
    // non-2xx response fails; err holds the HTTP status when there was one.
    virtual Result Get(const std::string& url, int out_fd) = 0;
};

class CurlHttpClient final : public IHttpClient {
  public:
    struct Options {
        std::uint64_t connect_timeout_sec = 15;
        std::uint64_t transfer_timeout_sec = 300;
        std::string user_agent = "corpus-harness/1.0";
    };

    CurlHttpClient() = default;
    explicit CurlHttpClient(Options opt) : opt_(std::move(opt)) {}

    Result Get(const std::string& url, int out_fd) override;

    // Must run once in the parent before any worker is forked.
    static Result GlobalInit();
    static void GlobalCleanup();

  private:
    Options opt_{};
};

} // namespace corpus

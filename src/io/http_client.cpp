#include "io/http_client.hpp"

#include "util/logger.hpp"

#include <curl/curl.h>

#include <cerrno>
#include <memory>
#include <unistd.h>

namespace corpus {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* c) const {
        if (c) curl_easy_cleanup(c);
    }
};

struct SinkCtx {
    int fd = -1;
    int write_errno = 0;
    std::uint64_t written = 0;
};

size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<SinkCtx*>(userdata);
    const size_t total = size * nmemb;
    size_t off = 0;
    while (off < total) {
        const ssize_t n = ::write(ctx->fd, ptr + off, total - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            ctx->write_errno = errno;
            return 0; // aborts the transfer with CURLE_WRITE_ERROR
        }
        off += static_cast<size_t>(n);
    }
    ctx->written += total;
    return total;
}

} // namespace

Result CurlHttpClient::GlobalInit() {
    const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        return Result::Fail(-1, std::string("curl_global_init: ") + curl_easy_strerror(rc));
    }
    return Result::Ok();
}

void CurlHttpClient::GlobalCleanup() { curl_global_cleanup(); }

Result CurlHttpClient::Get(const std::string& url, int out_fd) {
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) return Result::Fail(-1, "curl_easy_init failed");

    SinkCtx sink;
    sink.fd = out_fd;

    char errbuf[CURL_ERROR_SIZE]{};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, opt_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(opt_.connect_timeout_sec));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(opt_.transfer_timeout_sec));

    // HTTP errors are checked below so the status reaches the caller.
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 0L);

    const CURLcode res = curl_easy_perform(curl.get());

    long response_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);

    if (res != CURLE_OK) {
        if (res == CURLE_WRITE_ERROR && sink.write_errno != 0) {
            return Result::Fail(sink.write_errno, "write failed while downloading " + url);
        }
        const std::string detail = errbuf[0] != '\0' ? std::string(errbuf) : curl_easy_strerror(res);
        return Result::Fail(-1, "GET " + url + ": " + detail);
    }

    if (response_code < 200 || response_code >= 300) {
        return Result::Fail(static_cast<int>(response_code),
                            "HTTP Error " + std::to_string(response_code) + ": " + url);
    }

    LogDebug("GET %s -> %ld (%llu bytes)", url.c_str(), response_code, (unsigned long long)sink.written);
    return Result::Ok();
}

} // namespace corpus

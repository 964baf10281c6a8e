#include "pipeline/retention.hpp"

#include "util/logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace corpus {

namespace {

class StdFileSystemOps final : public RetentionPolicy::IFileSystemOps {
  public:
    Result RemoveTree(std::string_view dir) const override {
        std::error_code ec;
        fs::remove_all(fs::path(dir), ec);
        if (ec) {
            return Result::Fail(ec.value(), "remove_all " + std::string(dir) + ": " + ec.message());
        }
        return Result::Ok();
    }
};

} // namespace

std::shared_ptr<const RetentionPolicy::IFileSystemOps> RetentionPolicy::DefaultFileSystemOps() {
    static const std::shared_ptr<const IFileSystemOps> kDefault = std::make_shared<StdFileSystemOps>();
    return kDefault;
}

RetentionPolicy::RetentionPolicy() : fs_ops_(DefaultFileSystemOps()) {}

RetentionPolicy::RetentionPolicy(std::shared_ptr<const IFileSystemOps> fs_ops)
    : fs_ops_(fs_ops ? std::move(fs_ops) : DefaultFileSystemOps()) {}

RetentionDecision RetentionPolicy::Apply(const ExtractedCorpus& corpus, const VerificationResult& result) const {
    if (result.status != 0) {
        LogWarn("Failed to parse %s (package %s, status %d), keeping it for inspection",
                corpus.root.c_str(), corpus.owning_package.c_str(), result.status);
        return RetentionDecision::Retained;
    }

    auto removed = fs_ops_->RemoveTree(corpus.root);
    if (!removed.is_ok()) {
        LogWarn("Cleanup of %s failed: %s", corpus.root.c_str(), removed.msg.c_str());
        return RetentionDecision::CleanupFailed;
    }
    LogInfo("Parsed %s cleanly, removed %s", corpus.owning_package.c_str(), corpus.root.c_str());
    return RetentionDecision::Cleaned;
}

} // namespace corpus

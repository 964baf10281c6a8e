#pragma once

#include "util/result.hpp"
#include "verify/verifier.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace corpus {

struct ExtractedCorpus {
    std::string root;
    std::string owning_package;
};

enum class RetentionDecision {
    Cleaned,       // status 0, tree removed
    CleanupFailed, // status 0, removal failed; logged only
    Retained,      // status != 0, tree left for follow-up
};

class RetentionPolicy {
  public:
    class IFileSystemOps {
      public:
        virtual ~IFileSystemOps() = default;
        virtual Result RemoveTree(std::string_view dir) const = 0;
    };

    RetentionPolicy();
    explicit RetentionPolicy(std::shared_ptr<const IFileSystemOps> fs_ops);

    // Never fails: a removal error is logged and reported as CleanupFailed.
    RetentionDecision Apply(const ExtractedCorpus& corpus, const VerificationResult& result) const;

  private:
    static std::shared_ptr<const IFileSystemOps> DefaultFileSystemOps();

    std::shared_ptr<const IFileSystemOps> fs_ops_;
};

} // namespace corpus

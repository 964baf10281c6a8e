#pragma once

#include "verify/subprocess_verifier.hpp"
#include "verify/verifier.hpp"

#include <optional>
#include <string>
#include <utility>

namespace corpus {

class VerificationAdapter {
  public:
    struct Outcome {
        VerificationResult result;
        bool threw = false;
    };

    VerificationAdapter(IVerifier& verifier, VerifierSpec spec)
        : verifier_(verifier), spec_(std::move(spec)) {}

    /**
     * @brief Locates the directory an archive unpacked into.
     *
     * Archives usually unpack into a versioned directory whose name is a
     * prefix of the archive filename ("pkg-1.0" for "pkg-1.0.tar.gz"). Every
     * workspace directory whose name occurs in archive_filename is a
     * candidate; the longest one wins. std::nullopt means the package is a
     * single file with nothing to verify.
     */
    static std::optional<std::string> FindExtractedDir(const std::string& workspace,
                                                       const std::string& archive_filename);

    // Never throws: a verifier exception is logged against package and
    // turned into a non-zero status with threw set.
    Outcome Run(const std::string& package, const std::string& corpus_root);

  private:
    IVerifier& verifier_;
    VerifierSpec spec_;
};

} // namespace corpus

#pragma once

#include <string>
#include <vector>

namespace corpus {

struct VerifyRequest {
    std::string root;    // extracted corpus directory
    std::string grammar; // grammar definition handed to the verifier
    std::vector<std::string> excluded_globs;
    int tree_level = 0;  // compare against the reference tree when > 0
};

struct VerificationResult {
    int status = 0; // 0 => every file conformed
    std::string detail;
    bool timed_out = false;
};

// The external grammar verifier. Implementations may throw; callers treat
// an exception as a failed verification.
class IVerifier {
  public:
    virtual ~IVerifier() = default;
    virtual VerificationResult Verify(const VerifyRequest& request) = 0;
};

} // namespace corpus

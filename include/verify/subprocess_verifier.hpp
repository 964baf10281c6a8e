#pragma once

#include "util/config.hpp"
#include "verify/verifier.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace corpus {

// Immutable description of the verifier, produced once before any worker
// starts and copied into each of them.
struct VerifierSpec {
    std::vector<std::string> command; // program and leading arguments
    std::string grammar;              // absolute path
    std::vector<std::string> excluded_globs;
    int tree_level = 0;
    std::uint64_t timeout_sec = 0;

    VerifyRequest RequestFor(const std::string& root) const;
};

class VerifierSetup {
  public:
    // Checks the grammar file and runs BuildCommand once when configured.
    static std::expected<VerifierSpec, std::string> Prepare(const config::HarnessConfig& cfg, int tree_level);
};

// Runs: <command...> -d <root> -g <grammar> [-e <glob>]... [-t]... -s
class SubprocessVerifier final : public IVerifier {
  public:
    explicit SubprocessVerifier(VerifierSpec spec) : spec_(std::move(spec)) {}

    VerificationResult Verify(const VerifyRequest& request) override;

    std::vector<std::string> BuildArgv(const VerifyRequest& request) const;

  private:
    VerifierSpec spec_;
};

} // namespace corpus

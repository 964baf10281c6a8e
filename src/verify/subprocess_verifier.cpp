#include "verify/subprocess_verifier.hpp"

#include "system/process.hpp"
#include "util/logger.hpp"

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace corpus {

namespace {

// Exit status reported for a verifier killed at its deadline, as timeout(1).
constexpr int kTimedOutStatus = 124;

} // namespace

VerifyRequest VerifierSpec::RequestFor(const std::string& root) const {
    VerifyRequest req;
    req.root = root;
    req.grammar = grammar;
    req.excluded_globs = excluded_globs;
    req.tree_level = tree_level;
    return req;
}

std::expected<VerifierSpec, std::string> VerifierSetup::Prepare(const config::HarnessConfig& cfg, int tree_level) {
    if (cfg.verifier_command.empty()) {
        return std::unexpected("verifier command is empty");
    }

    std::error_code ec;
    if (!fs::is_regular_file(cfg.grammar, ec)) {
        return std::unexpected("grammar file not found: " + cfg.grammar);
    }

    if (!cfg.build_command.empty()) {
        LogInfo("Building verifier: %s", cfg.build_command.front().c_str());
        ProcessStatus st;
        auto r = RunProcess(cfg.build_command, 0, st);
        if (!r.is_ok()) {
            return std::unexpected("build command could not run: " + r.msg);
        }
        if (st.exit_code != 0) {
            return std::unexpected("build command exited with status " + std::to_string(st.exit_code));
        }
    }

    VerifierSpec spec;
    spec.command = cfg.verifier_command;
    spec.grammar = fs::absolute(cfg.grammar, ec).string();
    if (ec) spec.grammar = cfg.grammar;
    spec.excluded_globs = cfg.excluded_globs;
    spec.tree_level = tree_level;
    spec.timeout_sec = cfg.verify_timeout_sec;
    return spec;
}

std::vector<std::string> SubprocessVerifier::BuildArgv(const VerifyRequest& request) const {
    std::vector<std::string> argv = spec_.command;
    argv.push_back("-d");
    argv.push_back(request.root);
    argv.push_back("-g");
    argv.push_back(request.grammar);
    for (const auto& glob : request.excluded_globs) {
        argv.push_back("-e");
        argv.push_back(glob);
    }
    for (int i = 0; i < request.tree_level; ++i) {
        argv.push_back("-t");
    }
    argv.push_back("-s");
    return argv;
}

VerificationResult SubprocessVerifier::Verify(const VerifyRequest& request) {
    ProcessStatus st;
    auto r = RunProcess(BuildArgv(request), spec_.timeout_sec, st);
    if (!r.is_ok()) {
        throw std::runtime_error("verifier could not run: " + r.msg);
    }

    VerificationResult result;
    if (st.timed_out) {
        result.status = kTimedOutStatus;
        result.timed_out = true;
        result.detail = "timed out after " + std::to_string(spec_.timeout_sec) + " s";
    } else {
        result.status = st.exit_code;
        if (st.term_signal != 0) {
            result.detail = "verifier killed by signal " + std::to_string(st.term_signal);
        } else if (st.exit_code != 0) {
            result.detail = "verifier exited with status " + std::to_string(st.exit_code);
        }
    }
    return result;
}

} // namespace corpus

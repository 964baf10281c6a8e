#include "util/config_json_utils.hpp"

#include <fstream>

namespace corpus::config::detail {

namespace {

// Each getter returns false when the key is absent and sets err when the
// key is present with the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetTimeoutIfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    std::uint64_t v = 0;
    if (!GetU64IfPresent(j, key, v, err))
        return false;
    if (v > kMaxTimeoutSec) {
        err = std::string(key) + " must not exceed " + std::to_string(kMaxTimeoutSec);
        return false;
    }
    out = v;
    return true;
}

bool GetStringArrayIfPresent(const nlohmann::json& j,
                             const char* key,
                             std::vector<std::string>& out,
                             std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    values.reserve(it->size());
    for (const auto& item : *it) {
        if (!item.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, HarnessConfig& cfg, std::string& err) {
    err.clear();

    GetStringIfPresent(j, "DataDir", cfg.data_dir, err);
    GetStringIfPresent(j, "RegistryUrl", cfg.registry_url, err);
    GetStringIfPresent(j, "CorpusList", cfg.corpus_list, err);
    GetStringIfPresent(j, "Grammar", cfg.grammar, err);
    GetStringArrayIfPresent(j, "VerifierCommand", cfg.verifier_command, err);
    GetStringArrayIfPresent(j, "BuildCommand", cfg.build_command, err);
    GetStringArrayIfPresent(j, "ExcludedGlobs", cfg.excluded_globs, err);
    GetTimeoutIfPresent(j, "VerifyTimeoutSec", cfg.verify_timeout_sec, err);
    GetTimeoutIfPresent(j, "ConnectTimeoutSec", cfg.connect_timeout_sec, err);
    GetTimeoutIfPresent(j, "TransferTimeoutSec", cfg.transfer_timeout_sec, err);
    if (!err.empty())
        return false;

    {
        std::string level;
        if (GetStringIfPresent(j, "LogLevel", level, err)) {
            cfg.log_level = ParseLogLevel(level);
            if (!cfg.log_level) {
                err = "unknown LogLevel: " + level;
                return false;
            }
        }
        if (!err.empty())
            return false;
    }

    if (cfg.data_dir.empty()) {
        err = "DataDir must not be empty";
        return false;
    }
    if (cfg.verifier_command.empty()) {
        err = "VerifierCommand must not be empty";
        return false;
    }
    while (!cfg.registry_url.empty() && cfg.registry_url.back() == '/') {
        cfg.registry_url.pop_back();
    }

    return true;
}

} // namespace corpus::config::detail

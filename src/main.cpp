#include "io/http_client.hpp"
#include "pipeline/acquisition.hpp"
#include "pipeline/batch_runner.hpp"
#include "pipeline/package_pipeline.hpp"
#include "pipeline/worker_pool.hpp"
#include "registry/corpus_list.hpp"
#include "system/signals.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"
#include "verify/subprocess_verifier.hpp"
#include "verify/verification_adapter.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <optional>
#include <string>

namespace {

constexpr int kExitUsage = 2;
constexpr int kExitSetup = 1;
constexpr int kExitNeedsAttention = 3;

enum class Mode { Fetch, Verify, Run };

struct CliOptions {
    Mode mode = Mode::Run;
    std::size_t number = 100;
    bool all = false;
    bool remove_metadata = false;
    std::size_t processes = 1;
    int tree = 0;
    bool strict = false;
    std::string config_path;
    std::optional<corpus::LogLevel> level;
};

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s fetch  [-n <count> | -a] [--rm] [-p <workers>] [common options]\n"
        "   %s verify [-t]... [-p <workers>] [--strict] [common options]\n"
        "   %s run    [-n <count> | -a] [--rm] [-t]... [-p <workers>] [--strict] [common options]\n"
        "\n"
        "Options:\n"
        "  -n, --number       Number of packages to take from the corpus list (0-%zu, default 100)\n"
        "  -a, --all          Take every package listed in the corpus list\n"
        "      --rm           Remove each package's JSON metadata after use\n"
        "  -p, --processes    Number of concurrent worker processes (default 1)\n"
        "  -t, --tree         Compare parse tree to the reference tree (repeat for more detail)\n"
        "      --strict       Exit with status 3 when any package failed or was retained\n"
        "  -c, --config       JSON config file\n"
        "  -v, --verbose      Debug logging\n"
        "  -q, --quiet        Warnings and errors only\n"
        "  -h, --help         Show this help\n",
        argv, argv, argv, corpus::kMaxPackageCount);
}

bool ParseCount(const char *s, std::size_t &out) {
    char *end = nullptr;
    errno = 0;
    const long long v = std::strtoll(s, &end, 10);
    if (!end || *end != '\0' || errno != 0 || v < 0) return false;
    out = static_cast<std::size_t>(v);
    return true;
}

// Returns -1 when parsing succeeded, otherwise the exit status.
int ParseArgs(int argc, char **argv, CliOptions &opt) {
    if (argc < 2) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    const std::string cmd = argv[1];
    if (cmd == "-h" || cmd == "--help") {
        PrintUsage(argv[0]);
        return 0;
    } else if (cmd == "fetch") {
        opt.mode = Mode::Fetch;
    } else if (cmd == "verify") {
        opt.mode = Mode::Verify;
    } else if (cmd == "run") {
        opt.mode = Mode::Run;
    } else {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    enum { kOptRm = 256, kOptStrict };
    static option long_opts[] = {
        {"number", required_argument, nullptr, 'n'},
        {"all", no_argument, nullptr, 'a'},
        {"rm", no_argument, nullptr, kOptRm},
        {"processes", required_argument, nullptr, 'p'},
        {"tree", no_argument, nullptr, 't'},
        {"strict", no_argument, nullptr, kOptStrict},
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    const bool takes_list = opt.mode != Mode::Verify;
    const bool verifies = opt.mode != Mode::Fetch;

    // getopt_long starts after the subcommand.
    const int sub_argc = argc - 1;
    char **sub_argv = argv + 1;
    optind = 1;

    int idx = 0;
    int c;
    while ((c = getopt_long(sub_argc, sub_argv, "hn:ap:tc:vq", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'n':
                if (!takes_list || !ParseCount(optarg, opt.number)) {
                    std::fprintf(stderr, "Invalid --number: %s\n", optarg);
                    return kExitUsage;
                }
                break;

            case 'a':
            case kOptRm:
                if (!takes_list) {
                    PrintUsage(argv[0]);
                    return kExitUsage;
                }
                (c == 'a' ? opt.all : opt.remove_metadata) = true;
                break;

            case 'p':
                if (!ParseCount(optarg, opt.processes) || opt.processes == 0) {
                    std::fprintf(stderr, "Invalid --processes: %s\n", optarg);
                    return kExitUsage;
                }
                break;

            case 't':
            case kOptStrict:
                if (!verifies) {
                    PrintUsage(argv[0]);
                    return kExitUsage;
                }
                if (c == 't') {
                    opt.tree++;
                } else {
                    opt.strict = true;
                }
                break;

            case 'c':
                opt.config_path = optarg;
                break;

            case 'v':
                opt.level = corpus::LogLevel::Debug;
                break;

            case 'q':
                opt.level = corpus::LogLevel::Warn;
                break;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (optind < sub_argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", sub_argv[optind]);
        return kExitUsage;
    }
    if (!opt.all && opt.number > corpus::kMaxPackageCount) {
        std::fprintf(stderr, "--number must be between 0 and %zu\n", corpus::kMaxPackageCount);
        return kExitUsage;
    }
    return -1;
}

} // namespace

int main(int argc, char **argv) {
    CliOptions cli;
    if (const int rc = ParseArgs(argc, argv, cli); rc >= 0) {
        return rc;
    }

    corpus::config::HarnessConfig cfg;
    if (!cli.config_path.empty()) {
        if (auto r = cfg.LoadFile(cli.config_path); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return kExitSetup;
        }
    }
    if (cfg.log_level) {
        corpus::Logger::Instance().SetLevel(*cfg.log_level);
    }
    if (cli.level) {
        corpus::Logger::Instance().SetLevel(*cli.level);
    }

    if (auto r = corpus::PrepareWorkspace(cfg); !r.is_ok()) {
        LogError("%s", r.msg.c_str());
        return kExitSetup;
    }

    std::vector<corpus::PackageRef> packages;
    if (cli.mode != Mode::Verify) {
        auto list = corpus::CorpusList::LoadFile(cfg.CorpusListPath());
        if (!list) {
            LogError("%s", list.error().c_str());
            return kExitSetup;
        }
        auto selected = list->Select(cli.all, cli.number);
        if (!selected) {
            LogError("%s", selected.error().c_str());
            return kExitUsage;
        }
        packages = std::move(*selected);

        if (auto r = corpus::CurlHttpClient::GlobalInit(); !r.is_ok()) {
            LogError("%s", r.msg.c_str());
            return kExitSetup;
        }
    }

    corpus::CurlHttpClient http(corpus::CurlHttpClient::Options{
        .connect_timeout_sec = cfg.connect_timeout_sec,
        .transfer_timeout_sec = cfg.transfer_timeout_sec,
    });
    corpus::Acquirer acquirer(cfg, http, corpus::Acquirer::Options{.remove_metadata = cli.remove_metadata});

    std::optional<corpus::SubprocessVerifier> verifier;
    std::optional<corpus::VerificationAdapter> adapter;
    if (cli.mode != Mode::Fetch) {
        auto spec = corpus::VerifierSetup::Prepare(cfg, cli.tree);
        if (!spec) {
            LogError("Verifier setup failed: %s", spec.error().c_str());
            return kExitSetup;
        }
        verifier.emplace(*spec);
        adapter.emplace(*verifier, *spec);
    }

    corpus::PackagePipeline pipeline(cfg,
                                     cli.mode == Mode::Verify ? nullptr : &acquirer,
                                     adapter ? &*adapter : nullptr);

    std::vector<corpus::WorkerPool::Job> jobs;
    if (cli.mode == Mode::Verify) {
        int rank = 0;
        for (const auto& path : corpus::ListWorkspaceArchives(cfg.WorkspaceDir())) {
            jobs.push_back({path, ++rank, [&pipeline, path] { return pipeline.VerifyArchive(path); }});
        }
    } else {
        for (const auto& ref : packages) {
            if (cli.mode == Mode::Fetch) {
                jobs.push_back({ref.name, ref.rank, [&pipeline, ref] { return pipeline.Fetch(ref); }});
            } else {
                jobs.push_back({ref.name, ref.rank, [&pipeline, ref] { return pipeline.Run(ref); }});
            }
        }
    }

    corpus::InstallSignalHandlers();
    corpus::WorkerPool pool(cli.processes);
    const corpus::BatchSummary summary = corpus::RunBatch(pool, std::move(jobs));
    summary.Log();

    if (cli.mode != Mode::Verify) {
        corpus::CurlHttpClient::GlobalCleanup();
    }

    if (cli.strict && summary.NeedsAttention()) {
        return kExitNeedsAttention;
    }
    return 0;
}

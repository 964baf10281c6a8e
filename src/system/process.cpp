#include "system/process.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace corpus {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);

// Deadlines beyond this are treated as this; keeps the time_point arithmetic
// inside the range of steady_clock.
constexpr std::uint64_t kLongestTimeoutSec = 365ULL * 24 * 60 * 60;

volatile std::sig_atomic_t g_pending_signal = 0;

void RecordSignal(int sig) {
    g_pending_signal = sig;
}

// Catches SIGINT/SIGTERM while a child runs so its process group can be
// killed before the signal is delivered to this process for real.
class TerminationTrap {
  public:
    TerminationTrap() {
        g_pending_signal = 0;
        struct sigaction sa{};
        sa.sa_handler = RecordSignal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        ::sigaction(SIGINT, &sa, &old_int_);
        ::sigaction(SIGTERM, &sa, &old_term_);
    }

    ~TerminationTrap() { Restore(); }

    TerminationTrap(const TerminationTrap&) = delete;
    TerminationTrap& operator=(const TerminationTrap&) = delete;

    int Pending() const { return g_pending_signal; }

    void Restore() {
        if (restored_) return;
        ::sigaction(SIGINT, &old_int_, nullptr);
        ::sigaction(SIGTERM, &old_term_, nullptr);
        restored_ = true;
    }

  private:
    struct sigaction old_int_{};
    struct sigaction old_term_{};
    bool restored_ = false;
};

void FillStatus(int status, ProcessStatus& out) {
    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.term_signal = WTERMSIG(status);
        out.exit_code = 128 + out.term_signal;
    }
}

void KillGroupAndReap(pid_t pid, int& status) {
    ::kill(-pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

// Blocks until the child has exec'd (pipe closed by O_CLOEXEC, returns 0)
// or reported why it could not (returns that errno).
int ReadExecError(const Fd& status_pipe) {
    int child_errno = 0;
    while (true) {
        const ssize_t n = ::read(status_pipe.Get(), &child_errno, sizeof(child_errno));
        if (n < 0 && errno == EINTR) continue;
        return n == static_cast<ssize_t>(sizeof(child_errno)) ? child_errno : 0;
    }
}

} // namespace

Result RunProcess(const std::vector<std::string>& argv, std::uint64_t timeout_sec, ProcessStatus& out) {
    out = ProcessStatus{};
    if (argv.empty()) return Result::Fail(EINVAL, "empty command");

    std::vector<char*> args;
    args.reserve(argv.size() + 1U);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        return Result::FromErrno("pipe failed");
    }
    Fd status_read(fds[0]);
    Fd status_write(fds[1]);

    TerminationTrap trap;

    const pid_t pid = ::fork();
    if (pid < 0) {
        return Result::FromErrno("fork failed");
    }

    if (pid == 0) {
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);
        ::setpgid(0, 0);
        ::execvp(args[0], args.data());
        const int err = errno;
        (void)!::write(status_write.Get(), &err, sizeof(err));
        _exit(127);
    }

    // Set it from both sides; whichever runs first wins the race.
    ::setpgid(pid, pid);
    status_write.Close();

    int status = 0;
    if (const int exec_errno = ReadExecError(status_read); exec_errno != 0) {
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        return Result::Fail(exec_errno, "cannot execute " + argv[0] + ": " + std::strerror(exec_errno));
    }

    const auto limit = std::chrono::seconds(std::min(timeout_sec, kLongestTimeoutSec));
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (true) {
        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0) {
            if (errno == EINTR) continue;
            return Result::FromErrno("waitpid failed");
        }
        if (const int sig = trap.Pending(); sig != 0) {
            LogWarn("signal %d received, killing process group %d", sig, static_cast<int>(pid));
            KillGroupAndReap(pid, status);
            trap.Restore();
            ::raise(sig);
            return Result::Fail(EINTR, argv[0] + " interrupted by signal " + std::to_string(sig));
        }
        if (timeout_sec != 0 && std::chrono::steady_clock::now() >= deadline) {
            LogWarn("%s exceeded %llu s, killing process group %d",
                    argv[0].c_str(), (unsigned long long)timeout_sec, static_cast<int>(pid));
            KillGroupAndReap(pid, status);
            out.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    // A signal that raced with the child's own exit still takes effect.
    if (const int sig = trap.Pending(); sig != 0) {
        trap.Restore();
        ::raise(sig);
    }

    FillStatus(status, out);
    return Result::Ok();
}

} // namespace corpus

#include "pipeline/worker_pool.hpp"

#include "io/fd.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace corpus {

namespace {

struct RunningWorker {
    pid_t pid = -1;
    Fd fd;
    std::string buffer;
    std::string name;
    int rank = 0;
};

PackageReport FailedReport(const std::string& name, int rank, std::string detail) {
    PackageReport r;
    r.name = name;
    r.rank = rank;
    r.state = PackageState::Failed;
    r.detail = std::move(detail);
    return r;
}

bool WriteAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

[[noreturn]] void RunChild(const WorkerPool::Job& job, int write_fd) {
    ResetSignalHandlers();

    PackageReport report;
    try {
        report = job.task();
    } catch (const std::exception& e) {
        LogError("worker for %s raised: %s", job.name.c_str(), e.what());
        report = FailedReport(job.name, job.rank, std::string("worker raised: ") + e.what());
    } catch (...) {
        LogError("worker for %s raised a non-standard exception", job.name.c_str());
        report = FailedReport(job.name, job.rank, "worker raised a non-standard exception");
    }
    if (report.name.empty()) report.name = job.name;
    if (report.rank == 0) report.rank = job.rank;

    int code = 0;
    if (!WriteAll(write_fd, EncodeReport(report) + "\n")) {
        code = 1;
    }
    ::close(write_fd);
    std::fflush(nullptr);
    _exit(code);
}

std::string DescribeExit(int status) {
    if (WIFEXITED(status)) {
        return "worker exited with status " + std::to_string(WEXITSTATUS(status)) + " without a report";
    }
    if (WIFSIGNALED(status)) {
        return "worker killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "worker ended without a report";
}

PackageReport Reap(RunningWorker& w) {
    int status = 0;
    while (::waitpid(w.pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return FailedReport(w.name, w.rank, std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    while (!w.buffer.empty() && (w.buffer.back() == '\n' || w.buffer.back() == '\r')) {
        w.buffer.pop_back();
    }
    if (w.buffer.empty()) {
        return FailedReport(w.name, w.rank, DescribeExit(status));
    }

    auto decoded = DecodeReport(w.buffer);
    if (!decoded) {
        return FailedReport(w.name, w.rank, decoded.error());
    }
    return *decoded;
}

} // namespace

std::size_t WorkerPool::Run(std::vector<Job> jobs, const ReportSink& on_report) {
    std::vector<RunningWorker> running;
    running.reserve(workers_);
    std::size_t next = 0;

    auto spawn = [&](const Job& job) {
        std::array<int, 2> fds{};
        if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
            on_report(FailedReport(job.name, job.rank, std::string("pipe failed: ") + std::strerror(errno)));
            return;
        }
        Fd read_end(fds[0]);
        Fd write_end(fds[1]);

        // Unflushed parent output would otherwise be written twice.
        std::fflush(nullptr);

        const pid_t pid = ::fork();
        if (pid < 0) {
            on_report(FailedReport(job.name, job.rank, std::string("fork failed: ") + std::strerror(errno)));
            return;
        }
        if (pid == 0) {
            read_end.Close();
            RunChild(job, write_end.Release());
        }

        write_end.Close();
        RunningWorker w;
        w.pid = pid;
        w.fd = std::move(read_end);
        w.name = job.name;
        w.rank = job.rank;
        LogDebug("worker %d started for %s", static_cast<int>(pid), job.name.c_str());
        running.push_back(std::move(w));
    };

    bool cancel_logged = false;
    while (next < jobs.size() || !running.empty()) {
        while (running.size() < workers_ && next < jobs.size() && !g_cancel.load(std::memory_order_relaxed)) {
            spawn(jobs[next++]);
        }
        if (g_cancel.load(std::memory_order_relaxed) && next < jobs.size() && !cancel_logged) {
            LogWarn("Interrupted: %zu packages will not be started", jobs.size() - next);
            cancel_logged = true;
        }
        if (running.empty()) {
            if (g_cancel.load(std::memory_order_relaxed)) break;
            continue;
        }

        std::vector<pollfd> pfds(running.size());
        for (size_t i = 0; i < running.size(); ++i) {
            pfds[i].fd = running[i].fd.Get();
            pfds[i].events = POLLIN;
            pfds[i].revents = 0;
        }

        const int rc = ::poll(pfds.data(), pfds.size(), -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
        }

        for (size_t i = pfds.size(); i-- > 0;) {
            if ((pfds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

            RunningWorker& w = running[i];
            std::array<char, 4096> buf{};
            const ssize_t n = ::read(w.fd.Get(), buf.data(), buf.size());
            if (n > 0) {
                w.buffer.append(buf.data(), static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;

            w.fd.Close();
            const PackageReport report = Reap(w);
            running.erase(running.begin() + static_cast<std::ptrdiff_t>(i));
            on_report(report);
        }
    }

    return jobs.size() - next;
}

} // namespace corpus

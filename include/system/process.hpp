#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace corpus {

struct ProcessStatus {
    int exit_code = -1;     // WEXITSTATUS, or 128 + signal number
    int term_signal = 0;    // non-zero when the child died from a signal
    bool timed_out = false; // child group was killed after the deadline
};

/**
 * @brief Runs argv[0] (looked up in PATH) and waits for it.
 *
 * The child runs in its own process group so a timeout can kill anything
 * it spawned. timeout_sec == 0 waits indefinitely. stdout and stderr are
 * inherited. Fails when the program could not be executed (the errno of
 * execvp is returned) or could not be waited for.
 *
 * SIGINT and SIGTERM received while waiting kill the child's group first
 * and are then re-raised with the caller's previous disposition.
 */
Result RunProcess(const std::vector<std::string>& argv, std::uint64_t timeout_sec, ProcessStatus& out);

} // namespace corpus

#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "util/Expected.hpp"

namespace mergereport {

/// Captured outcome of a finished child process
struct ProcessResult {
    int exitCode{-1};          // exit status, or 128 + signal number
    std::string stdoutText;
    std::string stderrText;

    bool succeeded() const { return exitCode == 0; }
};

struct ProcessOptions {
    std::filesystem::path workingDir{};                          // empty: inherit
    std::vector<std::pair<std::string, std::string>> env{};     // added to the inherited environment
};

/**
 * @brief Synchronous child process runner
 * 
 * Runs argv[0] (looked up on PATH) with the given arguments, no shell
 * involved, and blocks until it exits. stdin is /dev/null; stdout and
 * stderr are drained together so neither pipe can fill up and stall the
 * child.
 * 
 * A non-zero exit status is not an error at this level; callers inspect
 * ProcessResult::exitCode. Errors are returned only when the child could
 * not be started at all (missing executable, bad working directory,
 * pipe/fork failure).
 */
class Process {
public:
    static Expected<ProcessResult> run(const std::vector<std::string>& argv, const ProcessOptions& options = {});
};

}

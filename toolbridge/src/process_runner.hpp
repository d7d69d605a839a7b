#pragma once

#include "cancellation.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolbridge {

struct ProcessResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    bool cancelled = false;
};

/// The process could not be started at all (pipe/fork failure).
class ProcessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Runs an external program from an argument vector.
 * No shell is involved; argv[0] is resolved through PATH.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual ProcessResult run(const std::vector<std::string>& argv, const CancellationToken& cancel) = 0;
};

class PosixProcessRunner final : public ProcessRunner {
public:
    explicit PosixProcessRunner(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    ProcessResult run(const std::vector<std::string>& argv, const CancellationToken& cancel) override;

private:
    std::chrono::milliseconds poll_interval_;
};

} // namespace toolbridge

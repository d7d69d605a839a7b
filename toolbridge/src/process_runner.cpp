#include "process_runner.hpp"

#include "logger.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include <log4cplus/loggingmacros.h>

namespace toolbridge {

namespace {

class PipePair {
public:
    PipePair() {
        if (::pipe2(fds_, O_CLOEXEC) < 0) {
            throw ProcessError(std::string("pipe2: ") + std::strerror(errno));
        }
    }
    ~PipePair() {
        close_read();
        close_write();
    }
    PipePair(const PipePair&) = delete;
    PipePair& operator=(const PipePair&) = delete;

    int read_end() const { return fds_[0]; }
    int write_end() const { return fds_[1]; }

    void close_read() {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }
    void close_write() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2] = {-1, -1};
};

// Returns false once the pipe reached EOF or failed.
bool drain_pipe(int fd, std::string& sink) {
    char buffer[4096];
    for (;;) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            sink.append(buffer, static_cast<size_t>(n));
            return true;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return false;
    }
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

PosixProcessRunner::PosixProcessRunner(std::chrono::milliseconds poll_interval)
    : poll_interval_(poll_interval) {}

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& argv, const CancellationToken& cancel) {
    if (argv.empty() || argv.front().empty()) {
        throw ProcessError("empty argument vector");
    }

    // Built before fork: the child must not allocate.
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);
    const std::string exec_failure = "failed to execute " + argv.front() + "\n";

    PipePair out_pipe;
    PipePair err_pipe;

    LOG4CPLUS_DEBUG(tool_logger(), "spawning " << argv.front() << " with " << (argv.size() - 1) << " argument(s)");

    pid_t pid = ::fork();
    if (pid < 0) {
        throw ProcessError(std::string("fork: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            if (devnull != STDIN_FILENO) {
                ::close(devnull);
            }
        }
        ::dup2(out_pipe.write_end(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end(), STDERR_FILENO);
        ::execvp(c_argv[0], c_argv.data());
        // Only async-signal-safe calls between fork and _exit.
        ssize_t written = ::write(STDERR_FILENO, exec_failure.data(), exec_failure.size());
        (void)written;
        ::_exit(127);
    }

    // Both sides set the group so a kill(-pid) cannot race the child's own setpgid.
    ::setpgid(pid, pid);
    out_pipe.close_write();
    err_pipe.close_write();

    ProcessResult result;
    pollfd fds[2] = {
        {out_pipe.read_end(), POLLIN, 0},
        {err_pipe.read_end(), POLLIN, 0},
    };
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
    int open_count = 2;
    bool killed = false;

    while (open_count > 0) {
        if (!killed && cancel.is_cancelled()) {
            LOG4CPLUS_WARN(tool_logger(), "cancelling " << argv.front() << " (pid " << pid << ")");
            ::kill(-pid, SIGKILL);
            killed = true;
            result.cancelled = true;
        }

        int ready = ::poll(fds, 2, static_cast<int>(poll_interval_.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG4CPLUS_ERROR(tool_logger(), "poll failed: " << std::strerror(errno));
            if (!killed) {
                ::kill(-pid, SIGKILL);
                killed = true;
            }
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            if (!drain_pipe(fds[i].fd, *sinks[i])) {
                fds[i].fd = -1;
                --open_count;
            }
        }
    }

    // The child may have closed its pipes and still be running.
    int status = 0;
    for (;;) {
        pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            break;
        }
        if (reaped < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ProcessError(std::string("waitpid: ") + std::strerror(errno));
        }
        if (!killed && cancel.is_cancelled()) {
            LOG4CPLUS_WARN(tool_logger(), "cancelling " << argv.front() << " (pid " << pid << ") after its pipes closed");
            ::kill(-pid, SIGKILL);
            killed = true;
            result.cancelled = true;
        }
        std::this_thread::sleep_for(poll_interval_);
    }
    result.exit_code = decode_wait_status(status);

    LOG4CPLUS_DEBUG(tool_logger(), argv.front() << " exited with " << result.exit_code
                    << (result.cancelled ? " (cancelled)" : ""));
    return result;
}

} // namespace toolbridge

/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <boost/algorithm/string.hpp>

#include "libferry/Error.hpp"
#include "libferry/utility/logging.hpp"
#include "libferry/utility/filesystem.hpp"

extern char** environ;

/**
 * Utility functions for system operations
 */

namespace libferry {
namespace process {

namespace {

// Accumulates the data read from one of the child's output pipes and
// forwards complete lines to the (optional) line handler
class OutputStream {
public:
    OutputStream(int fd, std::string* captured, const LineHandler& lineHandler)
        : fd{fd}
        , captured{captured}
        , lineHandler{lineHandler}
    {}

    int getFd() const { return fd; }
    bool isOpen() const { return fd != -1; }

    void readAvailableData() {
        std::array<char, 4096> buffer;
        auto count = read(fd, buffer.data(), buffer.size());
        if(count == -1) {
            if(errno == EINTR || errno == EAGAIN) {
                return;
            }
            auto message = boost::format("Failed to read output of subprocess: %s") % strerror(errno);
            FERRY_THROW_ERROR(message.str());
        }
        if(count == 0) {
            flushPartialLine();
            close();
            return;
        }
        captured->append(buffer.data(), count);
        if(lineHandler) {
            partialLine.append(buffer.data(), count);
            forwardCompleteLines();
        }
    }

    void close() {
        if(fd != -1) {
            ::close(fd);
            fd = -1;
        }
    }

private:
    void forwardCompleteLines() {
        auto newline = partialLine.find('\n');
        while(newline != std::string::npos) {
            lineHandler(partialLine.substr(0, newline));
            partialLine.erase(0, newline + 1);
            newline = partialLine.find('\n');
        }
    }

    void flushPartialLine() {
        if(lineHandler && !partialLine.empty()) {
            lineHandler(partialLine);
            partialLine.clear();
        }
    }

private:
    int fd;
    std::string* captured;
    const LineHandler& lineHandler;
    std::string partialLine;
};

void closePipe(int pipefd[2]) {
    ::close(pipefd[0]);
    ::close(pipefd[1]);
}

pid_t waitForChild(pid_t pid, int* status, int flags) {
    pid_t ret;
    do {
        ret = waitpid(pid, status, flags);
    } while(ret == -1 && errno == EINTR);
    return ret;
}

// Terminates the child's process group once the configured timeout expired:
// SIGTERM first, then SIGKILL after the grace period
class Timeout {
public:
    Timeout(const libferry::CLIArguments& args, pid_t pid, const CaptureOptions& options)
        : args{args}
        , pid{pid}
        , options{options}
        , deadline{std::chrono::steady_clock::now() + options.timeout}
    {}

    bool isActive() const {
        return options.timeout.count() > 0 && !sentSigkill;
    }

    bool hasExpired() const {
        return sentSigterm;
    }

    // Sends the due signals and returns the milliseconds until the next deadline
    // (-1 when there is nothing left to wait for)
    int enforce() {
        if(!isActive()) {
            return -1;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if(remaining.count() > 0) {
            return static_cast<int>(remaining.count());
        }

        if(!sentSigterm) {
            logMessage(boost::format("Subprocess %s (pid %d) timed out after %d ms, sending SIGTERM")
                       % args % pid % options.timeout.count(), libferry::LogLevel::INFO);
            kill(-pid, SIGTERM);
            sentSigterm = true;
            deadline = std::chrono::steady_clock::now() + options.killGracePeriod;
            return static_cast<int>(options.killGracePeriod.count());
        }

        logMessage(boost::format("Subprocess %s (pid %d) still alive, sending SIGKILL")
                   % args % pid, libferry::LogLevel::INFO);
        kill(-pid, SIGKILL);
        sentSigkill = true;
        return -1;
    }

private:
    const libferry::CLIArguments& args;
    pid_t pid;
    const CaptureOptions& options;
    std::chrono::steady_clock::time_point deadline;
    bool sentSigterm = false;
    bool sentSigkill = false;
};

} // namespace

CapturedOutput forkExecCapture(const libferry::CLIArguments& args, const CaptureOptions& options) {
    logMessage(boost::format("Forking and executing '%s'") % args, libferry::LogLevel::DEBUG);

    if(args.empty()) {
        FERRY_THROW_ERROR("Failed to execute subprocess: no arguments provided");
    }

    // prepare the environment before forking: the child must not allocate
    auto environment = libferry::CLIArguments{};
    char** envp = environ;
    if(options.environment) {
        environment = libferry::CLIArguments(options.environment->cbegin(), options.environment->cend());
        envp = environment.argv();
    }

    int stdoutPipe[2];
    int stderrPipe[2];
    if(pipe2(stdoutPipe, O_CLOEXEC) == -1) {
        auto message = boost::format("Failed to open pipe to execute subprocess %s: %s")
            % args % strerror(errno);
        FERRY_THROW_ERROR(message.str());
    }
    if(pipe2(stderrPipe, O_CLOEXEC) == -1) {
        auto message = boost::format("Failed to open pipe to execute subprocess %s: %s")
            % args % strerror(errno);
        closePipe(stdoutPipe);
        FERRY_THROW_ERROR(message.str());
    }

    // fork and execute
    auto pid = fork();
    if(pid == -1) {
        auto message = boost::format("Failed to fork to execute subprocess %s: %s")
            % args % strerror(errno);
        closePipe(stdoutPipe);
        closePipe(stderrPipe);
        FERRY_THROW_ERROR(message.str());
    }

    bool isChild = pid == 0;
    if(isChild) {
        // own process group, so that a timeout can terminate the whole process tree
        setpgid(0, 0);

        int devNull = open("/dev/null", O_RDONLY);
        if(devNull != -1) {
            dup2(devNull, STDIN_FILENO);
        }
        dup2(stdoutPipe[1], STDOUT_FILENO);
        dup2(stderrPipe[1], STDERR_FILENO);

        execve(args.argv()[0], args.argv(), envp);

        // only async-signal-safe calls from here on
        const char* header = "Failed to execve subprocess: ";
        const char* reason = strerror(errno);
        (void)!write(STDERR_FILENO, header, strlen(header));
        (void)!write(STDERR_FILENO, reason, strlen(reason));
        (void)!write(STDERR_FILENO, "\n", 1);
        _exit(127);
    }

    // also set from the parent, the child might not have run yet when a timeout expires
    setpgid(pid, pid);

    // Close the write ends of the pipes, as they won't be used
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    auto output = CapturedOutput{};
    auto streams = std::array<OutputStream, 2>{{
        OutputStream{stdoutPipe[0], &output.standardOutput, options.stdoutLineHandler},
        OutputStream{stderrPipe[0], &output.standardError, options.stderrLineHandler}
    }};
    auto timeout = Timeout{args, pid, options};

    try {
        while(streams[0].isOpen() || streams[1].isOpen()) {
            auto pollFds = std::array<pollfd, 2>{};
            nfds_t numberOfFds = 0;
            for(const auto& stream : streams) {
                if(stream.isOpen()) {
                    pollFds[numberOfFds++] = pollfd{stream.getFd(), POLLIN, 0};
                }
            }

            auto ready = poll(pollFds.data(), numberOfFds, timeout.enforce());
            if(ready == -1) {
                if(errno == EINTR) {
                    continue;
                }
                auto message = boost::format("Failed to poll output of subprocess %s: %s") % args % strerror(errno);
                FERRY_THROW_ERROR(message.str());
            }

            for(nfds_t i=0; i<numberOfFds; ++i) {
                if(pollFds[i].revents == 0) {
                    continue;
                }
                for(auto& stream : streams) {
                    if(stream.isOpen() && stream.getFd() == pollFds[i].fd) {
                        stream.readAvailableData();
                    }
                }
            }
        }
    }
    catch(libferry::Error& e) {
        kill(-pid, SIGKILL);
        int status;
        waitForChild(pid, &status, 0);
        for(auto& stream : streams) {
            stream.close();
        }
        auto message = boost::format("Failed to capture output of subprocess %s") % args;
        FERRY_RETHROW_ERROR(e, message.str());
    }

    // the child may outlive its output streams (e.g. it closed them explicitly)
    int status;
    while(true) {
        auto ret = waitForChild(pid, &status, timeout.isActive() ? WNOHANG : 0);
        if(ret == -1) {
            auto message = boost::format("Failed to waitpid subprocess %s: %s")
                % args % strerror(errno);
            FERRY_THROW_ERROR(message.str());
        }
        if(ret == pid) {
            break;
        }
        auto sleepTime = std::min(timeout.enforce(), 10);
        if(sleepTime > 0) {
            usleep(sleepTime * 1000);
        }
    }
    output.timedOut = timeout.hasExpired();

    if(WIFEXITED(status)) {
        output.exitStatus = WEXITSTATUS(status);
    }
    else if(WIFSIGNALED(status)) {
        output.terminatedBySignal = true;
        output.signal = WTERMSIG(status);
        output.exitStatus = 128 + output.signal;
    }

    logMessage( boost::format("%s (pid %d) exited with status %d") % args % pid % output.exitStatus,
                libferry::LogLevel::DEBUG);

    return output;
}

/**
 * Locates an executable the way execvp does: names containing a slash are
 * checked as they are, other names are searched in the colon-separated list
 * of directories 'searchPath'.
 */
boost::optional<boost::filesystem::path> findExecutable(const std::string& name, const std::string& searchPath) {
    if(name.empty()) {
        return boost::none;
    }

    if(name.find('/') != std::string::npos) {
        if(filesystem::isExecutableFile(name)) {
            return boost::filesystem::absolute(name);
        }
        return boost::none;
    }

    auto directories = std::vector<std::string>{};
    boost::split(directories, searchPath, boost::is_any_of(":"));
    for(const auto& directory : directories) {
        // an empty entry stands for the current working directory
        auto candidate = (directory.empty() ? boost::filesystem::current_path() : boost::filesystem::path{directory}) / name;
        if(filesystem::isExecutableFile(candidate)) {
            logMessage(boost::format("Found executable %s at %s") % name % candidate, libferry::LogLevel::DEBUG);
            return candidate;
        }
    }

    return boost::none;
}

std::string getHostname() {
    char hostname[HOST_NAME_MAX];
    if(gethostname(hostname, HOST_NAME_MAX) != 0) {
        auto message = boost::format("failed to retrieve hostname (%s)") % strerror(errno);
        FERRY_THROW_ERROR(message.str());
    }
    hostname[HOST_NAME_MAX-1] = '\0';
    return hostname;
}

}}

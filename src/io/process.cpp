// =============================================================================
// railmr - Child Process Management Implementation
// =============================================================================

#include "railmr/io/process.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <limits>
#include <mutex>
#include <streambuf>
#include <utility>

#include <fmt/format.h>

#include "railmr/common/logger.h"

extern char** environ;

namespace railmr::io {

namespace {

int decodeWaitStatus(int status) noexcept {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int waitForPid(int pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return decodeWaitStatus(status);
}

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/// @brief posix_spawn attributes and file actions, destroyed on scope exit.
class SpawnSetup {
public:
    SpawnSetup() {
        ::posix_spawn_file_actions_init(&actions_);
        ::posix_spawnattr_init(&attr_);
        // Own process group so terminate() reaches grandchildren too
        ::posix_spawnattr_setflags(&attr_, POSIX_SPAWN_SETPGROUP);
        ::posix_spawnattr_setpgroup(&attr_, 0);
    }

    ~SpawnSetup() {
        ::posix_spawn_file_actions_destroy(&actions_);
        ::posix_spawnattr_destroy(&attr_);
    }

    SpawnSetup(const SpawnSetup&) = delete;
    SpawnSetup& operator=(const SpawnSetup&) = delete;

    void redirect(int fd, int target) { ::posix_spawn_file_actions_adddup2(&actions_, fd, target); }

    void openDevNull(int target) {
        ::posix_spawn_file_actions_addopen(&actions_, target, "/dev/null", O_RDONLY, 0);
    }

    /// @return 0 or the errno of the failed spawn.
    int spawn(const std::vector<std::string>& argv, int& pid) {
        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);
        pid_t child = -1;
        int rc = ::posix_spawnp(&child, args[0], &actions_, &attr_, args.data(), environ);
        pid = child;
        return rc;
    }

private:
    posix_spawn_file_actions_t actions_;
    posix_spawnattr_t attr_;
};

bool makePipe(std::array<int, 2>& fds) {
    return ::pipe2(fds.data(), O_CLOEXEC) == 0;
}

void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

class PosixChildProcess final : public ChildProcess {
public:
    explicit PosixChildProcess(int pid) : pid_(pid) {}

    ~PosixChildProcess() override {
        if (!exitCode_) {
            terminate();
            waitForPid(pid_);
        }
    }

    PosixChildProcess(const PosixChildProcess&) = delete;
    PosixChildProcess& operator=(const PosixChildProcess&) = delete;

    std::optional<int> tryWait() override {
        if (exitCode_) {
            return exitCode_;
        }
        int status = 0;
        int rc = ::waitpid(pid_, &status, WNOHANG);
        if (rc == pid_) {
            exitCode_ = decodeWaitStatus(status);
        } else if (rc < 0 && errno == ECHILD) {
            exitCode_ = -1;
        }
        return exitCode_;
    }

    int wait() override {
        if (!exitCode_) {
            exitCode_ = waitForPid(pid_);
        }
        return *exitCode_;
    }

    void terminate() noexcept override {
        if (!exitCode_ && pid_ > 0) {
            ::kill(-pid_, SIGTERM);
        }
    }

    int pid() const noexcept override { return pid_; }

private:
    int pid_;
    std::optional<int> exitCode_;
};

}  // namespace

// =============================================================================
// PosixProcessLauncher
// =============================================================================

Result<ProcessResult> PosixProcessLauncher::run(const std::vector<std::string>& argv,
                                                std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return makeError<ProcessResult>(ErrorCode::kInvalidArgument, "Empty command line");
    }

    std::array<int, 2> outPipe{-1, -1};
    std::array<int, 2> errPipe{-1, -1};
    if (!makePipe(outPipe) || !makePipe(errPipe)) {
        int savedErrno = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return makeError<ProcessResult>(
            ErrorCode::kBackendUnavailable,
            fmt::format("Cannot create pipes for {}: {}", argv[0], std::strerror(savedErrno)));
    }

    int pid = -1;
    int rc = 0;
    {
        SpawnSetup setup;
        setup.openDevNull(STDIN_FILENO);
        setup.redirect(outPipe[1], STDOUT_FILENO);
        setup.redirect(errPipe[1], STDERR_FILENO);
        rc = setup.spawn(argv, pid);
    }
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    if (rc != 0) {
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        return makeError<ProcessResult>(
            ErrorCode::kBackendUnavailable,
            fmt::format("Cannot launch {}: {}", argv[0], std::strerror(rc)));
    }

    RAILMR_LOG_DEBUG("Started {} (pid {})", joinCommand(argv), pid);

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 8192> buffer{};
    std::array<pollfd, 2> fds{pollfd{outPipe[0], POLLIN, 0}, pollfd{errPipe[0], POLLIN, 0}};
    std::array<std::string*, 2> sinks{&result.output, &result.errorOutput};
    int open = 2;

    while (open > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            ::kill(-pid, SIGKILL);
            break;
        }
        int ready = ::poll(fds.data(), fds.size(), static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                closeFd(fds[i].fd);
                --open;
            }
        }
    }

    for (auto& fd : fds) {
        closeFd(fd.fd);
    }
    result.exitCode = waitForPid(pid);
    return result;
}

Result<std::unique_ptr<ChildProcess>> PosixProcessLauncher::spawn(
    const std::vector<std::string>& argv, const std::filesystem::path& logFile) {
    if (argv.empty()) {
        return makeError<std::unique_ptr<ChildProcess>>(ErrorCode::kInvalidArgument,
                                                        "Empty command line");
    }

    int logFd = ::open(logFile.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (logFd < 0) {
        return makeError<std::unique_ptr<ChildProcess>>(
            ErrorCode::kIOError,
            fmt::format("Cannot open log {}: {}", logFile.string(), std::strerror(errno)));
    }

    int pid = -1;
    int rc = 0;
    {
        SpawnSetup setup;
        setup.openDevNull(STDIN_FILENO);
        setup.redirect(logFd, STDOUT_FILENO);
        setup.redirect(logFd, STDERR_FILENO);
        rc = setup.spawn(argv, pid);
    }
    ::close(logFd);
    if (rc != 0) {
        return makeError<std::unique_ptr<ChildProcess>>(
            ErrorCode::kBackendUnavailable,
            fmt::format("Cannot launch {}: {}", argv[0], std::strerror(rc)));
    }

    RAILMR_LOG_DEBUG("Spawned {} (pid {}), output in {}", joinCommand(argv), pid,
                     logFile.string());
    return std::make_unique<PosixChildProcess>(pid);
}

// =============================================================================
// Quoting
// =============================================================================

std::string shellQuote(std::string_view argument) {
    if (!argument.empty() &&
        argument.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz"
                                   "0123456789_-./=:,+@%") == std::string_view::npos) {
        return std::string(argument);
    }
    std::string quoted = "'";
    for (char c : argument) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string joinCommand(const std::vector<std::string>& argv) {
    std::string command;
    for (const auto& arg : argv) {
        if (!command.empty()) {
            command += ' ';
        }
        command += shellQuote(arg);
    }
    return command;
}

// =============================================================================
// PipedProcess
// =============================================================================

namespace {

/// @brief Input stream buffer over a pipe's read end.
class PipeInputBuf : public std::streambuf {
public:
    explicit PipeInputBuf(int fd) : fd_(fd) {}

protected:
    int_type underflow() override {
        if (gptr() < egptr()) {
            return traits_type::to_int_type(*gptr());
        }
        for (;;) {
            ssize_t n = ::read(fd_, buffer_.data(), buffer_.size());
            if (n > 0) {
                setg(buffer_.data(), buffer_.data(), buffer_.data() + n);
                return traits_type::to_int_type(*gptr());
            }
            if (n == 0 || errno != EINTR) {
                return traits_type::eof();
            }
        }
    }

private:
    int fd_;
    std::array<char, 16384> buffer_{};
};

}  // namespace

PipedProcess::PipedProcess(const std::string& shellCommand, OutputReader reader)
    : command_(shellCommand), outputReader_(std::move(reader)) {
    ignoreSigpipeOnce();

    std::array<int, 2> inPipe{-1, -1};
    std::array<int, 2> outPipe{-1, -1};
    if (!makePipe(inPipe) || !makePipe(outPipe)) {
        int savedErrno = errno;
        closeFd(inPipe[0]);
        closeFd(inPipe[1]);
        throw TaskExecutionError(
            fmt::format("Cannot create pipes for '{}': {}", command_, std::strerror(savedErrno)));
    }

    int rc = 0;
    {
        SpawnSetup setup;
        setup.redirect(inPipe[0], STDIN_FILENO);
        setup.redirect(outPipe[1], STDOUT_FILENO);
        rc = setup.spawn({"/bin/sh", "-c", command_}, pid_);
    }
    ::close(inPipe[0]);
    ::close(outPipe[1]);
    if (rc != 0) {
        ::close(inPipe[1]);
        ::close(outPipe[0]);
        throw TaskExecutionError(
            fmt::format("Cannot start '{}': {}", command_, std::strerror(rc)));
    }

    stdinFd_ = inPipe[1];
    stdoutFd_ = outPipe[0];
    reader_ = std::thread([this] { readOutput(); });
}

PipedProcess::~PipedProcess() {
    closeInput();
    if (!exitCode_ && pid_ > 0) {
        ::kill(-pid_, SIGTERM);
        waitForPid(pid_);
    }
    if (reader_.joinable()) {
        reader_.join();
    }
    closeFd(stdoutFd_);
}

void PipedProcess::write(std::string_view data) {
    while (!data.empty()) {
        if (stdinFd_ < 0) {
            throw TaskExecutionError(fmt::format("Input of '{}' already closed", command_));
        }
        ssize_t n = ::write(stdinFd_, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TaskExecutionError(
                fmt::format("Write to '{}' failed: {}", command_, std::strerror(errno)));
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
}

void PipedProcess::closeInput() noexcept {
    closeFd(stdinFd_);
}

int PipedProcess::finish() {
    closeInput();
    if (reader_.joinable()) {
        reader_.join();
    }
    if (!exitCode_) {
        exitCode_ = waitForPid(pid_);
    }
    if (readError_) {
        std::rethrow_exception(std::exchange(readError_, nullptr));
    }
    return *exitCode_;
}

void PipedProcess::readOutput() {
    PipeInputBuf buffer(stdoutFd_);
    std::istream output(&buffer);
    try {
        outputReader_(output);
    } catch (...) {
        readError_ = std::current_exception();
    }
    // Keep the pipe drained so the child can run to completion
    output.clear();
    output.ignore(std::numeric_limits<std::streamsize>::max());
}

}  // namespace railmr::io

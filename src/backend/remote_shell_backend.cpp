// =============================================================================
// railmr - Remote Shell (ssh) Backend Implementation
// =============================================================================

#include "railmr/backend/remote_shell_backend.h"

#include <algorithm>

#include <fmt/format.h>

#include "railmr/common/logger.h"

namespace railmr::backend {

std::vector<std::string> makeRemoteCommand(const BackendEnvironment& environment,
                                           const RemoteShellOptions& options,
                                           const std::string& host,
                                           const std::filesystem::path& workingDir,
                                           const std::filesystem::path& descriptor) {
    std::vector<std::string> argv = {environment.ssh, "-o", "BatchMode=yes"};
    argv.insert(argv.end(), options.sshOptions.begin(), options.sshOptions.end());
    argv.push_back(host);
    argv.push_back(fmt::format("cd {} && exec {} exec-task --descriptor {}",
                               io::shellQuote(workingDir.string()),
                               io::shellQuote(environment.worker.string()),
                               io::shellQuote(descriptor.string())));
    return argv;
}

RemoteShellBackend::RemoteShellBackend(RemoteShellOptions options, BackendEnvironment environment,
                                       RetryPolicy retry, io::ProcessLauncher& launcher)
    : options_(std::move(options)),
      environment_(std::move(environment)),
      retry_(retry),
      launcher_(launcher),
      workingDir_(std::filesystem::current_path()),
      used_(options_.hosts.size(), 0) {}

RemoteShellBackend::~RemoteShellBackend() {
    shutdown();
}

std::optional<std::size_t> RemoteShellBackend::pickHost() const {
    std::optional<std::size_t> best;
    std::size_t bestFree = 0;
    for (std::size_t i = 0; i < options_.hosts.size(); ++i) {
        auto free = options_.hosts[i].slots - used_[i];
        if (free > bestFree) {
            best = i;
            bestFree = free;
        }
    }
    return best;
}

Result<TaskHandle> RemoteShellBackend::submit(const format::TaskSpec& spec,
                                              const TaskFiles& files) {
    std::size_t host = 0;
    {
        std::lock_guard lock(mutex_);
        auto picked = pickHost();
        if (!picked) {
            return makeError<TaskHandle>(ErrorCode::kBackendUnavailable,
                                         "no free ssh slot on any host");
        }
        host = *picked;
        ++used_[host];
    }
    const auto& hostName = options_.hosts[host].host;
    auto argv = makeRemoteCommand(environment_, options_, hostName, workingDir_, files.descriptor);

    auto child = retryWithBackoff<std::unique_ptr<io::ChildProcess>>(
        retry_, fmt::format("ssh {}", hostName), [&] { return launcher_.spawn(argv, files.log); });
    if (!child) {
        std::lock_guard lock(mutex_);
        --used_[host];
        return std::unexpected(child.error());
    }

    TaskHandle handle;
    handle.id = attemptId(spec.stageIndex, spec.taskIndex, spec.attempt);
    handle.externalId = fmt::format("{}:{}", hostName, (*child)->pid());
    handle.stage = spec.stageIndex;
    handle.task = spec.taskIndex;
    handle.attempt = spec.attempt;

    std::lock_guard lock(mutex_);
    sessions_[handle.id] = Session{std::move(*child), host, spec.statusPath, false};
    RAILMR_LOG_DEBUG("Started {} on {}", spec.describe(), hostName);
    return handle;
}

Result<TaskStatus> RemoteShellBackend::poll(const TaskHandle& handle) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(handle.id);
    if (it == sessions_.end()) {
        return makeError<TaskStatus>(ErrorCode::kInternalError,
                                     fmt::format("unknown ssh task {}", handle.id));
    }
    auto& session = it->second;
    auto exitCode = session.child->tryWait();
    if (!exitCode) {
        return TaskStatus::running();
    }

    const auto& hostName = options_.hosts[session.host].host;
    TaskStatus status;
    std::error_code ec;
    if (std::filesystem::exists(session.statusPath, ec)) {
        status = statusFromFile(session.statusPath, *exitCode);
    } else if (session.cancelRequested) {
        status.state = TaskState::kCancelled;
        status.code = ErrorCode::kCancelled;
        status.reason = fmt::format("ssh task on {} cancelled", hostName);
    } else if (*exitCode == kSshChannelFailure) {
        status = TaskStatus::failed(
            ErrorCode::kBackendUnavailable,
            fmt::format("ssh connection to {} failed (exit {})", hostName, *exitCode));
    } else {
        status = statusFromFile(session.statusPath, *exitCode);
    }
    --used_[session.host];
    sessions_.erase(it);
    return status;
}

VoidResult RemoteShellBackend::cancel(const TaskHandle& handle) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(handle.id);
    if (it != sessions_.end()) {
        it->second.cancelRequested = true;
        it->second.child->terminate();
    }
    return makeVoidSuccess();
}

std::size_t RemoteShellBackend::capacity() const {
    std::lock_guard lock(mutex_);
    std::size_t free = 0;
    for (std::size_t i = 0; i < options_.hosts.size(); ++i) {
        free += options_.hosts[i].slots - used_[i];
    }
    return free;
}

void RemoteShellBackend::shutdown() {
    std::lock_guard lock(mutex_);
    for (auto& [id, session] : sessions_) {
        session.child->terminate();
        session.child->wait();
    }
    sessions_.clear();
    std::fill(used_.begin(), used_.end(), 0);
}

}  // namespace railmr::backend

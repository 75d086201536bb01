// =============================================================================
// railmr - Remote Shell (ssh) Backend
// =============================================================================
// Runs each task attempt as
//   ssh -o BatchMode=yes <host> 'cd <cwd> && exec <worker> exec-task ...'
// on hosts that share the work root with this machine. Every host offers a
// fixed number of slots; an attempt holds one slot until its ssh client exits.
// =============================================================================

#ifndef RAILMR_BACKEND_REMOTE_SHELL_BACKEND_H
#define RAILMR_BACKEND_REMOTE_SHELL_BACKEND_H

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "railmr/backend/backend.h"
#include "railmr/backend/backend_config.h"
#include "railmr/io/process.h"

namespace railmr::backend {

/// @brief ssh exits with 255 when the connection itself fails.
inline constexpr int kSshChannelFailure = 255;

/// @brief argv of the ssh client that runs one attempt on @p host.
[[nodiscard]] std::vector<std::string> makeRemoteCommand(const BackendEnvironment& environment,
                                                         const RemoteShellOptions& options,
                                                         const std::string& host,
                                                         const std::filesystem::path& workingDir,
                                                         const std::filesystem::path& descriptor);

class RemoteShellBackend final : public Backend {
public:
    /// @param launcher Must outlive the backend.
    RemoteShellBackend(RemoteShellOptions options, BackendEnvironment environment,
                       RetryPolicy retry, io::ProcessLauncher& launcher);

    ~RemoteShellBackend() override;

    RemoteShellBackend(const RemoteShellBackend&) = delete;
    RemoteShellBackend& operator=(const RemoteShellBackend&) = delete;

    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::kRemoteShell; }

    [[nodiscard]] Result<TaskHandle> submit(const format::TaskSpec& spec,
                                            const TaskFiles& files) override;

    [[nodiscard]] Result<TaskStatus> poll(const TaskHandle& handle) override;

    [[nodiscard]] VoidResult cancel(const TaskHandle& handle) override;

    [[nodiscard]] std::size_t capacity() const override;

    /// @brief Terminate every ssh client still running.
    void shutdown() override;

private:
    struct Session {
        std::unique_ptr<io::ChildProcess> child;
        std::size_t host = 0;
        std::filesystem::path statusPath;
        bool cancelRequested = false;
    };

    /// @brief Index of the host with the most free slots, if any is free.
    [[nodiscard]] std::optional<std::size_t> pickHost() const;

    RemoteShellOptions options_;
    BackendEnvironment environment_;
    RetryPolicy retry_;
    io::ProcessLauncher& launcher_;
    std::filesystem::path workingDir_;

    mutable std::mutex mutex_;
    std::vector<std::size_t> used_;
    std::map<std::string, Session> sessions_;
};

}  // namespace railmr::backend

#endif  // RAILMR_BACKEND_REMOTE_SHELL_BACKEND_H

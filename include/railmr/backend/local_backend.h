// =============================================================================
// railmr - Local Backend
// =============================================================================
// Runs task attempts on worker threads of a dedicated TBB arena, in this
// process. Each attempt gets its own CancellationToken; cancel() trips it and
// the task runner aborts at its next unit boundary without publishing.
// =============================================================================

#ifndef RAILMR_BACKEND_LOCAL_BACKEND_H
#define RAILMR_BACKEND_LOCAL_BACKEND_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <tbb/global_control.h>
#include <tbb/task_arena.h>

#include "railmr/backend/backend.h"
#include "railmr/backend/backend_config.h"
#include "railmr/stage/stage_body.h"

namespace railmr::backend {

class LocalBackend final : public Backend {
public:
    LocalBackend(const stage::StageRegistry& registry, std::size_t workers);

    ~LocalBackend() override;

    LocalBackend(const LocalBackend&) = delete;
    LocalBackend& operator=(const LocalBackend&) = delete;

    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::kLocal; }

    [[nodiscard]] Result<TaskHandle> submit(const format::TaskSpec& spec,
                                            const TaskFiles& files) override;

    [[nodiscard]] Result<TaskStatus> poll(const TaskHandle& handle) override;

    [[nodiscard]] VoidResult cancel(const TaskHandle& handle) override;

    [[nodiscard]] std::size_t capacity() const override;

    /// @brief Cancel every running attempt and wait for all of them to return.
    void shutdown() override;

    [[nodiscard]] std::size_t workers() const noexcept { return workers_; }

private:
    struct Entry {
        CancellationToken cancel;
        std::atomic<bool> done{false};
        format::TaskOutcome outcome;
    };

    void finished();

    const stage::StageRegistry& registry_;
    std::size_t workers_;
    tbb::global_control parallelism_;
    tbb::task_arena arena_;

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
    std::size_t inFlight_ = 0;
    std::size_t notifying_ = 0;
    bool shutdown_ = false;
};

}  // namespace railmr::backend

#endif  // RAILMR_BACKEND_LOCAL_BACKEND_H

// =============================================================================
// railmr - Local Backend Implementation
// =============================================================================

#include "railmr/backend/local_backend.h"

#include <fmt/format.h>

#include "railmr/common/logger.h"
#include "railmr/pipeline/worker.h"

namespace railmr::backend {

LocalBackend::LocalBackend(const stage::StageRegistry& registry, std::size_t workers)
    : registry_(registry),
      workers_(workers == 0 ? 1 : workers),
      parallelism_(tbb::global_control::max_allowed_parallelism, workers_ + 1),
      arena_(static_cast<int>(workers_), 0) {
    RAILMR_LOG_DEBUG("Local backend: {} worker threads", workers_);
}

LocalBackend::~LocalBackend() {
    shutdown();
}

Result<TaskHandle> LocalBackend::submit(const format::TaskSpec& spec, const TaskFiles& files) {
    (void)files;
    TaskHandle handle;
    handle.stage = spec.stageIndex;
    handle.task = spec.taskIndex;
    handle.attempt = spec.attempt;
    handle.id = attemptId(spec.stageIndex, spec.taskIndex, spec.attempt);
    handle.externalId = handle.id;

    auto entry = std::make_shared<Entry>();
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            return makeError<TaskHandle>(ErrorCode::kCancelled, "local backend is shut down");
        }
        if (inFlight_ >= workers_) {
            return makeError<TaskHandle>(ErrorCode::kBackendUnavailable,
                                         "no free local worker slot");
        }
        if (entries_.contains(handle.id)) {
            return makeError<TaskHandle>(ErrorCode::kInternalError,
                                         fmt::format("attempt {} already submitted", handle.id));
        }
        entries_.emplace(handle.id, entry);
        ++inFlight_;
    }

    arena_.enqueue([this, entry, spec] {
        try {
            entry->outcome = pipeline::runAndReport(spec, registry_, entry->cancel);
        } catch (const RailmrException& ex) {
            RAILMR_LOG_ERROR("Task {} could not publish its status: {}", spec.describe(),
                             ex.what());
            entry->outcome = format::TaskOutcome::failure(ex.code(), ex.what());
        }
        entry->done.store(true, std::memory_order_release);
        finished();
    });
    return handle;
}

void LocalBackend::finished() {
    {
        std::lock_guard lock(mutex_);
        --inFlight_;
        ++notifying_;
    }
    notifyCompletion();
    std::lock_guard lock(mutex_);
    --notifying_;
    idle_.notify_all();
}

Result<TaskStatus> LocalBackend::poll(const TaskHandle& handle) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(handle.id);
        if (it == entries_.end()) {
            return makeError<TaskStatus>(ErrorCode::kInternalError,
                                         fmt::format("unknown local task {}", handle.id));
        }
        entry = it->second;
    }
    if (!entry->done.load(std::memory_order_acquire)) {
        return TaskStatus::running();
    }
    {
        std::lock_guard lock(mutex_);
        entries_.erase(handle.id);
    }
    return TaskStatus::fromOutcome(entry->outcome);
}

VoidResult LocalBackend::cancel(const TaskHandle& handle) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(handle.id);
    if (it != entries_.end()) {
        it->second->cancel.cancel();
    }
    return makeVoidSuccess();
}

std::size_t LocalBackend::capacity() const {
    std::lock_guard lock(mutex_);
    return shutdown_ || inFlight_ >= workers_ ? 0 : workers_ - inFlight_;
}

void LocalBackend::shutdown() {
    std::unique_lock lock(mutex_);
    shutdown_ = true;
    for (auto& [id, entry] : entries_) {
        entry->cancel.cancel();
    }
    idle_.wait(lock, [this] { return inFlight_ == 0 && notifying_ == 0; });
    entries_.clear();
}

}  // namespace railmr::backend
